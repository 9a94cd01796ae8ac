#pragma once

#include <cstddef>
#include <mutex>

namespace warden::safety {

class ConcurrencySlots;

// Holds one slot until destroyed. Move-only.
class SlotPermit {
public:
    SlotPermit() = default;
    ~SlotPermit();
    SlotPermit(SlotPermit&& other) noexcept;
    SlotPermit& operator=(SlotPermit&& other) noexcept;
    SlotPermit(const SlotPermit&) = delete;
    SlotPermit& operator=(const SlotPermit&) = delete;

    bool held() const { return owner_ != nullptr; }
    void release();

private:
    friend class ConcurrencySlots;
    explicit SlotPermit(ConcurrencySlots* owner) : owner_(owner) {}

    ConcurrencySlots* owner_ = nullptr;
};

// Non-blocking counting semaphore. Check and increment happen under one
// lock, so the ceiling cannot be overshot by racing callers.
class ConcurrencySlots {
public:
    explicit ConcurrencySlots(std::size_t capacity);

    // An empty permit (held() == false) means every slot is taken.
    SlotPermit try_acquire();

    std::size_t active() const;
    std::size_t capacity() const;
    // Shrinking never revokes permits already handed out.
    void set_capacity(std::size_t capacity);

private:
    friend class SlotPermit;
    void release_one();

    mutable std::mutex mutex_;
    std::size_t capacity_;
    std::size_t active_ = 0;
};

}  // namespace warden::safety
