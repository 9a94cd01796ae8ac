#include "safety/concurrency_slots.hpp"

namespace warden::safety {

SlotPermit::~SlotPermit() {
    release();
}

SlotPermit::SlotPermit(SlotPermit&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

SlotPermit& SlotPermit::operator=(SlotPermit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void SlotPermit::release() {
    if (owner_ != nullptr) {
        owner_->release_one();
        owner_ = nullptr;
    }
}

ConcurrencySlots::ConcurrencySlots(const std::size_t capacity) : capacity_(capacity) {}

SlotPermit ConcurrencySlots::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= capacity_) {
        return SlotPermit();
    }
    ++active_;
    return SlotPermit(this);
}

std::size_t ConcurrencySlots::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t ConcurrencySlots::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void ConcurrencySlots::set_capacity(const std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
}

void ConcurrencySlots::release_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
}

}  // namespace warden::safety
