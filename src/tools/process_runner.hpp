#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace warden::tools {

// Flip to true from any thread to kill the spawned process group.
using CancelToken = std::shared_ptr<std::atomic_bool>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic_bool>(false);
}

struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    std::uint64_t timeout_ms = 30000;
    // 0 disables the cap
    std::size_t max_output_bytes = 1024 * 1024;
    CancelToken cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool output_exceeded = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Spawns program with args directly (execvp, never through a shell) in its
// own process group. stdin is /dev/null. Timeout, cancellation and the output
// cap all SIGKILL the whole group, so descendants die with the child.
core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec);

}  // namespace warden::tools
