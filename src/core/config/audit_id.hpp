#pragma once
#include <random>
#include <sstream>
#include <string>

namespace warden::core::config {

    // 16 hex digits prefixed with "audit-"
    inline std::string generate_audit_id() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "audit-";
        for (int i = 0; i < 16; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace warden::core::config
