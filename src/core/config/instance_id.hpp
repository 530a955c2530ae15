#pragma once
#include <string>
#include <random>
#include <sstream>

namespace acptrace::core::config {

    // Generates a simple 8-character hex ID prefixed with "acp-".
    // Identifies one proxy process in logs and in the telemetry resource.
    inline std::string generate_instance_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "acp-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace acptrace::core::config
