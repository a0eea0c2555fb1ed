#pragma once
#include <string>
#include <random>
#include <sstream>

namespace conductor::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "run-1f0a93c2"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_run_id() {
        return generate_id("run");
    }

    inline std::string generate_request_id() {
        return generate_id("req");
    }

} // namespace conductor::core::config
