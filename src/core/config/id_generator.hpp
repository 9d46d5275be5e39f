#pragma once
#include <string>
#include <random>
#include <sstream>

namespace strand::core::config {

    // Generates "<prefix>-" followed by 12 random hex characters,
    // e.g. "thread-3fa09c1b2d4e".
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace strand::core::config
