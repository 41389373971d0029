#pragma once

#include <string>

namespace epm {

enum class ProbeResult {
    Up,
    Down
};

inline std::string to_string(ProbeResult result) {
    return result == ProbeResult::Up ? "UP" : "DOWN";
}

} // namespace epm
