#pragma once

#include <string>
#include <vector>
#include "common_types.h"

using byte = u8;
using bytes = std::vector<byte>;

inline bytes& operator+=(bytes& left, const bytes& right) {
    left.insert(left.end(), right.begin(), right.end());
    return left;
}

inline bytes ToBytes(const std::string& str) {
    return bytes(str.begin(), str.end());
}

inline std::string ToString(const bytes& data) {
    return std::string(data.begin(), data.end());
}
