// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lanscan {
namespace util {

// Strict integer parsing for command-line and config input.
// Rejects empty strings, signs on unsigned values, whitespace and trailing characters.
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// Port number in [1, 65535]
std::optional<uint16_t> SafeParsePort(const std::string& str);

}  // namespace util
}  // namespace lanscan
