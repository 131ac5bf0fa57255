// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace lanscan {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." + std::to_string(VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "lanscan v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Lanscan Developers\nDistributed under the MIT software license";
}

}  // namespace lanscan
