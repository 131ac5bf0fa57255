// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/connector.hpp"

namespace lanscan {
namespace network {

const char* ProbeStatusToString(ProbeStatus status) {
  switch (status) {
  case ProbeStatus::REACHABLE:
    return "reachable";
  case ProbeStatus::TIMEOUT:
    return "timeout";
  case ProbeStatus::REFUSED:
    return "refused";
  case ProbeStatus::UNREACHABLE:
    return "unreachable";
  case ProbeStatus::CANCELLED:
    return "cancelled";
  case ProbeStatus::ERROR:
    return "error";
  }
  return "unknown";
}

}  // namespace network
}  // namespace lanscan
