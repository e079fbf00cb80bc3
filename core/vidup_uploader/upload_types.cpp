// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace vidup {
namespace uploader {

ProcessingState parseProcessingState(const std::string& value) {
  std::string upper = value;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (upper == "PENDING") {
    return ProcessingState::kPending;
  }
  if (upper == "PROCESSING") {
    return ProcessingState::kProcessing;
  }
  if (upper == "READY") {
    return ProcessingState::kReady;
  }
  if (upper == "FAILED") {
    return ProcessingState::kFailed;
  }
  return ProcessingState::kUnknown;
}

const char* toString(ProcessingState state) {
  switch (state) {
    case ProcessingState::kPending:
      return "PENDING";
    case ProcessingState::kProcessing:
      return "PROCESSING";
    case ProcessingState::kReady:
      return "READY";
    case ProcessingState::kFailed:
      return "FAILED";
    case ProcessingState::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, ProcessingState state) {
  return os << toString(state);
}

const char* toString(SessionState state) {
  switch (state) {
    case SessionState::kUninitiated:
      return "UNINITIATED";
    case SessionState::kActive:
      return "ACTIVE";
    case SessionState::kCompleted:
      return "COMPLETED";
    case SessionState::kCancelled:
      return "CANCELLED";
    case SessionState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, SessionState state) {
  return os << toString(state);
}

std::string formatFileSize(uint64_t bytes) {
  static const char* const kUnits[] = {"Bytes", "KB", "MB", "GB"};
  constexpr int kMaxUnit = 3;

  if (bytes == 0) {
    return "0 Bytes";
  }

  int unit = 0;
  double value = static_cast<double>(bytes);
  while (value >= 1024.0 && unit < kMaxUnit) {
    value /= 1024.0;
    ++unit;
  }

  double rounded = std::round(value * 100.0) / 100.0;

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << rounded;
  std::string text = oss.str();
  // Drop trailing zeros and a dangling decimal point
  text.erase(text.find_last_not_of('0') + 1);
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text + " " + kUnits[unit];
}

}  // namespace uploader
}  // namespace vidup
