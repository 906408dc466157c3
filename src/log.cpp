#include "ecudiag/log.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace ecudiag {

void Logger::write(LogLevel level, const std::string& message) const {
  if (sink_) {
    sink_(level, message);
    return;
  }
  if (level == LogLevel::Warning || level == LogLevel::Error) {
    std::cerr << "[ecudiag] " << level_name(level) << ": " << message << "\n";
  }
}

const char* Logger::level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
  }
  return "unknown";
}

std::string hex_byte(uint8_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(value);
  return oss.str();
}

std::string hex_dump(const Bytes& data, size_t max_bytes) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');
  const size_t n = std::min(data.size(), max_bytes);
  for (size_t i = 0; i < n; ++i) {
    if (i) oss << ' ';
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  if (data.size() > max_bytes) {
    oss << " ... (" << std::dec << data.size() << " bytes)";
  }
  return oss.str();
}

} // namespace ecudiag
