#ifndef ECUDIAG_LOG_HPP
#define ECUDIAG_LOG_HPP

/**
 * @file log.hpp
 * @brief Diagnostic event logging
 *
 * Each Client owns a Logger. Lines go to the sink from ClientConfig; without
 * one, warnings and errors are written to std::cerr and the rest is dropped.
 */

#include "ecudiag/uds.hpp"
#include <string>
#include <utility>

namespace ecudiag {

class Logger {
public:
  explicit Logger(LogSink sink = nullptr) : sink_(std::move(sink)) {}

  void set_sink(LogSink sink) { sink_ = std::move(sink); }

  void debug(const std::string& message) const { write(LogLevel::Debug, message); }
  void info(const std::string& message) const { write(LogLevel::Info, message); }
  void warn(const std::string& message) const { write(LogLevel::Warning, message); }
  void error(const std::string& message) const { write(LogLevel::Error, message); }

  void write(LogLevel level, const std::string& message) const;

  static const char* level_name(LogLevel level);

private:
  LogSink sink_;
};

/// "0x22" style formatting used throughout log lines.
std::string hex_byte(uint8_t value);

/// "22 F1 90" style dump, truncated after @p max_bytes.
std::string hex_dump(const Bytes& data, size_t max_bytes = 16);

} // namespace ecudiag

#endif // ECUDIAG_LOG_HPP
