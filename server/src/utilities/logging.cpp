// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "logging.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifdef CLUECAST_ENABLE_BOOST_STACKTRACE
#define BOOST_STACKTRACE_GNU_SOURCE_NOT_REQUIRED
#define BOOST_STACKTRACE_USE_ADDR2LINE
#include <boost/stacktrace.hpp>
#endif


static error_reporter_t errorReporter__;
static std::atomic<LogLevel> logLevel__{LogLevel::Debug};
static std::mutex outputMutex__;


const char* str(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warning: return "warning";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    default: return "?";
  }
}


LogLevel parseLogLevel(const char* value) {
  for (auto level : {LogLevel::Error, LogLevel::Warning, LogLevel::Info, LogLevel::Debug}) {
    if (std::strcmp(value, str(level)) == 0) {
      return level;
    }
  }
  throw std::invalid_argument(std::string("unknown log level ") + value);
}


void setLogLevel(LogLevel level) {
  logLevel__ = level;
}


LogLevel getLogLevel() {
  return logLevel__;
}


void setErrorReporter(error_reporter_t reporter) {
  errorReporter__ = reporter;
}


namespace {
  const char* stripPath(const char* path) {
    for (const char* i = path; *i != '\0'; ++i)
      if (*i == '/') {
        path = i + 1;
      }
    return path;
  }

}


std::string makeStack(const char* file, int line) {
#ifdef CLUECAST_ENABLE_BOOST_STACKTRACE
  std::ostringstream stack{};
  stack << stripPath(file) << ':' << line << '\n';
  stack << boost::stacktrace::stacktrace{};
  return stack.str();
#else
  return std::string(stripPath(file)) + ":" + std::to_string(line);
#endif
}


std::string makeString(const char* format, ...) {
  va_list args1;
  va_start(args1, format);
  va_list args2;
  va_copy(args2, args1);
  int length = std::vsnprintf(nullptr, 0, format, args1);
  va_end(args1);

  std::string result;
  if (length > 0) {
    std::vector<char> buffer(static_cast<std::size_t>(length) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args2);
    result.assign(buffer.data(), static_cast<std::size_t>(length));
  }
  va_end(args2);
  return result;
}


void log_error(const char* name, const char* message, const char* stack, LogLevel level) {
  log_print_(level, "%s: %s at %s", name, message, stack);
  if (errorReporter__) {
    errorReporter__(name, message, stack);
  }
}


void log_assert(const char* e, const char* file, int line) {
  std::string name = std::string("assert(") + e + ")";
  log_error(name.c_str(), e, makeStack(file, line).c_str(), LogLevel::Error);
}


void log_exception(const std::exception& e, const char* file, int line) {
  log_error("EXCEPTION", e.what(), makeStack(file, line).c_str(), LogLevel::Error);
}


void log_rejection(const char* e, const char* file, int line) {
  log_error("REJECT", e, makeStack(file, line).c_str(), LogLevel::Info);
}


void log_print_(LogLevel level, const char* format, ...) {
  if (level > logLevel__.load()) {
    return;
  }

  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  int millisecs = static_cast<int>(std::fmod(static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count()), 1000));
  char s[64];
  std::tm tm{};
  localtime_r(&t, &tm);
  std::strftime(s, 64, "%F %T", &tm);

  std::string f(format);
  if (!f.empty() && f[f.size() - 1] != '\n')
    f.push_back('\n');

  std::lock_guard lock{outputMutex__};
  fprintf(stdout, "%s.%.3d %-7s ", s, millisecs, str(level));
  va_list args;
  va_start(args, format);
  vfprintf(stdout, f.c_str(), args);
  fflush(stdout);
  va_end(args);
}


std::string ReasonString(const std::exception_ptr& reason) {
  if (!reason) {
    return "";
  }
  try {
    std::rethrow_exception(reason);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}
