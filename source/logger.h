// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

/*
xpl is the logger used across motion_vis. It provides the XCHECK family through check.h, and
level-filtered stream macros:

#include "logger.h"
...
XPLINFO << "rendering " << log_dir;

Toggle source code filenames and line numbers:
mvis_xpl_include_dev_info = false;

A copy of everything logged can be mirrored into a text file, which the batch launcher uses to
leave a vis_log.txt next to each recording:
mvis::xpl::stdoutLogger.attachTextFileLog(save_dir + "/vis_log.txt");
*/

#pragma once

#include <atomic>
#include <string>
#include <mutex>
#include <ostream>
#include <iostream>
#include <sstream>
#include <variant>
#include <type_traits>
#include <fstream>
#include "check.h"

extern bool mvis_xpl_include_dev_info;

#define XPLDEBUG (mvis_xpl_include_dev_info ? (mvis::xpl::debug << __FILE__ << ":" << __LINE__ << "] ") : mvis::xpl::debug << "")
#define XPLINFO  (mvis_xpl_include_dev_info ? (mvis::xpl::info  << __FILE__ << ":" << __LINE__ << "] ") : mvis::xpl::info << "")
#define XPLWARN  (mvis_xpl_include_dev_info ? (mvis::xpl::warn  << __FILE__ << ":" << __LINE__ << "] ") : mvis::xpl::warn << "")
#define XPLERROR (mvis_xpl_include_dev_info ? (mvis::xpl::error << __FILE__ << ":" << __LINE__ << "] ") : mvis::xpl::error << "")

namespace mvis { namespace xpl {

namespace level {
struct XPL_ERROR {
  static constexpr const int value = 3;
  static constexpr const char* kTag = "E";
};

struct XPL_WARN {
  static constexpr const int value = 2;
  static constexpr const char* kTag = "W";
};

struct XPL_INFO {
  static constexpr const int value = 1;
  static constexpr const char* kTag = "I";
};

struct XPL_DEBUG {
  static constexpr const int value = 0;
  static constexpr const char* kTag = "D";
};
}  // namespace level

namespace detail {
using CoutType = std::basic_ostream<char, std::char_traits<char>>;
using StandardEndLine = CoutType& (*)(CoutType&);
}  // namespace detail

// A logger whose minimum level can be changed at runtime. Each message is assembled by a
// LevelLogger proxy and written under the lock in one piece, so lines from different worker
// threads never interleave.
class Logger {
 protected:
  std::mutex mutex;
  std::ostream& stream;
  std::ofstream log_file_stream;
  std::string log_file_path;
  std::atomic<int> min_level;

 public:
  template <typename L>
  Logger(std::ostream& stream, const L&) : stream(stream), min_level(L::value) {}

  template <typename NEW_LEVEL>
  void setLevel()
  {
    min_level = NEW_LEVEL::value;
  }

  template <typename L>
  bool enabled() const { return L::value >= min_level; }

  template <typename L>
  void writeLine(const std::string& line)
  {
    auto lk = std::lock_guard(mutex);
    if (L::value < min_level) return;
    stream << line << std::endl;
    if (log_file_stream.is_open()) log_file_stream << L::kTag << " " << line << std::endl;
  }

  void attachTextFileLog(const std::string& log_path) {
    auto lk = std::lock_guard(mutex);
    if (log_path == log_file_path && log_file_stream.is_open()) return; // already logging on this file
    if (log_file_stream.is_open()) log_file_stream.close();
    log_file_path = log_path;
    log_file_stream.open(log_file_path, std::ios::out | std::ios::app);
  }

  void stopTextFileLog() {
    auto lk = std::lock_guard(mutex);
    log_file_path = "";
    if (log_file_stream.is_open()) log_file_stream.close();
  }

  ~Logger() {
    if (log_file_stream.is_open()) log_file_stream.close();
  }
};

template <typename LOG_LEVEL>
class LevelLogger {
 protected:
  Logger& logger;

  // This avoids the glog(level) functional style API and simplifies the user interface.
  // The proxy owns the line being built and emits it when the full expression ends.
  class EOLProxy {
   public:
    friend class LevelLogger;
    Logger* logger = nullptr;
    std::ostringstream line;

    EOLProxy(Logger& l) : logger(&l) {}
    EOLProxy(EOLProxy&& rhs) : logger(rhs.logger), line(std::move(rhs.line)) { rhs.logger = nullptr; }

    template <typename T>
    EOLProxy operator<<(const T& t) &&
    {
      if (logger && logger->template enabled<LOG_LEVEL>()) line << t;
      return std::move(*this);
    }

    EOLProxy operator<<(detail::StandardEndLine manip) &&
    {
      if (logger && logger->template enabled<LOG_LEVEL>()) line << manip;
      return std::move(*this);
    }

    ~EOLProxy()
    {
      if (logger) {
        logger->template writeLine<LOG_LEVEL>(line.str());
      }
    }
  };

 public:
  LevelLogger(Logger& logger) : logger(logger) {}

  template <typename U>
  EOLProxy operator<<(const U& t)
  {
    return EOLProxy(logger) << t;
  }
};

extern Logger stdoutLogger;

extern LevelLogger<level::XPL_DEBUG> debug;
extern LevelLogger<level::XPL_INFO> info;
extern LevelLogger<level::XPL_ERROR> error;
extern LevelLogger<level::XPL_WARN> warn;

}}  // end namespace mvis::xpl
