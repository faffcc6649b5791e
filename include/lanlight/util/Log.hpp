// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace lanlight
{
namespace util
{

// Concept: Log
// Requirements:
//  - copyable
//  - selectors for debug, info, warning, and error streams
//  - channel function that provides new log object tagged with the
//    given channel name
//
// Debug streams carry per-attempt diagnostics and are expected to be
// silent unless verbose output was requested.


// Null object for the Log concept
struct NullLog
{
  template <typename T>
  friend const NullLog& operator<<(const NullLog& log, const T&)
  {
    return log;
  }

  friend const NullLog& debug(const NullLog& log)
  {
    return log;
  }

  friend const NullLog& info(const NullLog& log)
  {
    return log;
  }

  friend const NullLog& warning(const NullLog& log)
  {
    return log;
  }

  friend const NullLog& error(const NullLog& log)
  {
    return log;
  }

  friend NullLog channel(const NullLog&, const std::string&)
  {
    return {};
  }
};

// std streams-based log
struct StdLog
{
  StdLog(std::string channelName = {}, const bool verbose = false)
    : mChannelName(std::move(channelName))
    , mVerbose(verbose)
  {
  }

  // Prepends the channel name and terminates the line when the
  // statement ends. A stream without a target swallows its input.
  struct StdLogStream
  {
    StdLogStream(std::ostream* pIoStream, const std::string& channelName)
      : mpIoStream(pIoStream)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "[" << channelName << "] ";
      }
    }

    StdLogStream(StdLogStream&& rhs)
      : mpIoStream(rhs.mpIoStream)
    {
      rhs.mpIoStream = nullptr;
    }

    ~StdLogStream()
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "\n";
      }
    }

    template <typename T>
    StdLogStream& operator<<(const T& rhs)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << rhs;
      }
      return *this;
    }

    std::ostream* mpIoStream;
  };

  friend StdLogStream debug(const StdLog& log)
  {
    return {log.mVerbose ? &std::clog : nullptr, log.mChannelName};
  }

  friend StdLogStream info(const StdLog& log)
  {
    return {&std::clog, log.mChannelName};
  }

  friend StdLogStream warning(const StdLog& log)
  {
    return {&std::clog, log.mChannelName};
  }

  friend StdLogStream error(const StdLog& log)
  {
    return {&std::cerr, log.mChannelName};
  }

  friend StdLog channel(const StdLog& log, const std::string& channelName)
  {
    auto compositeName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return {std::move(compositeName), log.mVerbose};
  }

  std::string mChannelName;
  bool mVerbose;
};

// Log adapter that adds timestamps
template <typename Log>
struct Timestamped
{
  Timestamped() = default;

  Timestamped(Log log)
    : mLog(std::move(log))
  {
  }

  Log mLog;

  friend decltype(debug(std::declval<Log>())) debug(const Timestamped& log)
  {
    auto&& stream = debug(log.mLog);
    log.logTimestamp(stream);
    return std::forward<decltype(stream)>(stream);
  }

  friend decltype(info(std::declval<Log>())) info(const Timestamped& log)
  {
    auto&& stream = info(log.mLog);
    log.logTimestamp(stream);
    return std::forward<decltype(stream)>(stream);
  }

  friend decltype(warning(std::declval<Log>())) warning(const Timestamped& log)
  {
    auto&& stream = warning(log.mLog);
    log.logTimestamp(stream);
    return std::forward<decltype(stream)>(stream);
  }

  friend decltype(error(std::declval<Log>())) error(const Timestamped& log)
  {
    auto&& stream = error(log.mLog);
    log.logTimestamp(stream);
    return std::forward<decltype(stream)>(stream);
  }

  friend Timestamped channel(const Timestamped& log, const std::string& channelName)
  {
    return {channel(log.mLog, channelName)};
  }

  template <typename Stream>
  void logTimestamp(Stream& stream) const
  {
    using namespace std::chrono;
    stream << "|"
           << duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()
           << "ms| ";
  }
};

} // namespace util
} // namespace lanlight
