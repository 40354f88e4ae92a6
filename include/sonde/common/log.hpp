#ifndef SONDE_COMMON_LOG_HPP
#define SONDE_COMMON_LOG_HPP

#include "status.hpp"

#include <cstdint>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace sonde {
class ThreadRegistry;
}

enum sonde_log_severity {
  SONDE_TRACE,
  SONDE_DEBUG,
  SONDE_INFO,
  SONDE_LOCALWARNING,
  SONDE_LOCALERROR,
  SONDE_GLOBALWARNING,
  SONDE_GLOBALERROR,
  SONDE_FATAL,
  SONDE_SEVERITY_COUNT
};

enum sonde_log_channel {
  SONDE_GENERAL,
  SONDE_AUTHORITY,
  SONDE_TRANSPORT,
  SONDE_AGGREGATOR,
  SONDE_ANNOTATOR,
  SONDE_ORCHESTRATOR,
  SONDE_WORKLOAD,
  SONDE_CHANNEL_COUNT
};

sonde_status
sonde_log_init();

/// Tags the log lines of threads started by the registry with their id.
void
sonde_log_attach_thread_registry(sonde::ThreadRegistry* thread_registry);

void
sonde_log_set_severity(sonde_log_severity severity);

/// Name shown at the start of every log line.
void
sonde_log_set_local_name(const std::string& name);

const char*
sonde_log_severity_to_str(sonde_log_severity severity);

const char*
sonde_log_channel_to_str(sonde_log_channel channel);

bool
sonde_log_enabled(sonde_log_severity severity);

void
sonde_log(sonde_log_channel channel,
          sonde_log_severity severity,
          std::string_view msg);

template<typename... Args>
void
sonde_log(sonde_log_channel channel,
          sonde_log_severity severity,
          fmt::format_string<Args...> fmt,
          Args&&... args) {
  if(!sonde_log_enabled(severity))
    return;
  try {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    sonde_log(channel, severity, std::string_view(buf.data(), buf.size()));
  } catch(const fmt::format_error& e) {
    sonde_log(channel, severity, std::string_view(e.what()));
  }
}

inline std::ostream&
operator<<(std::ostream& o, sonde_log_severity severity) {
  return o << sonde_log_severity_to_str(severity);
}
inline std::ostream&
operator<<(std::ostream& o, sonde_log_channel channel) {
  return o << sonde_log_channel_to_str(channel);
}

#endif
