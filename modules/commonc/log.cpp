#include <sonde/common/log.hpp>
#include <sonde/common/thread_registry.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>

using LoggerMT =
  boost::log::sources::severity_channel_logger_mt<sonde_log_severity,
                                                  sonde_log_channel>;

static LoggerMT global_logger(boost::log::keywords::channel = SONDE_GENERAL);
static std::atomic<sonde_log_severity> global_severity = SONDE_INFO;

using namespace boost::log;

BOOST_LOG_ATTRIBUTE_KEYWORD(sonde_logger_timestamp,
                            "TimeStamp",
                            boost::posix_time::ptime)

static void
log_new_thread_callback(sonde::ThreadRegistry::Handle& handle) {
  core::get()->add_thread_attribute(
    "ThreadID", attributes::constant<uint16_t>(handle.threadId));
}

void
sonde_log_attach_thread_registry(sonde::ThreadRegistry* thread_registry) {
  thread_registry->addStartingCallback(&log_new_thread_callback);
}

sonde_status
sonde_log_init() {
  static bool initialized = false;
  if(initialized)
    return SONDE_OK;

  try {
    add_common_attributes();
    core::get()->add_thread_attribute("ThreadID",
                                      attributes::constant<uint16_t>(0));

    auto sink = add_console_log(std::clog);
    sink->set_formatter(
      expressions::stream
      << "c ["
      << expressions::if_(expressions::has_attr<std::string>(
           "LocalName"))[expressions::stream
                         << expressions::attr<std::string>("LocalName")]
      << "] [" << sonde_logger_timestamp << "] ["
      << expressions::attr<sonde_log_severity>("Severity") << "] ["
      << expressions::attr<sonde_log_channel>("Channel") << " @ T"
      << expressions::attr<uint16_t>("ThreadID") << "] "
      << expressions::smessage);
  } catch(std::exception& e) {
    std::cerr << "> Exception during log setup! Message: " << e.what()
              << std::endl;
    return SONDE_GENERIC_ERROR;
  }

  if(std::getenv("SONDE_LOG_DEBUG")) {
    sonde_log_set_severity(SONDE_DEBUG);
  }
  if(std::getenv("SONDE_LOG_TRACE")) {
    sonde_log_set_severity(SONDE_TRACE);
  }

  initialized = true;
  return SONDE_OK;
}

void
sonde_log_set_severity(sonde_log_severity severity) {
  global_severity = severity;
}

void
sonde_log_set_local_name(const std::string& name) {
  if(!name.empty()) {
    global_logger.add_attribute("LocalName", attributes::make_constant(name));
  }
}

void
sonde_log(sonde_log_channel channel,
          sonde_log_severity severity,
          std::string_view msg) {
  if(sonde_log_enabled(severity)) {
    try {
      BOOST_LOG_CHANNEL_SEV(global_logger, channel, severity) << msg;
    } catch(std::exception& e) {
      std::cerr
        << "!! Could not print log entry because of exception! Message: "
        << e.what() << std::endl;
    }
  }
}

bool
sonde_log_enabled(sonde_log_severity severity) {
  return severity >= global_severity;
}

const char*
sonde_log_severity_to_str(sonde_log_severity severity) {
  switch(severity) {
    case SONDE_TRACE:
      return "TRCE";
    case SONDE_DEBUG:
      return "DEBG";
    case SONDE_INFO:
      return "INFO";
    case SONDE_LOCALWARNING:
      return "LWRN";
    case SONDE_LOCALERROR:
      return "LERR";
    case SONDE_GLOBALWARNING:
      return "GWRN";
    case SONDE_GLOBALERROR:
      return "GERR";
    case SONDE_FATAL:
      return "FTAL";

    case SONDE_SEVERITY_COUNT:
      break;
  }
  return "!!!!";
}

const char*
sonde_log_channel_to_str(sonde_log_channel channel) {
  switch(channel) {
    case SONDE_GENERAL:
      return "General";
    case SONDE_AUTHORITY:
      return "Authority";
    case SONDE_TRANSPORT:
      return "Transport";
    case SONDE_AGGREGATOR:
      return "Aggregator";
    case SONDE_ANNOTATOR:
      return "Annotator";
    case SONDE_ORCHESTRATOR:
      return "Orchestrator";
    case SONDE_WORKLOAD:
      return "Workload";
    case SONDE_CHANNEL_COUNT:
      break;
  }
  return "!";
}
