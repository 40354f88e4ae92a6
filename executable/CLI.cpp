#include "CLI.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/algorithm/string/split.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/program_options.hpp>
#include <unistd.h>

#include <sonde/common/log.hpp>

namespace po = boost::program_options;

namespace sonde {
bool
ParseWorkloadSpec(const std::string& str, WorkloadSpec& spec) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, str, [](char c) { return c == ':'; });
  if(parts.size() < 2 || parts.size() > 3 || parts[0].empty())
    return false;

  spec.name = parts[0];
  if(parts[1] == "cluster" || parts[1] == "global") {
    spec.scope = WorkloadScope::Cluster;
  } else if(parts[1] == "per-node" || parts[1] == "node") {
    spec.scope = WorkloadScope::PerNode;
  } else {
    return false;
  }

  if(parts.size() == 3) {
    if(parts[2].empty())
      return false;
    spec.kind = parts[2];
  }
  return true;
}

CLI::CLI() {
  std::string generatedLocalName =
    boost::asio::ip::host_name() + "_" + std::to_string(getpid());

  // clang-format off
  m_globalOptions.add_options()
    ("help", "produce help message for all available options")
    ("local-name,n", po::value<std::string>(&m_localName)->default_value(generatedLocalName)->value_name("string"), "Local name shown in log lines")
    ("trace,t", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= TRACE)")
    ("debug,d", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= DEBG)")
    ("info,i", po::bool_switch(&m_infoMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= INFO)")
    ;

  m_transportOptions.add_options()
    ("bind-address", po::value<std::string>(&m_config.bindAddress)->default_value(m_config.bindAddress)->value_name("string"), "IP address to accept results on")
    ("bind-port", po::value<uint16_t>(&m_config.bindPort)->default_value(m_config.bindPort)->value_name("int"), "TCP port to accept results on, 0 picks a free one")
    ("advertise-address", po::value<std::string>(&m_config.advertiseAddress)->default_value(m_config.advertiseAddress)->value_name("string"), "host[:port] workloads submit results to")
    ("certificate-validity", po::value<uint32_t>()->default_value(DefaultCertificateValiditySeconds)->value_name("int"), "Lifetime of the run certificates in seconds")
    ;

  m_orchestratorOptions.add_options()
    ("workload,w", po::value<std::vector<std::string>>()->value_name("name:scope[:kind]")->multitoken(), "Workload to dispatch, scope is cluster or per-node")
    ("node", po::value<std::vector<std::string>>(&m_nodes)->value_name("string")->multitoken(), "Name of a node taking part in the run")
    ("timeout", po::value<uint32_t>()->default_value(0)->value_name("int"), "Total timeout of the run in seconds, 0 waits forever")
    ("grace-period", po::value<uint32_t>()->default_value(DefaultGracePeriodSeconds)->value_name("int"), "Seconds before the timeout at which workloads are cleaned up")
    ("output,o", po::value<std::string>(&m_config.outputLocation)->default_value(m_config.outputLocation)->value_name("string"), "Directory receiving results")
    ("cleanup-on-exit", po::bool_switch(&m_config.cleanupOnExit)->default_value(false)->value_name("bool"), "Clean up workloads when the run ends")
    ;

  m_annotatorOptions.add_options()
    ("namespace", po::value<std::string>(&m_config.ns)->default_value(m_config.ns)->value_name("string"), "Namespace of the status object")
    ("status-object", po::value<std::string>(&m_config.statusObject)->default_value(m_config.statusObject)->value_name("string"), "Name of the status object")
    ("annotation-interval", po::value<uint32_t>()->default_value(DefaultAnnotationIntervalMS)->value_name("int"), "Milliseconds between status updates")
    ("jitter-factor", po::value<double>(&m_config.timeline.jitterFactor)->default_value(DefaultJitterFactor)->value_name("float"), "Random extra delay between status updates, relative to the interval")
    ("annotations-file", po::value<std::string>(&m_annotationsFile)->value_name("string"), "JSON file receiving annotations, defaults to <output>/annotations.json")
    ;
  // clang-format on
}

CLI::~CLI() {}

bool
CLI::parse(int argc, char* argv[], int& exitCode) {
  po::options_description options;
  options.add(m_globalOptions)
    .add(m_transportOptions)
    .add(m_orchestratorOptions)
    .add(m_annotatorOptions);

  po::positional_options_description positionalOptions;
  positionalOptions.add("workload", -1);

  try {
    po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positionalOptions)
                .run(),
              m_vm);
    po::notify(m_vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    exitCode = EXIT_FAILURE;
    return false;
  }

  if(m_vm.count("help")) {
    std::cout << m_globalOptions << m_transportOptions << m_orchestratorOptions
              << m_annotatorOptions << std::endl;
    exitCode = EXIT_SUCCESS;
    return false;
  }

  if(m_infoMode) {
    sonde_log_set_severity(SONDE_INFO);
  }
  if(m_debugMode) {
    sonde_log_set_severity(SONDE_DEBUG);
  }
  if(m_traceMode) {
    sonde_log_set_severity(SONDE_TRACE);
  }
  sonde_log_set_local_name(m_localName);

  m_config.certificateValidity =
    std::chrono::seconds(m_vm["certificate-validity"].as<uint32_t>());
  m_config.timeline.totalTimeout =
    std::chrono::seconds(m_vm["timeout"].as<uint32_t>());
  m_config.timeline.gracePeriod =
    std::chrono::seconds(m_vm["grace-period"].as<uint32_t>());
  m_config.timeline.annotationInterval =
    std::chrono::milliseconds(m_vm["annotation-interval"].as<uint32_t>());

  if(m_vm.count("workload")) {
    for(const auto& str : m_vm["workload"].as<std::vector<std::string>>()) {
      WorkloadSpec spec;
      if(!ParseWorkloadSpec(str, spec)) {
        sonde_log(SONDE_GENERAL,
                  SONDE_FATAL,
                  "Invalid workload \"{}\", expected name:scope[:kind]!",
                  str);
        exitCode = EXIT_FAILURE;
        return false;
      }
      m_workloads.emplace_back(std::move(spec));
    }
  }

  if(m_annotationsFile.empty()) {
    m_annotationsFile = m_config.outputLocation + "/annotations.json";
  }

  return true;
}
}
