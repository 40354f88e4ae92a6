#include <chrono>
#include <csignal>
#include <cstdlib>
#include <locale>

#include <boost/filesystem/operations.hpp>

#include <sonde/common/log.hpp>
#include <sonde/orchestrator/orchestrator.hpp>

#include "CLI.hpp"
#include "filesystem_result_writer.hpp"
#include "staged_workload.hpp"
#include "static_cluster_client.hpp"

using namespace sonde;

struct ProgramRuntimeHelper {
  ProgramRuntimeHelper() {}
  ~ProgramRuntimeHelper() {
    using namespace std::chrono;
    auto totalSeconds =
      duration_cast<duration<float>>(steady_clock::now() - start);
    sonde_log(SONDE_GENERAL,
              SONDE_DEBUG,
              "Wall-clock runtime: {}s",
              totalSeconds.count());
  }

  std::chrono::steady_clock::time_point start =
    std::chrono::steady_clock::now();
};

int
main(int argc, char* argv[]) {
  // Workaround for wonky locales.
  try {
    std::locale loc("");
  } catch(const std::exception& e) {
    setenv("LC_ALL", "C", 1);
  }

  ProgramRuntimeHelper runtimeHelper;

  if(sonde_log_init() != SONDE_OK) {
    return EXIT_FAILURE;
  }

  CLI cli;
  int exitCode = EXIT_SUCCESS;
  if(!cli.parse(argc, argv, exitCode)) {
    return exitCode;
  }

  // Peers dropping connections must not end the process.
  signal(SIGPIPE, SIG_IGN);

  const RunConfig& config = cli.runConfig();

  boost::system::error_code ec;
  boost::filesystem::create_directories(config.outputLocation, ec);
  if(ec) {
    sonde_log(SONDE_GENERAL,
              SONDE_FATAL,
              "Cannot create output directory \"{}\"! Error: {}",
              config.outputLocation,
              ec.message());
    return EXIT_FAILURE;
  }

  StaticClusterClient client(cli.nodes(), cli.annotationsFile());
  FilesystemResultWriter writer(config.outputLocation);

  Workloads workloads;
  boost::filesystem::path stagingRoot =
    boost::filesystem::path(config.outputLocation) / "workloads";
  for(const auto& spec : cli.workloads()) {
    workloads.emplace_back(std::make_shared<StagedWorkload>(spec, stagingRoot));
  }

  Orchestrator orchestrator(config, client, workloads, &writer);
  sonde_status s = orchestrator.run();

  const RunReport& report = orchestrator.report();
  sonde_log(SONDE_GENERAL,
            SONDE_INFO,
            "Run {}: {} of {} results, results in {}.",
            RunStateToStr(report.state),
            report.results.size(),
            report.expected.size(),
            config.outputLocation);

  return s == SONDE_OK ? EXIT_SUCCESS : EXIT_FAILURE;
}
