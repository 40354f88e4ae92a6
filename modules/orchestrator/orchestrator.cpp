#include <sonde/orchestrator/orchestrator.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>

#include <boost/asio/ssl/context.hpp>

#include <sonde/aggregator/result_writer.hpp>
#include <sonde/common/log.hpp>
#include <sonde/common/result_queue.hpp>
#include <sonde/common/signal.hpp>
#include <sonde/common/thread_registry.hpp>

#include "../aggregator/aggregator.hpp"
#include "../annotator/annotation_loop.hpp"
#include "../annotator/status_annotator.hpp"
#include "../authority/certificate_authority.hpp"
#include "../commonc/address_util.hpp"
#include "../transport/result_transport.hpp"
#include "cleanup.hpp"

using std::chrono::steady_clock;

namespace sonde {
const char*
RunStateToStr(RunState state) {
  switch(state) {
    case RunState::Pending:
      return "pending";
    case RunState::SetupFailed:
      return "setup-failed";
    case RunState::Running:
      return "running";
    case RunState::GracefullyStopping:
      return "gracefully-stopping";
    case RunState::Completed:
      return "completed";
    case RunState::TimedOut:
      return "timed-out";
    case RunState::ServerFailed:
      return "server-failed";
  }
  return "!";
}

std::string
AdvertisedEndpoint(const std::string& advertiseAddress, uint16_t port) {
  if(advertiseAddress.size() > 1 && advertiseAddress.front() == '[' &&
     advertiseAddress.back() == ']')
    return fmt::format("{}:{}", advertiseAddress, port);
  if(SplitHost(advertiseAddress) != advertiseAddress)
    return advertiseAddress;
  if(advertiseAddress.find(':') != std::string::npos)
    return fmt::format("[{}]:{}", advertiseAddress, port);
  return fmt::format("{}:{}", advertiseAddress, port);
}

/// Everything living for the duration of one run. Members are declared in
/// teardown order reversed, the thread registry is destroyed first.
struct Orchestrator::RunScope {
  steady_clock::time_point begin = steady_clock::now();

  Nodes nodes;
  ExpectedResults expected;
  std::vector<ExpectedResults> expectedPerWorkload;

  std::unique_ptr<authority::CertificateAuthority> ca;
  std::unique_ptr<boost::asio::ssl::context> serverContext;
  std::vector<CertificateIdentity> identities;

  std::optional<ResultQueue> queue;
  std::optional<aggregator::Aggregator> aggregator;
  std::optional<annotator::StatusAnnotator> annotator;
  std::optional<annotator::AnnotationLoop> annotationLoop;
  std::optional<transport::ResultTransport> transport;

  Signal stopWatcher;
  Signal stopMonitors;

  // Termination events, guarded by eventMutex.
  std::mutex eventMutex;
  std::condition_variable eventNotifier;
  bool completed = false;
  bool transportTerminated = false;
  sonde_status transportStatus = SONDE_OK;

  bool cleanupRan = false;

  std::optional<annotator::FinalAnnotationGuard> finalAnnotation;
  ThreadRegistry registry;

  RunScope() { sonde_log_attach_thread_registry(&registry); }
  ~RunScope() { teardown(); }

  void teardown() {
    finalAnnotation.reset();
    if(transport)
      transport->close();
    stopWatcher.raise();
    stopMonitors.raise();
    if(queue)
      queue->close();
    registry.requestStop();
    registry.waitForExit();
  }
};

Orchestrator::Orchestrator(RunConfig config,
                           ClusterClient& client,
                           Workloads workloads,
                           ResultWriter* writer)
  : m_config(std::move(config))
  , m_client(client)
  , m_workloads(std::move(workloads))
  , m_writer(writer) {}

Orchestrator::~Orchestrator() {
  sonde_log(SONDE_ORCHESTRATOR, SONDE_DEBUG, "Destroy Orchestrator.");
}

sonde_status
Orchestrator::run() {
  m_report = RunReport();
  auto begin = steady_clock::now();

  if(m_workloads.empty()) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_INFO,
              "No workloads given, nothing to do.");
    m_report.state = RunState::Completed;
    return SONDE_OK;
  }

  sonde_status s = SONDE_OK;
  {
    RunScope scope;
    s = execute(scope);

    scope.teardown();
    m_transportPort = 0;

    if(m_config.cleanupOnExit && !scope.cleanupRan &&
       m_report.state != RunState::SetupFailed) {
      sonde_log(SONDE_ORCHESTRATOR, SONDE_INFO, "Cleaning up on exit.");
      Cleanup(m_client, m_workloads);
      m_report.exitCleanupRan = true;
    }

    m_report.graceCleanupRan = scope.cleanupRan;
    m_report.expected = scope.expected;
    if(scope.aggregator) {
      m_report.results = scope.aggregator->results();
      if(m_writer)
        finishWriter();
    }
  }

  m_report.status = s;
  m_report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
    steady_clock::now() - begin);

  sonde_log(SONDE_ORCHESTRATOR,
            s == SONDE_OK ? SONDE_INFO : SONDE_LOCALERROR,
            "Run ended in state {} with status {} after {}ms. {} of {} "
            "expected results received.",
            RunStateToStr(m_report.state),
            sonde_status_to_str(s),
            m_report.duration.count(),
            m_report.results.size(),
            m_report.expected.size());
  return s;
}

void
Orchestrator::finishWriter() {
  sonde_status s = SONDE_GENERIC_ERROR;
  try {
    s = m_writer->finish();
  } catch(const std::exception& e) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_LOCALERROR,
              "Exception while finishing result output: {}",
              e.what());
  }
  if(s != SONDE_OK) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_LOCALERROR,
              "Could not finish result output in {}! Status: {}",
              m_config.outputLocation,
              sonde_status_to_str(s));
  }
}

sonde_status
Orchestrator::execute(RunScope& scope) {
  sonde_status s = setup(scope);
  if(s != SONDE_OK) {
    m_report.state = RunState::SetupFailed;
    return s;
  }

  m_report.state = RunState::Running;
  dispatch(scope);
  return awaitTermination(scope);
}

sonde_status
Orchestrator::setup(RunScope& scope) {
  std::set<std::string> names;
  for(const auto& w : m_workloads) {
    if(!names.insert(w->name()).second) {
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_FATAL,
                "Workload {} is configured more than once!",
                w->name());
      return SONDE_DUPLICATE_WORKLOAD;
    }
  }

  sonde_status s = SONDE_NODE_LISTING_ERROR;
  try {
    s = m_client.listNodes(scope.nodes);
  } catch(const std::exception& e) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_FATAL,
              "Exception while listing nodes: {}",
              e.what());
  }
  if(s != SONDE_OK) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_FATAL,
              "Could not list cluster nodes! Status: {}",
              sonde_status_to_str(s));
    return SONDE_NODE_LISTING_ERROR;
  }

  for(const auto& w : m_workloads) {
    auto e = w->expectedResults(scope.nodes);
    scope.expected.insert(scope.expected.end(), e.begin(), e.end());
    scope.expectedPerWorkload.emplace_back(std::move(e));
  }

  sonde_log(SONDE_ORCHESTRATOR,
            SONDE_INFO,
            "Running {} workloads on {} nodes, expecting {} results.",
            m_workloads.size(),
            scope.nodes.size(),
            scope.expected.size());

  scope.ca =
    authority::CertificateAuthority::create(m_config.certificateValidity);
  if(!scope.ca) {
    return SONDE_CERTIFICATE_ERROR;
  }

  s = scope.ca->serverContext(m_config.advertiseAddress, scope.serverContext);
  if(s != SONDE_OK) {
    return s;
  }

  for(const auto& w : m_workloads) {
    CertificateIdentity identity;
    s = scope.ca->clientIdentity(w->name(), identity);
    if(s != SONDE_OK) {
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_FATAL,
                "Could not issue identity for workload {}! Status: {}",
                w->name(),
                sonde_status_to_str(s));
      return s;
    }
    scope.identities.emplace_back(std::move(identity));
  }

  scope.queue.emplace(std::max<std::size_t>(1, scope.expected.size()));
  scope.aggregator.emplace(
    m_config.outputLocation, scope.expected, m_writer);

  s = scope.registry.create(
    "watcher", [&scope](ThreadRegistry::Handle&) -> int {
      if(scope.aggregator->wait(scope.stopWatcher)) {
        {
          std::unique_lock lock(scope.eventMutex);
          scope.completed = true;
        }
        scope.eventNotifier.notify_all();
      }
      return SONDE_OK;
    });
  if(s != SONDE_OK) {
    return s;
  }

  scope.transport.emplace(std::move(scope.serverContext), [&scope](Result r) {
    return scope.aggregator->handleSubmission(std::move(r));
  });
  TransportTerminated onTerminated = [&scope](sonde_status status) {
    {
      std::unique_lock lock(scope.eventMutex);
      if(scope.transportTerminated)
        return;
      scope.transportTerminated = true;
      scope.transportStatus = status;
    }
    scope.eventNotifier.notify_all();
  };
  s = scope.transport->start(
    scope.registry, m_config.bindAddress, m_config.bindPort, onTerminated);
  if(s != SONDE_OK) {
    return s;
  }
  m_transportPort = scope.transport->port();
  if(m_transportObserver)
    m_transportObserver(*scope.transport, onTerminated);

  scope.annotator.emplace(
    scope.expected, m_config.ns, m_config.statusObject, m_client);
  scope.annotationLoop.emplace(
    m_config.timeline.annotationInterval,
    m_config.timeline.jitterFactor,
    [&scope]() {
      bool complete = scope.aggregator->isComplete();
      scope.annotator->annotate(scope.aggregator->results());
      return complete;
    },
    [&scope]() { scope.annotator->annotate(scope.aggregator->results()); });
  scope.finalAnnotation.emplace(*scope.annotationLoop);
  s = scope.annotationLoop->start(scope.registry);
  if(s != SONDE_OK) {
    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_LOCALWARNING,
              "Could not start annotation loop! Status: {}",
              sonde_status_to_str(s));
  }

  s = scope.registry.create("ingest", [&scope](ThreadRegistry::Handle&) {
    scope.aggregator->ingest(*scope.queue);
    return static_cast<int>(SONDE_OK);
  });
  return s;
}

void
Orchestrator::dispatch(RunScope& scope) {
  std::string endpoint =
    AdvertisedEndpoint(m_config.advertiseAddress, scope.transport->port());

  for(std::size_t i = 0; i < m_workloads.size(); ++i) {
    auto& w = m_workloads[i];

    sonde_status s = SONDE_DISPATCH_ERROR;
    std::string problem;
    try {
      s = w->run(m_client, scope.nodes, endpoint, scope.identities[i]);
      problem = sonde_status_to_str(s);
    } catch(const std::exception& e) {
      problem = e.what();
    }

    if(s != SONDE_OK) {
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_LOCALERROR,
                "Could not dispatch workload {}! Error: {}",
                w->name(),
                problem);
      for(const auto& slot : scope.expectedPerWorkload[i]) {
        sonde_status ps = scope.queue->push(MakeErrorResult(
          slot, fmt::format("Dispatch of {} failed: {}", w->name(), problem)));
        if(ps != SONDE_OK) {
          sonde_log(SONDE_ORCHESTRATOR,
                    SONDE_LOCALERROR,
                    "Could not queue error result for {}/{}! Status: {}",
                    slot.producer,
                    slot.locus,
                    sonde_status_to_str(ps));
        }
      }
      continue;
    }

    sonde_log(SONDE_ORCHESTRATOR,
              SONDE_INFO,
              "Dispatched workload {}, submitting to {}.",
              w->name(),
              endpoint);

    sonde_status ts = scope.registry.create(
      "monitor-" + w->name(), [this, &scope, w](ThreadRegistry::Handle&) {
        try {
          w->monitor(m_client, scope.nodes, *scope.queue, scope.stopMonitors);
        } catch(const std::exception& e) {
          sonde_log(SONDE_WORKLOAD,
                    SONDE_LOCALERROR,
                    "Exception while monitoring workload {}: {}",
                    w->name(),
                    e.what());
        }
        return static_cast<int>(SONDE_OK);
      });
    if(ts != SONDE_OK) {
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_LOCALERROR,
                "Could not start monitor of workload {}! Status: {}",
                w->name(),
                sonde_status_to_str(ts));
    }
  }
}

sonde_status
Orchestrator::awaitTermination(RunScope& scope) {
  const auto& timeline = m_config.timeline;
  const auto graceDeadline = scope.begin + timeline.graceDeadline();
  const auto hardDeadline = scope.begin + timeline.totalTimeout;
  bool graceHandled = false;

  std::unique_lock lock(scope.eventMutex);
  for(;;) {
    if(scope.completed) {
      m_report.state = RunState::Completed;
      return SONDE_OK;
    }

    if(scope.transportTerminated) {
      sonde_status s = scope.transportStatus;
      lock.unlock();
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_LOCALERROR,
                "Result transport terminated! Status: {}",
                sonde_status_to_str(s));
      scope.stopWatcher.raise();
      m_report.state = RunState::ServerFailed;
      return s == SONDE_OK ? SONDE_TRANSPORT_ERROR : s;
    }

    if(!timeline.hasDeadline()) {
      scope.eventNotifier.wait(lock);
      continue;
    }

    auto now = steady_clock::now();
    if(!graceHandled && now >= graceDeadline) {
      graceHandled = true;
      lock.unlock();
      m_report.state = RunState::GracefullyStopping;
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_INFO,
                "Grace deadline reached, cleaning up workloads.");
      Cleanup(m_client, m_workloads);
      scope.cleanupRan = true;
      lock.lock();
      continue;
    }

    if(now >= hardDeadline) {
      lock.unlock();
      sonde_log(SONDE_ORCHESTRATOR,
                SONDE_LOCALERROR,
                "Timed out after {}s waiting for {} results.",
                timeline.totalTimeout.count(),
                scope.aggregator->pendingCount());
      scope.transport->close();
      scope.stopWatcher.raise();
      m_report.state = RunState::TimedOut;
      return SONDE_TIMEOUT;
    }

    scope.eventNotifier.wait_until(lock,
                                   graceHandled ? hardDeadline : graceDeadline);
  }
}
}
