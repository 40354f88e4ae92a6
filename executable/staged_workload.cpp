#include "staged_workload.hpp"

#include <iterator>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <sonde/common/log.hpp>
#include <sonde/common/result_queue.hpp>
#include <sonde/common/signal.hpp>

namespace fs = boost::filesystem;

namespace sonde {
namespace {
bool
WriteFile(const fs::path& p, const std::string& content, fs::perms perms) {
  {
    fs::ofstream o(p, std::ios::out | std::ios::trunc);
    if(!o)
      return false;
    o << content;
    if(!o)
      return false;
  }
  boost::system::error_code ec;
  fs::permissions(p, perms, ec);
  return !ec;
}
}

StagedWorkload::StagedWorkload(WorkloadSpec spec,
                               fs::path stagingRoot,
                               std::chrono::milliseconds pollInterval)
  : m_spec(std::move(spec))
  , m_directory(stagingRoot / m_spec.name)
  , m_pollInterval(pollInterval) {}

StagedWorkload::~StagedWorkload() {}

ExpectedResults
StagedWorkload::expectedResults(const Nodes& nodes) const {
  return ExpectedResultsForScope(m_spec.scope, m_spec.name, m_spec.kind, nodes);
}

sonde_status
StagedWorkload::run(ClusterClient&,
                    const Nodes& nodes,
                    const std::string& advertiseAddress,
                    const CertificateIdentity& identity) {
  boost::system::error_code ec;
  fs::remove_all(m_directory, ec);
  fs::create_directories(m_directory, ec);
  if(ec) {
    sonde_log(SONDE_WORKLOAD,
              SONDE_LOCALERROR,
              "Cannot create staging directory {}! Error: {}",
              m_directory.string(),
              ec.message());
    return SONDE_IO_ERROR;
  }

  const auto ownerOnly = fs::owner_read | fs::owner_write;
  const auto readable = ownerOnly | fs::group_read | fs::others_read;

  std::string nodeList;
  for(const auto& n : nodes) {
    nodeList += n + "\n";
  }

  if(!WriteFile(m_directory / "tls.key", identity.privateKeyPem, ownerOnly) ||
     !WriteFile(m_directory / "tls.crt", identity.certificatePem, readable) ||
     !WriteFile(m_directory / "ca.crt", identity.caCertificatePem, readable) ||
     !WriteFile(m_directory / "endpoint", advertiseAddress + "\n", readable) ||
     !WriteFile(m_directory / "kind", m_spec.kind + "\n", readable) ||
     !WriteFile(m_directory / "scope",
                std::string(WorkloadScopeToStr(m_spec.scope)) + "\n",
                readable) ||
     !WriteFile(m_directory / "nodes", nodeList, readable)) {
    sonde_log(SONDE_WORKLOAD,
              SONDE_LOCALERROR,
              "Cannot stage workload {} in {}!",
              m_spec.name,
              m_directory.string());
    return SONDE_IO_ERROR;
  }

  sonde_log(SONDE_WORKLOAD,
            SONDE_INFO,
            "Staged {} workload {} in {}.",
            WorkloadScopeToStr(m_spec.scope),
            m_spec.name,
            m_directory.string());
  return SONDE_OK;
}

void
StagedWorkload::monitor(ClusterClient& client,
                        const Nodes& nodes,
                        ResultQueue& queue,
                        const Signal& stop) {
  (void)client;
  const fs::path errorFile = m_directory / "error";

  do {
    boost::system::error_code ec;
    if(!fs::exists(errorFile, ec))
      continue;

    std::string message;
    {
      fs::ifstream i(errorFile);
      message.assign(std::istreambuf_iterator<char>(i),
                     std::istreambuf_iterator<char>());
    }
    while(!message.empty() && (message.back() == '\n' || message.back() == '\r'))
      message.pop_back();
    if(message.empty())
      message = "workload reported a failure";

    sonde_log(SONDE_WORKLOAD,
              SONDE_LOCALWARNING,
              "Workload {} failed: {}",
              m_spec.name,
              message);

    for(const auto& slot : expectedResults(nodes)) {
      if(queue.push(MakeErrorResult(slot, message)) != SONDE_OK) {
        sonde_log(SONDE_WORKLOAD,
                  SONDE_DEBUG,
                  "Result queue closed while reporting failure of {}.",
                  m_spec.name);
        return;
      }
    }
    return;
  } while(!stop.waitFor(m_pollInterval));
}

sonde_status
StagedWorkload::cleanup(ClusterClient& client) {
  (void)client;
  boost::system::error_code ec;
  fs::remove_all(m_directory, ec);
  if(ec) {
    sonde_log(SONDE_WORKLOAD,
              SONDE_LOCALERROR,
              "Cannot remove staging directory {}! Error: {}",
              m_directory.string(),
              ec.message());
    return SONDE_IO_ERROR;
  }
  return SONDE_OK;
}
}
