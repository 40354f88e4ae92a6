#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <sonde/authority/identity.hpp>
#include <sonde/common/status.hpp>

namespace boost::asio::ssl {
class context;
}

typedef struct x509_st X509;

namespace sonde::authority {
/** @brief Ephemeral certificate authority of a single run.
 *
 * Key and certificate only live in memory and die with the object. The server
 * context it creates trusts exactly this authority, so only workloads
 * dispatched in this run can submit results.
 */
class CertificateAuthority {
  public:
  ~CertificateAuthority();

  /// Returns nullptr if the key or the root certificate could not be made.
  static std::unique_ptr<CertificateAuthority> create(
    std::chrono::seconds validity);

  /** @brief Creates the TLS configuration of the result transport.
   *
   * The certificate is bound to the host part of advertiseAddress. Peers must
   * present a certificate signed by this authority.
   */
  sonde_status serverContext(const std::string& advertiseAddress,
                             std::unique_ptr<boost::asio::ssl::context>& ctx);

  sonde_status serverIdentity(const std::string& advertiseAddress,
                              CertificateIdentity& identity);

  sonde_status clientIdentity(const std::string& workloadName,
                              CertificateIdentity& identity);

  const std::string& caCertificatePem() const;

  std::chrono::seconds validity() const { return m_validity; }

  private:
  explicit CertificateAuthority(std::chrono::seconds validity);

  struct Internal;
  std::unique_ptr<Internal> m_internal;
  std::chrono::seconds m_validity;

  sonde_status init();
};

/// Returns the common name of the certificate subject.
std::optional<std::string>
SubjectCommonName(X509* cert);
}
