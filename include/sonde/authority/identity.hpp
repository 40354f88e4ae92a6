#ifndef SONDE_AUTHORITY_IDENTITY_HPP
#define SONDE_AUTHORITY_IDENTITY_HPP

#include <chrono>
#include <string>

namespace sonde {
enum class CertificateRole { Server, Client };

/** @brief Certificate and key issued by the ephemeral authority of one run.
 *
 * Only lives in memory. Everything is PEM encoded, so it can be handed to a
 * workload as-is.
 */
struct CertificateIdentity {
  std::string subject;
  CertificateRole role = CertificateRole::Client;
  std::chrono::system_clock::time_point notBefore;
  std::chrono::system_clock::time_point notAfter;

  std::string certificatePem;
  std::string privateKeyPem;
  std::string caCertificatePem;
};
}

#endif
