#include <catch2/catch.hpp>

#include <memory>

#include <boost/asio/ssl/context.hpp>

#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "certificate_authority.hpp"

using namespace sonde;
using sonde::authority::CertificateAuthority;
using sonde::authority::SubjectCommonName;

namespace {
struct X509Free {
  void operator()(X509* c) const { X509_free(c); }
};
using CertPtr = std::unique_ptr<X509, X509Free>;

CertPtr
ReadPem(const std::string& pem) {
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  return CertPtr(cert);
}

bool
IssuedBy(X509* cert, X509* ca) {
  X509_STORE* store = X509_STORE_new();
  X509_STORE_add_cert(store, ca);
  X509_STORE_CTX* ctx = X509_STORE_CTX_new();
  X509_STORE_CTX_init(ctx, store, cert, nullptr);
  bool ok = X509_verify_cert(ctx) == 1;
  X509_STORE_CTX_free(ctx);
  X509_STORE_free(store);
  return ok;
}

std::string
SubjectAltName(X509* cert) {
  auto* names = static_cast<GENERAL_NAMES*>(
    X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
  if(!names)
    return "";
  std::string result;
  if(sk_GENERAL_NAME_num(names) > 0) {
    GENERAL_NAME* name = sk_GENERAL_NAME_value(names, 0);
    if(name->type == GEN_DNS)
      result = "DNS";
    else if(name->type == GEN_IPADD)
      result = "IP";
  }
  GENERAL_NAMES_free(names);
  return result;
}
}

TEST_CASE("Client Identities Are Signed By The Run Authority",
          "[authority]") {
  auto ca = CertificateAuthority::create(std::chrono::hours(1));
  REQUIRE(ca);

  CertificateIdentity identity;
  REQUIRE(ca->clientIdentity("e2e", identity) == SONDE_OK);
  REQUIRE(identity.subject == "e2e");
  REQUIRE(identity.role == CertificateRole::Client);
  REQUIRE(identity.notBefore < identity.notAfter);
  REQUIRE(identity.caCertificatePem == ca->caCertificatePem());
  REQUIRE(!identity.privateKeyPem.empty());

  auto cert = ReadPem(identity.certificatePem);
  auto root = ReadPem(ca->caCertificatePem());
  REQUIRE(cert);
  REQUIRE(root);

  REQUIRE(SubjectCommonName(cert.get()) == std::optional<std::string>("e2e"));
  REQUIRE((X509_get_extended_key_usage(cert.get()) & XKU_SSL_CLIENT) != 0);
  REQUIRE(IssuedBy(cert.get(), root.get()));
  REQUIRE(X509_check_ca(root.get()) != 0);
}

TEST_CASE("Foreign Authorities Do Not Verify", "[authority]") {
  auto ca = CertificateAuthority::create(std::chrono::hours(1));
  auto other = CertificateAuthority::create(std::chrono::hours(1));
  REQUIRE(ca);
  REQUIRE(other);

  CertificateIdentity identity;
  REQUIRE(other->clientIdentity("e2e", identity) == SONDE_OK);

  auto cert = ReadPem(identity.certificatePem);
  auto root = ReadPem(ca->caCertificatePem());
  REQUIRE(!IssuedBy(cert.get(), root.get()));
}

TEST_CASE("Client Identities Need A Name", "[authority]") {
  auto ca = CertificateAuthority::create(std::chrono::hours(1));
  REQUIRE(ca);
  CertificateIdentity identity;
  REQUIRE(ca->clientIdentity("", identity) == SONDE_CERTIFICATE_ERROR);
}

TEST_CASE("Server Identity Is Bound To The Advertise Host", "[authority]") {
  auto ca = CertificateAuthority::create(std::chrono::hours(1));
  REQUIRE(ca);

  SECTION("IP address with port") {
    CertificateIdentity identity;
    REQUIRE(ca->serverIdentity("10.1.2.3:8080", identity) == SONDE_OK);
    REQUIRE(identity.subject == "10.1.2.3");
    REQUIRE(identity.role == CertificateRole::Server);
    auto cert = ReadPem(identity.certificatePem);
    REQUIRE(SubjectAltName(cert.get()) == "IP");
    REQUIRE(X509_check_ip_asc(cert.get(), "10.1.2.3", 0) == 1);
  }

  SECTION("Host name") {
    CertificateIdentity identity;
    REQUIRE(ca->serverIdentity("sonde-aggregator.sonde", identity) ==
            SONDE_OK);
    auto cert = ReadPem(identity.certificatePem);
    REQUIRE(SubjectAltName(cert.get()) == "DNS");
    REQUIRE(X509_check_host(
              cert.get(), "sonde-aggregator.sonde", 0, 0, nullptr) == 1);
  }

  SECTION("Invalid address") {
    CertificateIdentity identity;
    REQUIRE(ca->serverIdentity("not a host!", identity) ==
            SONDE_INVALID_ADDRESS);
    std::unique_ptr<boost::asio::ssl::context> ctx;
    REQUIRE(ca->serverContext("not a host!", ctx) == SONDE_INVALID_ADDRESS);
    REQUIRE(!ctx);
  }
}

TEST_CASE("Server Context Is Created", "[authority]") {
  auto ca = CertificateAuthority::create(std::chrono::hours(1));
  REQUIRE(ca);
  std::unique_ptr<boost::asio::ssl::context> ctx;
  REQUIRE(ca->serverContext("127.0.0.1", ctx) == SONDE_OK);
  REQUIRE(ctx);
}
