#include "certificate_authority.hpp"
#include "../commonc/address_util.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <sonde/common/log.hpp>

#include <vector>

namespace sonde::authority {
namespace {
struct EVP_PKEY_Deleter {
  void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
};
struct EVP_PKEY_CTX_Deleter {
  void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); }
};
struct X509_Deleter {
  void operator()(X509* c) const { X509_free(c); }
};
struct BIO_Deleter {
  void operator()(BIO* b) const { BIO_free(b); }
};
struct BIGNUM_Deleter {
  void operator()(BIGNUM* b) const { BN_free(b); }
};

using KeyPtr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using CertPtr = std::unique_ptr<X509, X509_Deleter>;

/// Tolerated clock skew between the run and its workloads.
constexpr long NotBeforeSkewSeconds = 60 * 5;

std::string
LastOpenSSLError() {
  unsigned long err = ERR_get_error();
  if(err == 0)
    return "unknown error";
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

KeyPtr
GenerateKey() {
  std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter> ctx(
    EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if(!ctx)
    return nullptr;
  if(EVP_PKEY_keygen_init(ctx.get()) <= 0)
    return nullptr;
  if(EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(),
                                            NID_X9_62_prime256v1) <= 0)
    return nullptr;

  EVP_PKEY* key = nullptr;
  if(EVP_PKEY_keygen(ctx.get(), &key) <= 0)
    return nullptr;
  return KeyPtr(key);
}

bool
SetRandomSerial(X509* cert) {
  std::unique_ptr<BIGNUM, BIGNUM_Deleter> bn(BN_new());
  if(!bn)
    return false;
  if(!BN_rand(bn.get(), 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY))
    return false;
  return BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert)) != nullptr;
}

bool
AddExtension(X509* issuer, X509* cert, int nid, const std::string& value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);

  X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
  if(!ext)
    return false;
  int ok = X509_add_ext(cert, ext, -1);
  X509_EXTENSION_free(ext);
  return ok == 1;
}

struct Extension {
  int nid;
  std::string value;
};

/// Issues a certificate for the subject key. A null issuer makes it
/// self-signed.
CertPtr
IssueCertificate(const std::string& commonName,
                 EVP_PKEY* subjectKey,
                 X509* issuerCert,
                 EVP_PKEY* issuerKey,
                 std::chrono::seconds validity,
                 const std::vector<Extension>& extensions) {
  CertPtr cert(X509_new());
  if(!cert)
    return nullptr;

  if(!X509_set_version(cert.get(), 2))
    return nullptr;
  if(!SetRandomSerial(cert.get()))
    return nullptr;
  if(!X509_gmtime_adj(X509_getm_notBefore(cert.get()), -NotBeforeSkewSeconds))
    return nullptr;
  if(!X509_gmtime_adj(X509_getm_notAfter(cert.get()), validity.count()))
    return nullptr;
  if(!X509_set_pubkey(cert.get(), subjectKey))
    return nullptr;

  X509_NAME* name = X509_get_subject_name(cert.get());
  if(!X509_NAME_add_entry_by_txt(name,
                                 "O",
                                 MBSTRING_UTF8,
                                 reinterpret_cast<const unsigned char*>("sonde"),
                                 -1,
                                 -1,
                                 0))
    return nullptr;
  if(!X509_NAME_add_entry_by_txt(
       name,
       "CN",
       MBSTRING_UTF8,
       reinterpret_cast<const unsigned char*>(commonName.c_str()),
       -1,
       -1,
       0))
    return nullptr;

  X509* issuer = issuerCert ? issuerCert : cert.get();
  if(!X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer)))
    return nullptr;

  for(const auto& e : extensions) {
    if(!AddExtension(issuer, cert.get(), e.nid, e.value))
      return nullptr;
  }

  if(X509_sign(cert.get(), issuerKey, EVP_sha256()) <= 0)
    return nullptr;

  return cert;
}

std::string
CertificateToPem(X509* cert) {
  std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new(BIO_s_mem()));
  if(!bio || !PEM_write_bio_X509(bio.get(), cert))
    return "";
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  return std::string(mem->data, mem->length);
}

std::string
KeyToPem(EVP_PKEY* key) {
  std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new(BIO_s_mem()));
  if(!bio ||
     !PEM_write_bio_PrivateKey(
       bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr))
    return "";
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  return std::string(mem->data, mem->length);
}
}

struct CertificateAuthority::Internal {
  KeyPtr key;
  CertPtr cert;
  std::string certPem;
};

CertificateAuthority::CertificateAuthority(std::chrono::seconds validity)
  : m_internal(std::make_unique<Internal>())
  , m_validity(validity) {}

CertificateAuthority::~CertificateAuthority() {
  sonde_log(SONDE_AUTHORITY, SONDE_DEBUG, "Destroy CertificateAuthority.");
}

std::unique_ptr<CertificateAuthority>
CertificateAuthority::create(std::chrono::seconds validity) {
  std::unique_ptr<CertificateAuthority> ca(new CertificateAuthority(validity));
  sonde_status s = ca->init();
  if(s != SONDE_OK) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not create certificate authority! Status: {}",
              sonde_status_to_str(s));
    return nullptr;
  }
  return ca;
}

sonde_status
CertificateAuthority::init() {
  m_internal->key = GenerateKey();
  if(!m_internal->key) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not generate CA key! Error: {}",
              LastOpenSSLError());
    return SONDE_KEY_GENERATION_ERROR;
  }

  m_internal->cert = IssueCertificate(
    "sonde-ca",
    m_internal->key.get(),
    nullptr,
    m_internal->key.get(),
    m_validity,
    { { NID_basic_constraints, "critical,CA:TRUE" },
      { NID_key_usage, "critical,keyCertSign,cRLSign,digitalSignature" },
      { NID_subject_key_identifier, "hash" } });
  if(!m_internal->cert) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not self-sign CA certificate! Error: {}",
              LastOpenSSLError());
    return SONDE_CERTIFICATE_ERROR;
  }

  m_internal->certPem = CertificateToPem(m_internal->cert.get());
  if(m_internal->certPem.empty())
    return SONDE_CERTIFICATE_ERROR;

  sonde_log(SONDE_AUTHORITY,
            SONDE_DEBUG,
            "Created ephemeral certificate authority valid for {}s.",
            m_validity.count());
  return SONDE_OK;
}

const std::string&
CertificateAuthority::caCertificatePem() const {
  return m_internal->certPem;
}

sonde_status
CertificateAuthority::serverIdentity(const std::string& advertiseAddress,
                                     CertificateIdentity& identity) {
  std::string host = SplitHost(advertiseAddress);

  std::string san;
  if(ParseIPAddress(host)) {
    san = "IP:" + host;
  } else if(IsValidHostName(host)) {
    san = "DNS:" + host;
  } else {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Cannot bind server certificate to advertise address \"{}\"!",
              advertiseAddress);
    return SONDE_INVALID_ADDRESS;
  }

  KeyPtr key = GenerateKey();
  if(!key) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not generate server key! Error: {}",
              LastOpenSSLError());
    return SONDE_KEY_GENERATION_ERROR;
  }

  CertPtr cert =
    IssueCertificate(host,
                     key.get(),
                     m_internal->cert.get(),
                     m_internal->key.get(),
                     m_validity,
                     { { NID_basic_constraints, "critical,CA:FALSE" },
                       { NID_key_usage, "critical,digitalSignature" },
                       { NID_ext_key_usage, "serverAuth" },
                       { NID_authority_key_identifier, "keyid:always" },
                       { NID_subject_alt_name, san } });
  if(!cert) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not sign server certificate for {}! Error: {}",
              host,
              LastOpenSSLError());
    return SONDE_CERTIFICATE_ERROR;
  }

  auto now = std::chrono::system_clock::now();
  identity.subject = host;
  identity.role = CertificateRole::Server;
  identity.notBefore = now - std::chrono::seconds(NotBeforeSkewSeconds);
  identity.notAfter = now + m_validity;
  identity.certificatePem = CertificateToPem(cert.get());
  identity.privateKeyPem = KeyToPem(key.get());
  identity.caCertificatePem = m_internal->certPem;

  if(identity.certificatePem.empty() || identity.privateKeyPem.empty())
    return SONDE_CERTIFICATE_ERROR;

  return SONDE_OK;
}

sonde_status
CertificateAuthority::serverContext(
  const std::string& advertiseAddress,
  std::unique_ptr<boost::asio::ssl::context>& ctx) {
  CertificateIdentity identity;
  sonde_status s = serverIdentity(advertiseAddress, identity);
  if(s != SONDE_OK)
    return s;

  namespace ssl = boost::asio::ssl;
  try {
    auto c = std::make_unique<ssl::context>(ssl::context::tls_server);
    c->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                   ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                   ssl::context::no_tlsv1_1);
    c->use_certificate_chain(boost::asio::buffer(identity.certificatePem));
    c->use_private_key(boost::asio::buffer(identity.privateKeyPem),
                       ssl::context::pem);

    // Only this authority is trusted, no default verify paths.
    c->add_certificate_authority(boost::asio::buffer(m_internal->certPem));
    SSL_CTX_add_client_CA(c->native_handle(), m_internal->cert.get());

    c->set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    ctx = std::move(c);
  } catch(const boost::system::system_error& e) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not set up server TLS context! Error: {}",
              e.what());
    return SONDE_CERTIFICATE_ERROR;
  }

  sonde_log(SONDE_AUTHORITY,
            SONDE_DEBUG,
            "Created server TLS context bound to {}.",
            identity.subject);
  return SONDE_OK;
}

sonde_status
CertificateAuthority::clientIdentity(const std::string& workloadName,
                                     CertificateIdentity& identity) {
  if(workloadName.empty()) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Cannot issue a client certificate without a workload name!");
    return SONDE_CERTIFICATE_ERROR;
  }

  KeyPtr key = GenerateKey();
  if(!key) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not generate key for workload {}! Error: {}",
              workloadName,
              LastOpenSSLError());
    return SONDE_KEY_GENERATION_ERROR;
  }

  CertPtr cert =
    IssueCertificate(workloadName,
                     key.get(),
                     m_internal->cert.get(),
                     m_internal->key.get(),
                     m_validity,
                     { { NID_basic_constraints, "critical,CA:FALSE" },
                       { NID_key_usage, "critical,digitalSignature" },
                       { NID_ext_key_usage, "clientAuth" },
                       { NID_authority_key_identifier, "keyid:always" } });
  if(!cert) {
    sonde_log(SONDE_AUTHORITY,
              SONDE_LOCALERROR,
              "Could not sign client certificate for workload {}! Error: {}",
              workloadName,
              LastOpenSSLError());
    return SONDE_CERTIFICATE_ERROR;
  }

  auto now = std::chrono::system_clock::now();
  identity.subject = workloadName;
  identity.role = CertificateRole::Client;
  identity.notBefore = now - std::chrono::seconds(NotBeforeSkewSeconds);
  identity.notAfter = now + m_validity;
  identity.certificatePem = CertificateToPem(cert.get());
  identity.privateKeyPem = KeyToPem(key.get());
  identity.caCertificatePem = m_internal->certPem;

  if(identity.certificatePem.empty() || identity.privateKeyPem.empty())
    return SONDE_CERTIFICATE_ERROR;

  sonde_log(SONDE_AUTHORITY,
            SONDE_TRACE,
            "Issued client certificate for workload {}.",
            workloadName);
  return SONDE_OK;
}

std::optional<std::string>
SubjectCommonName(X509* cert) {
  if(!cert)
    return std::nullopt;

  X509_NAME* name = X509_get_subject_name(cert);
  int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if(idx < 0)
    return std::nullopt;

  X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
  ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
  unsigned char* utf8 = nullptr;
  int len = ASN1_STRING_to_UTF8(&utf8, data);
  if(len < 0)
    return std::nullopt;

  std::string cn(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
  OPENSSL_free(utf8);
  return cn;
}
}
