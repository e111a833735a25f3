#ifndef __DW_TEST_CERTIFICATE__
#define __DW_TEST_CERTIFICATE__

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include "Headers.hpp"

namespace dw {
/**
 * A throwaway self-signed certificate for 127.0.0.1, written as cert.pem and
 * key.pem into a temporary directory. It serves as the daemon certificate,
 * the CA that signs it and the client certificate.
 */
class TestCertificate {
 public:
  TestCertificate() {
    string pattern = GetTempDirectory() + string("dockwire_tls_XXXXXXXX");
    directory = string(mkdtemp(&pattern[0]));
    certFile = directory + "/cert.pem";
    keyFile = directory + "/key.pem";
    generate();
  }

  ~TestCertificate() {
    std::error_code ec;
    fs::remove_all(directory, ec);
  }

  string directory;
  string certFile;
  string keyFile;

 protected:
  static void addExtension(X509* cert, X509V3_CTX* context, int nid,
                           const char* value) {
    X509_EXTENSION* extension = X509V3_EXT_conf_nid(NULL, context, nid, value);
    if (!extension) {
      STFATAL << "Could not build certificate extension " << value;
    }
    X509_add_ext(cert, extension, -1);
    X509_EXTENSION_free(extension);
  }

  void generate() {
    EVP_PKEY* key = NULL;
    EVP_PKEY_CTX* keyContext = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL);
    if (!keyContext || EVP_PKEY_keygen_init(keyContext) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(keyContext, 2048) <= 0 ||
        EVP_PKEY_keygen(keyContext, &key) <= 0) {
      STFATAL << "Could not generate a test key";
    }
    EVP_PKEY_CTX_free(keyContext);

    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert), 24 * 60 * 60);
    X509_set_pubkey(cert, key);
    X509_NAME* name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               (const unsigned char*)"127.0.0.1", -1, -1, 0);
    X509_set_issuer_name(cert, name);

    X509V3_CTX extensionContext;
    X509V3_set_ctx_nodb(&extensionContext);
    X509V3_set_ctx(&extensionContext, cert, cert, NULL, NULL, 0);
    addExtension(cert, &extensionContext, NID_basic_constraints,
                 "critical,CA:TRUE");
    addExtension(cert, &extensionContext, NID_subject_alt_name,
                 "IP:127.0.0.1");
    if (X509_sign(cert, key, EVP_sha256()) <= 0) {
      STFATAL << "Could not sign the test certificate";
    }

    FILE* certOut = fopen(certFile.c_str(), "w");
    FILE* keyOut = fopen(keyFile.c_str(), "w");
    if (!certOut || !keyOut || PEM_write_X509(certOut, cert) != 1 ||
        PEM_write_PrivateKey(keyOut, key, NULL, NULL, 0, NULL, NULL) != 1) {
      STFATAL << "Could not write the test certificate to " << directory;
    }
    fclose(certOut);
    fclose(keyOut);
    X509_free(cert);
    EVP_PKEY_free(key);
  }
};
}  // namespace dw

#endif  // __DW_TEST_CERTIFICATE__
