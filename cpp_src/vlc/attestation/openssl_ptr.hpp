#ifndef VLC_ATTESTATION_OPENSSL_PTR_HPP
#define VLC_ATTESTATION_OPENSSL_PTR_HPP

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <memory>
#include <string>

namespace vlc {
namespace attestation {

// unique_ptr ownership of OpenSSL handles

struct openssl_deleter
{
    void operator()(BIO * p) const { BIO_free(p); }
    void operator()(EVP_PKEY * p) const { EVP_PKEY_free(p); }
    void operator()(EVP_MD_CTX * p) const { EVP_MD_CTX_free(p); }
    void operator()(X509 * p) const { X509_free(p); }
    void operator()(X509_STORE * p) const { X509_STORE_free(p); }
    void operator()(X509_STORE_CTX * p) const { X509_STORE_CTX_free(p); }
    void operator()(STACK_OF(X509) * p) const { sk_X509_pop_free(p, X509_free); }
};

typedef std::unique_ptr<BIO, openssl_deleter> bio_ptr_t;
typedef std::unique_ptr<EVP_PKEY, openssl_deleter> pkey_ptr_t;
typedef std::unique_ptr<EVP_MD_CTX, openssl_deleter> md_ctx_ptr_t;
typedef std::unique_ptr<X509, openssl_deleter> x509_ptr_t;
typedef std::unique_ptr<X509_STORE, openssl_deleter> x509_store_ptr_t;
typedef std::unique_ptr<X509_STORE_CTX, openssl_deleter> x509_store_ctx_ptr_t;
typedef std::unique_ptr<STACK_OF(X509), openssl_deleter> x509_stack_ptr_t;

// PEM & DER conversions; each throws error::vlc_exception on failure

x509_ptr_t x509_from_pem(const std::string & pem);

x509_ptr_t x509_from_der(const std::string & der);

std::string x509_to_der(const X509 &);

pkey_ptr_t private_key_from_pem(const std::string & pem);

}
}

#endif
