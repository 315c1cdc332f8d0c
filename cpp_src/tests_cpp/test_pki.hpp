#ifndef VLC_TESTS_TEST_PKI_HPP
#define VLC_TESTS_TEST_PKI_HPP

#include "vlc/attestation/openssl_ptr.hpp"
#include "vlc/error.hpp"
#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <string>

namespace vlc {
namespace test {

// An in-process trust anchor, and a leaf certificate issued by it
struct test_pki
{
    std::string anchor_pem;
    std::string leaf_pem;
    std::string leaf_key_pem;
};

inline attestation::pkey_ptr_t generate_p256_key()
{
    attestation::pkey_ptr_t key(EVP_EC_gen("P-256"));
    VLC_ASSERT(key);
    return key;
}

inline void add_extension(X509 * cert, X509 * issuer, int nid, const char * value)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, NULL, NULL, 0);

    X509_EXTENSION * ext = X509V3_EXT_conf_nid(NULL, &ctx, nid, value);
    VLC_ASSERT(ext);
    VLC_ASSERT_OPENSSL(X509_add_ext(cert, ext, -1));
    X509_EXTENSION_free(ext);
}

// issuer == NULL self-signs with subject_key
inline attestation::x509_ptr_t issue_certificate(
    EVP_PKEY * subject_key, const char * common_name, long serial,
    X509 * issuer, EVP_PKEY * issuer_key, bool is_ca)
{
    attestation::x509_ptr_t cert(X509_new());
    VLC_ASSERT(cert);

    VLC_ASSERT_OPENSSL(X509_set_version(cert.get(), 2));
    VLC_ASSERT_OPENSSL(ASN1_INTEGER_set(
        X509_get_serialNumber(cert.get()), serial));

    VLC_ASSERT(X509_gmtime_adj(X509_getm_notBefore(cert.get()), -86400));
    VLC_ASSERT(X509_gmtime_adj(X509_getm_notAfter(cert.get()), 86400L * 365));

    VLC_ASSERT_OPENSSL(X509_set_pubkey(cert.get(), subject_key));

    X509_NAME * name = X509_get_subject_name(cert.get());
    VLC_ASSERT_OPENSSL(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char *>(common_name), -1, -1, 0));

    X509 * signer = issuer ? issuer : cert.get();
    VLC_ASSERT_OPENSSL(X509_set_issuer_name(cert.get(),
        X509_get_subject_name(signer)));

    if(is_ca)
    {
        add_extension(cert.get(), signer, NID_basic_constraints,
            "critical,CA:TRUE");
        add_extension(cert.get(), signer, NID_key_usage,
            "critical,keyCertSign,cRLSign");
    }
    else
    {
        add_extension(cert.get(), signer, NID_basic_constraints,
            "critical,CA:FALSE");
        add_extension(cert.get(), signer, NID_key_usage,
            "critical,digitalSignature");
    }

    VLC_ASSERT_OPENSSL(X509_sign(cert.get(),
        issuer ? issuer_key : subject_key, EVP_sha256()));
    return cert;
}

inline std::string bio_contents(BIO * bio)
{
    char * data = NULL;
    long length = BIO_get_mem_data(bio, &data);
    return std::string(data, length);
}

inline std::string to_pem(X509 * cert)
{
    attestation::bio_ptr_t bio(BIO_new(BIO_s_mem()));
    VLC_ASSERT_OPENSSL(PEM_write_bio_X509(bio.get(), cert));
    return bio_contents(bio.get());
}

inline std::string to_pem(EVP_PKEY * key)
{
    attestation::bio_ptr_t bio(BIO_new(BIO_s_mem()));
    VLC_ASSERT_OPENSSL(PEM_write_bio_PrivateKey(bio.get(), key,
        NULL, NULL, 0, NULL, NULL));
    return bio_contents(bio.get());
}

inline test_pki make_test_pki(const char * anchor_name = "vlc test anchor")
{
    attestation::pkey_ptr_t anchor_key = generate_p256_key();
    attestation::pkey_ptr_t leaf_key = generate_p256_key();

    attestation::x509_ptr_t anchor = issue_certificate(
        anchor_key.get(), anchor_name, 1, NULL, NULL, true);

    attestation::x509_ptr_t leaf = issue_certificate(
        leaf_key.get(), "vlc test module", 2,
        anchor.get(), anchor_key.get(), false);

    test_pki pki;
    pki.anchor_pem = to_pem(anchor.get());
    pki.leaf_pem = to_pem(leaf.get());
    pki.leaf_key_pem = to_pem(leaf_key.get());
    return pki;
}

}
}

#endif
