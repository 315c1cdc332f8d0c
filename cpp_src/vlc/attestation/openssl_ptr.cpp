#include "vlc/attestation/openssl_ptr.hpp"
#include "vlc/error.hpp"
#include <openssl/pem.h>

namespace vlc {
namespace attestation {

namespace {

bio_ptr_t memory_bio(const std::string & data)
{
    bio_ptr_t bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
    VLC_ASSERT(bio);
    return bio;
}

}

x509_ptr_t x509_from_pem(const std::string & pem)
{
    bio_ptr_t bio = memory_bio(pem);

    x509_ptr_t cert(PEM_read_bio_X509(bio.get(), NULL, NULL, NULL));
    if(!cert)
    {
        throw error::vlc_exception("openssl_failure",
            "invalid PEM certificate: " + error::openssl_error_string());
    }
    return cert;
}

x509_ptr_t x509_from_der(const std::string & der)
{
    const unsigned char * p =
        reinterpret_cast<const unsigned char *>(der.data());

    x509_ptr_t cert(d2i_X509(NULL, &p, static_cast<long>(der.size())));
    if(!cert)
    {
        throw error::vlc_exception("openssl_failure",
            "invalid DER certificate: " + error::openssl_error_string());
    }
    return cert;
}

std::string x509_to_der(const X509 & cert)
{
    int length = i2d_X509(&cert, NULL);
    VLC_ASSERT_OPENSSL(length);

    std::string der(length, '\0');
    unsigned char * p = reinterpret_cast<unsigned char *>(&der[0]);

    VLC_ASSERT_OPENSSL(i2d_X509(&cert, &p));
    return der;
}

pkey_ptr_t private_key_from_pem(const std::string & pem)
{
    bio_ptr_t bio = memory_bio(pem);

    pkey_ptr_t key(PEM_read_bio_PrivateKey(bio.get(), NULL, NULL, NULL));
    if(!key)
    {
        throw error::vlc_exception("openssl_failure",
            "invalid PEM private key: " + error::openssl_error_string());
    }
    return key;
}

}
}
