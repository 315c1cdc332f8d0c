#include "vlc/attestation/verifier.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <ctime>

namespace vlc {
namespace attestation {

namespace spb = vlc::core::protobuf;

namespace {

void reject(const std::string & msg)
{
    throw error::verify_error(error::STALE_OR_INVALID_DOCUMENT, msg);
}

}

verifier::verifier(const std::string & trust_anchor_pem)
 :  _anchor(x509_from_pem(trust_anchor_pem))
{ }

document verifier::parse(const std::string & serialized, uint64_t now) const
{
    spb::AttestationDocument pb_doc;
    if(!pb_doc.ParseFromString(serialized))
    {
        reject("attestation document failed to parse");
    }

    x509_ptr_t leaf;
    x509_stack_ptr_t intermediates(sk_X509_new_null());
    VLC_ASSERT(intermediates);

    try
    {
        leaf = x509_from_der(pb_doc.certificate());

        for(const std::string & der : pb_doc.cabundle())
        {
            x509_ptr_t cert = x509_from_der(der);
            VLC_ASSERT_OPENSSL(sk_X509_push(intermediates.get(), cert.get()));
            cert.release();
        }
    }
    catch(const error::vlc_exception & e)
    {
        reject(e.msg);
    }

    verify_chain(*leaf, intermediates, now);

    // the payload is signed by the (now trusted) leaf key
    md_ctx_ptr_t md_ctx(EVP_MD_CTX_new());
    VLC_ASSERT(md_ctx);

    EVP_PKEY * leaf_key = X509_get0_pubkey(leaf.get());
    if(!leaf_key)
    {
        reject("leaf certificate has no usable public key: " +
            error::openssl_error_string());
    }

    const std::string & payload = pb_doc.payload();
    const std::string & signature = pb_doc.signature();

    if(EVP_DigestVerifyInit(md_ctx.get(), NULL,
            EVP_sha256(), NULL, leaf_key) != 1 ||
       EVP_DigestVerify(md_ctx.get(),
            reinterpret_cast<const unsigned char *>(signature.data()),
            signature.size(),
            reinterpret_cast<const unsigned char *>(payload.data()),
            payload.size()) != 1)
    {
        reject("bad document signature: " + error::openssl_error_string());
    }

    spb::AttestationPayload pb_payload;
    if(!pb_payload.ParseFromString(payload))
    {
        reject("attestation payload failed to parse");
    }

    if(now < pb_payload.not_before() || now > pb_payload.not_after())
    {
        reject("document is valid over [" +
            std::to_string(pb_payload.not_before()) + ", " +
            std::to_string(pb_payload.not_after()) + "], not at " +
            std::to_string(now));
    }

    document doc;
    doc.module_id = pb_payload.module_id();
    doc.timestamp = pb_payload.timestamp();
    doc.not_before = pb_payload.not_before();
    doc.not_after = pb_payload.not_after();
    doc.user_data = pb_payload.user_data();

    for(const spb::PcrValue & pcr : pb_payload.pcr())
    {
        if(!doc.pcrs.insert(pcr_map_t::value_type(
            pcr.index(), pcr.value())).second)
        {
            reject("PCR " + std::to_string(pcr.index()) + " is repeated");
        }
    }

    LOG_DBG("authenticated document of " << doc.module_id
        << " timestamped " << doc.timestamp);
    return doc;
}

void verifier::verify_chain(X509 & leaf,
    const x509_stack_ptr_t & intermediates, uint64_t now) const
{
    x509_store_ptr_t store(X509_STORE_new());
    x509_store_ctx_ptr_t store_ctx(X509_STORE_CTX_new());
    VLC_ASSERT(store && store_ctx);

    VLC_ASSERT_OPENSSL(X509_STORE_add_cert(store.get(), _anchor.get()));
    VLC_ASSERT_OPENSSL(X509_STORE_CTX_init(store_ctx.get(),
        store.get(), &leaf, intermediates.get()));

    X509_STORE_CTX_set_time(store_ctx.get(), 0, static_cast<time_t>(now));

    if(X509_verify_cert(store_ctx.get()) != 1)
    {
        int err = X509_STORE_CTX_get_error(store_ctx.get());

        // drop any queued detail; the verify result carries the reason
        error::openssl_error_string();

        reject(std::string("certificate chain rejected: ") +
            X509_verify_cert_error_string(err));
    }
}

}
}
