#include "vlc/attestation/signing_attester.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/config.hpp"
#include "vlc/core/server_time.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"

namespace vlc {
namespace attestation {

namespace spb = vlc::core::protobuf;

signing_attester::signing_attester(
    const std::string & signing_key_pem,
    const std::string & certificate_pem,
    const std::vector<std::string> & intermediates_pem,
    pcr_map_t measured_pcrs,
    std::string module_id,
    uint64_t lifetime_s)
 :  _key(private_key_from_pem(signing_key_pem)),
    _pcrs(std::move(measured_pcrs)),
    _module_id(std::move(module_id)),
    _lifetime_s(lifetime_s)
{
    x509_ptr_t cert = x509_from_pem(certificate_pem);

    // the key must be the certificate's
    VLC_ASSERT_OPENSSL(X509_check_private_key(cert.get(), _key.get()));
    _certificate_der = x509_to_der(*cert);

    for(const std::string & pem : intermediates_pem)
    {
        _cabundle_der.push_back(x509_to_der(*x509_from_pem(pem)));
    }
    LOG_DBG("module " << _module_id << " with " << _pcrs.size() << " PCRs");
}

/* static */
attester_ptr_t signing_attester::from_config(const spb::WorkerConfig & config)
{
    std::vector<std::string> intermediates;
    for(const std::string & path : config.intermediate_path())
    {
        intermediates.push_back(core::read_file(path));
    }

    pcr_map_t pcrs;
    for(const spb::PcrValue & pcr : config.measured_pcr())
    {
        pcrs[pcr.index()] = pcr.value();
    }

    return std::make_shared<signing_attester>(
        core::read_file(config.signing_key_path()),
        core::read_file(config.certificate_path()),
        intermediates,
        std::move(pcrs),
        config.module_id(),
        config.document_lifetime_s());
}

std::string signing_attester::process_attestation(const std::string & user_data)
{
    uint64_t now = core::server_time::get_time();

    spb::AttestationPayload pb_payload;
    pb_payload.set_module_id(_module_id);
    pb_payload.set_timestamp(now);
    pb_payload.set_not_before(now);
    pb_payload.set_not_after(now + _lifetime_s);
    pb_payload.set_user_data(user_data);

    for(const auto & entry : _pcrs)
    {
        spb::PcrValue & pcr = *pb_payload.add_pcr();
        pcr.set_index(entry.first);
        pcr.set_value(entry.second);
    }

    spb::AttestationDocument pb_doc;
    VLC_ASSERT(pb_payload.SerializeToString(pb_doc.mutable_payload()));

    pb_doc.set_certificate(_certificate_der);
    for(const std::string & der : _cabundle_der)
    {
        pb_doc.add_cabundle(der);
    }

    // sign payload bytes
    md_ctx_ptr_t md_ctx(EVP_MD_CTX_new());
    VLC_ASSERT(md_ctx);

    const std::string & payload = pb_doc.payload();

    VLC_ASSERT_OPENSSL(EVP_DigestSignInit(md_ctx.get(), NULL,
        EVP_sha256(), NULL, _key.get()));

    size_t sig_length = 0;
    VLC_ASSERT_OPENSSL(EVP_DigestSign(md_ctx.get(), NULL, &sig_length,
        reinterpret_cast<const unsigned char *>(payload.data()),
        payload.size()));

    std::string & signature = *pb_doc.mutable_signature();
    signature.resize(sig_length);

    VLC_ASSERT_OPENSSL(EVP_DigestSign(md_ctx.get(),
        reinterpret_cast<unsigned char *>(&signature[0]), &sig_length,
        reinterpret_cast<const unsigned char *>(payload.data()),
        payload.size()));

    // ECDSA signatures may come in under the maximum length
    signature.resize(sig_length);

    std::string out;
    VLC_ASSERT(pb_doc.SerializeToString(&out));
    return out;
}

}
}
