#include "test_pki.hpp"
#include "vlc/datamodel/attested_clock.hpp"
#include "vlc/attestation/document.hpp"
#include "vlc/attestation/signing_attester.hpp"
#include "vlc/attestation/verifier.hpp"
#include "vlc/attestation/verify_policy.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/digest.hpp"
#include "vlc/core/server_time.hpp"
#include "vlc/error.hpp"
#include <ctime>
#include <iostream>

using namespace vlc;
using namespace vlc::datamodel;

namespace spb = vlc::core::protobuf;

namespace {

const uint64_t now = static_cast<uint64_t>(std::time(NULL));

const attestation::pcr_map_t measured = {
    {0, std::string(48, '\x11')},
    {1, std::string(48, '\x22')},
    {2, std::string(48, '\x33')}};

// builds an attested clock carrying an arbitrary document
attested_clock make_attested(const ordinary_clock & plain,
    const std::string & document)
{
    spb::AttestedClock pb_clock;
    plain.to_protobuf(*pb_clock.mutable_plain());
    pb_clock.set_document(document);
    return attested_clock::from_protobuf(pb_clock);
}

struct fixture
{
    test::test_pki pki;
    attestation::attester_ptr_t attester;
    attestation::verify_policy policy;

    fixture()
     :  pki(test::make_test_pki())
    {
        attester = std::make_shared<attestation::signing_attester>(
            pki.leaf_key_pem, pki.leaf_pem, std::vector<std::string>(),
            measured, "test-module", 60);

        policy = attestation::verify_policy(
            std::make_shared<attestation::verifier>(pki.anchor_pem),
            attestation::pcr_map_t{{0, measured.at(0)}, {2, measured.at(2)}});
    }

    attested_clock attest(const ordinary_clock & plain)
    {
        return make_attested(plain, attester->process_attestation(
            core::digest_bytes(plain.fingerprint())));
    }
};

template<typename Callable>
error::verify_errc expect_verify_error(Callable && callable,
    unsigned * pcr_index = NULL)
{
    try
    {
        callable();
    }
    catch(const error::verify_error & e)
    {
        if(pcr_index)
            *pcr_index = e.pcr_index();
        return e.get_code();
    }
    throw error::vlc_exception("test_failure", "expected a verify_error");
}

void test_from_genesis()
{
    attested_clock empty = attested_clock::from_genesis(ordinary_clock());
    VLC_ASSERT(empty.get_document().empty());

    attested_clock zeros = attested_clock::from_genesis(
        ordinary_clock{{1, 0}, {5, 0}});
    VLC_ASSERT(zeros.get_plain().size() == 2);

    bool thrown = false;
    try
    {
        attested_clock::from_genesis(ordinary_clock{{0, 1}});
    }
    catch(const error::not_genesis &)
    {
        thrown = true;
    }
    VLC_ASSERT(thrown);

    std::cout << "[PASS] test_from_genesis" << std::endl;
}

void test_genesis_verifies_without_document()
{
    attested_clock genesis = attested_clock::from_genesis(ordinary_clock());

    // no verifier is consulted
    VLC_ASSERT(!genesis.verify(attestation::verify_policy()));

    std::cout << "[PASS] test_genesis_verifies_without_document" << std::endl;
}

void test_verify_accepts_attested_update(fixture & f)
{
    ordinary_clock plain = {{1, 1}, {3, 2}};
    attested_clock clock = f.attest(plain);

    boost::optional<attestation::document> doc = clock.verify(f.policy);
    VLC_ASSERT(doc);
    VLC_ASSERT(doc->module_id == "test-module");
    VLC_ASSERT(doc->user_data == core::digest_bytes(plain.fingerprint()));
    VLC_ASSERT(doc->pcrs == measured);
    VLC_ASSERT(doc->not_after == doc->not_before + 60);

    std::cout << "[PASS] test_verify_accepts_attested_update" << std::endl;
}

void test_fingerprint_mismatch(fixture & f)
{
    attested_clock honest = f.attest(ordinary_clock{{1, 1}});

    // the document of {1:1}, claimed for {1:2}
    attested_clock forged = make_attested(
        ordinary_clock{{1, 2}}, honest.get_document());

    VLC_ASSERT(expect_verify_error([&]() { forged.verify(f.policy); }) ==
        error::FINGERPRINT_MISMATCH);

    std::cout << "[PASS] test_fingerprint_mismatch" << std::endl;
}

void test_pcr_mismatch(fixture & f)
{
    attested_clock clock = f.attest(ordinary_clock{{1, 1}});

    attestation::verify_policy wrong_value(f.policy.doc_verifier,
        attestation::pcr_map_t{{0, measured.at(0)}, {1, std::string(48, 'x')}});

    unsigned index = 0;
    VLC_ASSERT(expect_verify_error([&]() { clock.verify(wrong_value); },
        &index) == error::PCR_MISMATCH);
    VLC_ASSERT(index == 1);

    attestation::verify_policy missing(f.policy.doc_verifier,
        attestation::pcr_map_t{{8, measured.at(0)}});

    VLC_ASSERT(expect_verify_error([&]() { clock.verify(missing); },
        &index) == error::PCR_MISMATCH);
    VLC_ASSERT(index == 8);

    std::cout << "[PASS] test_pcr_mismatch" << std::endl;
}

void test_invalid_documents(fixture & f)
{
    ordinary_clock plain = {{2, 4}};
    attested_clock clock = f.attest(plain);

    // not a document at all
    attested_clock garbage = make_attested(plain, "not a document");
    VLC_ASSERT(expect_verify_error([&]() { garbage.verify(f.policy); }) ==
        error::STALE_OR_INVALID_DOCUMENT);

    // a genuine document, under another trust anchor
    test::test_pki other = test::make_test_pki("unrelated anchor");
    attestation::verify_policy other_anchor(
        std::make_shared<attestation::verifier>(other.anchor_pem),
        f.policy.expected_pcrs);

    VLC_ASSERT(expect_verify_error([&]() { clock.verify(other_anchor); }) ==
        error::STALE_OR_INVALID_DOCUMENT);

    // a tampered payload no longer matches its signature
    spb::AttestationDocument pb_doc;
    VLC_ASSERT(pb_doc.ParseFromString(clock.get_document()));

    spb::AttestationPayload pb_payload;
    VLC_ASSERT(pb_payload.ParseFromString(pb_doc.payload()));
    pb_payload.set_not_after(pb_payload.not_after() + 86400);
    VLC_ASSERT(pb_payload.SerializeToString(pb_doc.mutable_payload()));

    std::string tampered_bytes;
    VLC_ASSERT(pb_doc.SerializeToString(&tampered_bytes));

    attested_clock tampered = make_attested(plain, tampered_bytes);
    VLC_ASSERT(expect_verify_error([&]() { tampered.verify(f.policy); }) ==
        error::STALE_OR_INVALID_DOCUMENT);

    std::cout << "[PASS] test_invalid_documents" << std::endl;
}

void test_validity_window(fixture & f)
{
    attested_clock clock = f.attest(ordinary_clock{{1, 9}});

    core::server_time::set_time(now + 60);
    VLC_ASSERT(clock.verify(f.policy));

    core::server_time::set_time(now + 61);
    VLC_ASSERT(expect_verify_error([&]() { clock.verify(f.policy); }) ==
        error::STALE_OR_INVALID_DOCUMENT);

    core::server_time::set_time(now - 1);
    VLC_ASSERT(expect_verify_error([&]() { clock.verify(f.policy); }) ==
        error::STALE_OR_INVALID_DOCUMENT);

    core::server_time::set_time(now);

    std::cout << "[PASS] test_validity_window" << std::endl;
}

void test_order_ignores_document(fixture & f)
{
    ordinary_clock plain = {{1, 1}};

    attested_clock lhs = f.attest(plain);
    attested_clock rhs = make_attested(plain, "other");

    VLC_ASSERT(lhs == rhs);
    VLC_ASSERT(attested_clock::compare(lhs, rhs) == EQUAL);
    VLC_ASSERT(attested_clock::compare(lhs,
        attested_clock::from_genesis(ordinary_clock())) == MORE_RECENT);
    VLC_ASSERT(reduce(lhs) == 1);

    std::cout << "[PASS] test_order_ignores_document" << std::endl;
}

}

int main()
{
    try
    {
        // documents are issued & checked at a fixed time
        core::server_time::set_time(now);

        fixture f;

        test_from_genesis();
        test_genesis_verifies_without_document();
        test_verify_accepts_attested_update(f);
        test_fingerprint_mismatch(f);
        test_pcr_mismatch(f);
        test_invalid_documents(f);
        test_validity_window(f);
        test_order_ignores_document(f);
    }
    catch(const std::exception & e)
    {
        std::cerr << "[FAIL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
