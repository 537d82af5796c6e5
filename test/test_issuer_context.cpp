#include <doctest/doctest.h>

#include "issuance_test_helpers.hpp"

#include <slotca/cert/certificate.hpp>
#include <slotca/cert/issuer_context.hpp>

using namespace slotca::cert;
using namespace issuance_test;

TEST_SUITE("cert/issuer") {
    TEST_CASE("issuer with a subject key identifier") {
        const Bytes ski{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF, 0x00, 0x11, 0x22, 0x33,
                        0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD};
        auto issuer_der = build_issuer_certificate("CN=Slot Root, O=Example", ec_p256_spki(0x30), ski);

        auto certificate = Certificate::parse(issuer_der);
        REQUIRE(certificate.success);
        CHECK(certificate.value.version() == 3);
        CHECK(certificate.value.der() == issuer_der);
        CHECK(certificate.value.count_extensions(ExtensionId::SubjectKeyIdentifier) == 1);

        auto context = IssuerContext::from_certificate(issuer_der);
        REQUIRE(context.success);
        CHECK(context.value.subject.to_string() == "CN=Slot Root, O=Example");
        REQUIRE(context.value.subject_key_identifier.has_value());
        CHECK(*context.value.subject_key_identifier == ski);
        CHECK(context.value.serial_number == Bytes{0x0A, 0x0B});
        CHECK(context.value.public_key.algorithm == KeyAlgorithm::Ecdsa);
    }

    TEST_CASE("issuer without a subject key identifier") {
        auto issuer_der = build_issuer_certificate("CN=Legacy Root", rsa_spki(), std::nullopt, Bytes{0x01});
        auto context = IssuerContext::from_certificate(issuer_der);
        REQUIRE(context.success);
        CHECK_FALSE(context.value.subject_key_identifier.has_value());
        CHECK(context.value.serial_number == Bytes{0x01});
        CHECK(context.value.public_key.key_size_bits == 2048);
    }

    TEST_CASE("certificate parse failures") {
        CHECK_FALSE(IssuerContext::from_certificate(Bytes{}).success);

        auto issuer_der = build_issuer_certificate("CN=Root", ec_p256_spki(), std::nullopt);
        auto extra = issuer_der;
        extra.push_back(0x00);
        CHECK_FALSE(Certificate::parse(extra).success);

        auto truncated = issuer_der;
        truncated.pop_back();
        CHECK_FALSE(IssuerContext::from_certificate(truncated).success);
    }

    TEST_CASE("fingerprint covers the whole certificate") {
        auto issuer_der = build_issuer_certificate("CN=Root", ec_p256_spki(), std::nullopt);
        auto certificate = Certificate::parse(issuer_der);
        REQUIRE(certificate.success);
        CHECK(certificate.value.fingerprint().size() == 32);
        CHECK(certificate.value.fingerprint_hex().size() == 64);
    }
}
