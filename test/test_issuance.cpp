#include <doctest/doctest.h>

#include <chrono>

#include "issuance_test_helpers.hpp"

#include <slotca/issuance.hpp>
#include <slotca/sign/digest_formatter.hpp>
#include <slotca/utils/sodium_utils.hpp>

using namespace issuance_test;
using slotca::CaConfig;
using slotca::ErrorCode;
using slotca::IssuanceConfig;
using slotca::Stage;
using slotca::sign::SigningKeyHandle;

namespace {

    const Bytes kIssuerSki = slotca::utils::from_hex("aabbccddeeff00112233445566778899aabbccdd");

    struct EcIssuer {
        Bytes certificate = build_issuer_certificate("CN=Slot Root, O=Example", ec_p256_spki(0x44), kIssuerSki);
        IssuerContext context = issuer_from(certificate);
        SigningKeyHandle handle = SigningKeyHandle::from_public_key(context.public_key, kSignatureSlot);
    };

    struct RsaIssuer {
        Bytes certificate = build_issuer_certificate("CN=RSA Root", rsa_spki(2048), std::nullopt, Bytes{0x7F});
        IssuerContext context = issuer_from(certificate);
        SigningKeyHandle handle = SigningKeyHandle::from_public_key(context.public_key, kSignatureSlot);
    };

    Certificate reparse(const Certificate &issued) {
        auto parsed = Certificate::parse(issued.der());
        REQUIRE(parsed.success);
        return parsed.value;
    }

    SigningRequest request_with(const std::vector<RawExtension> &extensions, const Bytes &spki = ec_p256_spki()) {
        auto parsed = parse_signing_request(build_csr("CN=device-01, O=Example", spki, extensions));
        REQUIRE(parsed.success);
        return parsed.value;
    }

} // namespace

TEST_SUITE("issuance") {
    TEST_CASE("leaf from an issuer with a key identifier") {
        EcIssuer ca;
        FakeSigner signer;
        auto csr = build_csr("CN=device-01, O=Example", ec_p256_spki(),
                             {key_usage_request(key_usage::DigitalSignature | key_usage::KeyEncipherment),
                              san_request("device-01.example")});

        auto issued = slotca::issue_certificate(csr, ca.certificate, IssuanceConfig{}, ca.handle, signer);
        REQUIRE(issued.success);
        auto certificate = reparse(issued.value);

        CHECK(certificate.subject().to_string() == "CN=device-01, O=Example");
        CHECK(certificate.issuer().der() == ca.context.subject.der());
        CHECK(certificate.validity().not_after - certificate.validity().not_before == std::chrono::hours(24 * 30));
        CHECK(certificate.signature_algorithm() ==
              slotca::sign::encode_algorithm_identifier(slotca::sign::Ecdsa{}, slotca::hash::Algorithm::SHA256));

        const auto *ku = certificate.find_extension(ExtensionId::KeyUsage);
        REQUIRE(ku != nullptr);
        CHECK(ku->critical);
        CHECK(decode_key_usage(ku->value) == key_usage::DigitalSignature);

        REQUIRE(certificate.count_extensions(ExtensionId::AuthorityKeyIdentifier) == 1);
        Bytes expected_aki{0x30, 0x16, 0x80, 0x14};
        expected_aki.insert(expected_aki.end(), kIssuerSki.begin(), kIssuerSki.end());
        CHECK(certificate.find_extension(ExtensionId::AuthorityKeyIdentifier)->value == expected_aki);

        CHECK(certificate.count_extensions(ExtensionId::AuthorityInfoAccess) == 0);
        CHECK(certificate.count_extensions(ExtensionId::CRLDistributionPoints) == 0);
        CHECK(certificate.count_extensions(ExtensionId::ExtendedKeyUsage) == 0);
        CHECK(certificate.count_extensions(ExtensionId::SubjectAltName) == 0);
        CHECK(certificate.extensions().size() == 2);

        CHECK(signer.calls == 1);
        CHECK(signer.last_input.size() == 32);
    }

    TEST_CASE("policy and linkage configuration") {
        EcIssuer ca;
        FakeSigner signer;
        IssuanceConfig config;
        config.linkage.authority_access_url = "http://pki.example/root.crt";
        config.linkage.crl_distribution_url = "http://pki.example/root.crl";
        config.validity_days = 7;

        auto request = request_with(
            {eku_request({oid::make(oid::kEkuServerAuth), oid::make(oid::kEkuCodeSigning),
                          oid::make(oid::kEkuDocumentSigning)}),
             key_usage_request(key_usage::KeyAgreement | key_usage::KeyCertSign)});

        auto issued = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
        REQUIRE(issued.success);
        auto certificate = reparse(issued.value);

        const auto &extensions = certificate.extensions();
        REQUIRE(extensions.size() == 5);
        CHECK(extensions[0].id == ExtensionId::KeyUsage);
        CHECK(extensions[1].id == ExtensionId::ExtendedKeyUsage);
        CHECK(extensions[2].id == ExtensionId::AuthorityKeyIdentifier);
        CHECK(extensions[3].id == ExtensionId::AuthorityInfoAccess);
        CHECK(extensions[4].id == ExtensionId::CRLDistributionPoints);

        CHECK(decode_key_usage(extensions[0].value) == key_usage::KeyAgreement);
        auto purposes = decode_extended_key_usage(extensions[1].value);
        REQUIRE(purposes.has_value());
        REQUIRE(purposes->size() == 2);
        CHECK((*purposes)[0] == oid::make(oid::kEkuCodeSigning));
        CHECK((*purposes)[1] == oid::make(oid::kEkuDocumentSigning));
        CHECK_FALSE(extensions[3].critical);
        CHECK_FALSE(extensions[4].critical);
        CHECK(certificate.validity().not_after - certificate.validity().not_before == std::chrono::hours(24 * 7));
    }

    TEST_CASE("issuer without a key identifier gets the name form") {
        RsaIssuer ca;
        FakeSigner signer(Bytes(256, 0x01));
        auto issued = slotca::issue_certificate(request_with({}), ca.context, IssuanceConfig{}, ca.handle, signer);
        REQUIRE(issued.success);
        auto certificate = reparse(issued.value);

        const auto *aki = certificate.find_extension(ExtensionId::AuthorityKeyIdentifier);
        REQUIRE(aki != nullptr);
        CHECK(aki->value[2] == 0xA1);
        CHECK(certificate.count_extensions(ExtensionId::KeyUsage) == 0);
        CHECK(certificate.extensions().size() == 1);
    }

    TEST_CASE("RSA issuers sign with PSS by default") {
        RsaIssuer ca;
        FakeSigner signer(Bytes(256, 0x01));
        auto request = request_with({});

        auto first = slotca::issue_certificate(request, ca.context, IssuanceConfig{}, ca.handle, signer);
        auto second = slotca::issue_certificate(request, ca.context, IssuanceConfig{}, ca.handle, signer);
        REQUIRE(first.success);
        REQUIRE(second.success);

        CHECK(first.value.serial_number() != second.value.serial_number());
        REQUIRE(signer.inputs.size() == 2);
        CHECK(signer.inputs[0].size() == 256);
        CHECK(signer.inputs[0].back() == 0xBC);
        CHECK(signer.inputs[0] != signer.inputs[1]);
        CHECK(first.value.signature_algorithm() ==
              slotca::sign::encode_algorithm_identifier(slotca::sign::RsaPss{}, slotca::hash::Algorithm::SHA256));
    }

    TEST_CASE("PKCS#1 padding and other digests") {
        RsaIssuer ca;
        FakeSigner signer(Bytes(256, 0x01));
        IssuanceConfig config;
        config.rsa_padding = slotca::sign::RsaPadding::Pkcs1;
        config.digest = "sha-384";

        auto issued = slotca::issue_certificate(request_with({}), ca.context, config, ca.handle, signer);
        REQUIRE(issued.success);

        auto expected = slotca::sign::DigestFormatter::format(ca.handle, slotca::sign::RsaPkcs1{},
                                                              slotca::hash::Algorithm::SHA384, issued.value.tbs_der());
        REQUIRE(expected.success);
        CHECK(signer.last_input == expected.data);
        CHECK(issued.value.signature_algorithm() ==
              slotca::sign::encode_algorithm_identifier(slotca::sign::RsaPkcs1{}, slotca::hash::Algorithm::SHA384));
    }

    TEST_CASE("configuration errors stop before the signer") {
        EcIssuer ca;
        FakeSigner signer;
        auto request = request_with({});
        IssuanceConfig config;

        SUBCASE("zero validity") {
            config.validity_days = 0;
            auto result = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }
        SUBCASE("validity past the representable range") {
            config.validity_days = 4000000;
            CHECK(config.validate()->code == ErrorCode::InvalidConfiguration);
            auto result = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }
        SUBCASE("unknown digest") {
            config.digest = "SHA1";
            auto result = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::UnsupportedDigest);
        }
        SUBCASE("empty URL") {
            config.linkage.crl_distribution_url = "";
            auto result = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }
        SUBCASE("misattached policy rule") {
            config.policy.set_rule(oid::make(oid::kSubjectAltName), KeyUsageMask{0x8000});
            auto result = slotca::issue_certificate(request, ca.context, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }
        SUBCASE("handle for another key") {
            auto wrong = SigningKeyHandle{KeyAlgorithm::Rsa, 2048, kSignatureSlot};
            auto result = slotca::issue_certificate(request, ca.context, config, wrong, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }
        SUBCASE("handle without an algorithm") {
            auto result = slotca::issue_certificate(request, ca.context, config, SigningKeyHandle{}, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::UnsupportedAlgorithm);
        }
        SUBCASE("malformed CSR") {
            auto result = slotca::issue_certificate(Bytes{0x30, 0x00}, ca.certificate, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidRequest);
        }
        SUBCASE("malformed issuer certificate") {
            auto csr = build_csr("CN=device-01", ec_p256_spki());
            auto result = slotca::issue_certificate(csr, Bytes{0x30, 0x00}, config, ca.handle, signer);
            CHECK_FALSE(result.success);
            CHECK(result.error.code == ErrorCode::InvalidConfiguration);
        }

        CHECK(signer.calls == 0);
    }

    TEST_CASE("device failures surface with their code") {
        EcIssuer ca;
        FakeSigner signer;
        signer.fail_with(ErrorCode::UserDeclined);

        auto result = slotca::issue_certificate(request_with({}), ca.context, IssuanceConfig{}, ca.handle, signer);
        CHECK_FALSE(result.success);
        CHECK(result.error.code == ErrorCode::UserDeclined);
        CHECK(result.error.stage == Stage::Signed);
        CHECK(signer.calls == 1);
    }

    TEST_CASE("self-signed CA") {
        const auto spki = rsa_spki(2048, 0x6B);
        const auto key = key_from_spki(spki);
        const auto handle = SigningKeyHandle::from_public_key(key, kSignatureSlot);
        const auto subject = dn_from_string("CN=Slot Root CA, O=Example");
        FakeSigner signer(Bytes(256, 0x02));

        auto created = slotca::create_self_signed_ca(subject, key, CaConfig{}, handle, signer);
        REQUIRE(created.success);
        auto ca = reparse(created.value);

        CHECK(ca.subject().der() == subject.der());
        CHECK(ca.issuer().der() == subject.der());
        CHECK(ca.validity().not_after - ca.validity().not_before == std::chrono::hours(24 * 365));
        CHECK(ca.signature_algorithm() ==
              slotca::sign::encode_algorithm_identifier(slotca::sign::RsaPss{}, slotca::hash::Algorithm::SHA256));

        const auto &extensions = ca.extensions();
        REQUIRE(extensions.size() == 4);
        CHECK(extensions[0].id == ExtensionId::KeyUsage);
        CHECK(extensions[0].critical);
        CHECK(decode_key_usage(extensions[0].value) ==
              (key_usage::KeyCertSign | key_usage::CRLSign | key_usage::DigitalSignature));
        CHECK(extensions[1].id == ExtensionId::AuthorityKeyIdentifier);
        CHECK(extensions[2].id == ExtensionId::BasicConstraints);
        CHECK(extensions[2].critical);
        CHECK(extensions[2].value == Bytes{0x30, 0x03, 0x01, 0x01, 0xFF});
        CHECK(extensions[3].id == ExtensionId::SubjectKeyIdentifier);
        CHECK_FALSE(extensions[3].critical);

        const auto ski = compute_subject_key_identifier(key);
        CHECK(ski.size() == 32);
        CHECK(decode_key_identifier(extensions[3].value) == ski);
        CHECK(extensions[1].value == encode_authority_key_identifier(ski));

        SUBCASE("the new CA can issue") {
            auto context = IssuerContext::from_certificate(ca);
            REQUIRE(context.success);
            REQUIRE(context.value.subject_key_identifier.has_value());
            CHECK(*context.value.subject_key_identifier == ski);

            auto leaf = slotca::issue_certificate(request_with({}), context.value, IssuanceConfig{}, handle, signer);
            REQUIRE(leaf.success);
            CHECK(leaf.value.issuer().der() == subject.der());
            CHECK(leaf.value.find_extension(ExtensionId::AuthorityKeyIdentifier)->value ==
                  encode_authority_key_identifier(ski));
        }

        SUBCASE("path length") {
            CaConfig config;
            config.path_length = 0;
            config.validity_days = 3650;
            auto constrained = slotca::create_self_signed_ca(subject, key, config, handle, signer);
            REQUIRE(constrained.success);
            const auto *bc = constrained.value.find_extension(ExtensionId::BasicConstraints);
            REQUIRE(bc != nullptr);
            CHECK(bc->value == Bytes{0x30, 0x06, 0x01, 0x01, 0xFF, 0x02, 0x01, 0x00});
        }

        SUBCASE("rejected inputs") {
            CHECK(slotca::create_self_signed_ca(DistinguishedName{}, key, CaConfig{}, handle, signer).error.code ==
                  ErrorCode::InvalidRequest);

            CaConfig zero;
            zero.validity_days = 0;
            CHECK(slotca::create_self_signed_ca(subject, key, zero, handle, signer).error.code ==
                  ErrorCode::InvalidConfiguration);

            CaConfig forever;
            forever.validity_days = 4000000;
            CHECK(forever.validate().has_value());
            CHECK(slotca::create_self_signed_ca(subject, key, forever, handle, signer).error.code ==
                  ErrorCode::InvalidConfiguration);

            auto ec_handle = SigningKeyHandle{KeyAlgorithm::Ecdsa, 256, kSignatureSlot};
            CHECK(slotca::create_self_signed_ca(subject, key, CaConfig{}, ec_handle, signer).error.code ==
                  ErrorCode::InvalidConfiguration);
        }
    }
}
