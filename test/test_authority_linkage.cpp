#include <doctest/doctest.h>

#include <algorithm>
#include <string>

#include "issuance_test_helpers.hpp"

#include <slotca/cert/authority_linkage.hpp>
#include <slotca/utils/sodium_utils.hpp>

using namespace issuance_test;

namespace {

    const Bytes kIssuerSki = slotca::utils::from_hex("aabbccddeeff00112233445566778899aabbccdd");

    Bytes ascii(const std::string &text) { return Bytes(text.begin(), text.end()); }

} // namespace

TEST_SUITE("cert/authority_linkage") {
    TEST_CASE("AKI uses the issuer key identifier when present") {
        auto issuer = issuer_from(build_issuer_certificate("CN=Slot Root", ec_p256_spki(), kIssuerSki));
        auto linkage = build_authority_linkage(issuer, LinkageConfig{});

        CHECK(linkage.authority_key_identifier.id == ExtensionId::AuthorityKeyIdentifier);
        CHECK_FALSE(linkage.authority_key_identifier.critical);

        Bytes expected{0x30, 0x16, 0x80, 0x14};
        expected.insert(expected.end(), kIssuerSki.begin(), kIssuerSki.end());
        CHECK(linkage.authority_key_identifier.value == expected);

        CHECK_FALSE(linkage.authority_info_access.has_value());
        CHECK_FALSE(linkage.crl_distribution_points.has_value());
        CHECK(linkage.to_list().size() == 1);
    }

    TEST_CASE("AKI falls back to issuer name and serial") {
        auto issuer_der = build_issuer_certificate("CN=Legacy Root", ec_p256_spki(), std::nullopt, Bytes{0x01, 0x02});
        auto issuer = issuer_from(issuer_der);
        auto value = encode_authority_key_identifier(issuer);

        auto outer = parse_sequence(value);
        REQUIRE(outer.success);
        CHECK(outer.bytes_consumed == value.size());

        DerCursor cursor(outer.value);
        auto cert_issuer = parse_context_tagged(cursor.remaining());
        REQUIRE(cert_issuer.success);
        CHECK(cert_issuer.value.tag == 1);
        CHECK(cert_issuer.value.constructed);

        auto directory_name = parse_context_tagged(cert_issuer.value.content);
        REQUIRE(directory_name.success);
        CHECK(directory_name.value.tag == 4);
        auto name = DistinguishedName::from_der(directory_name.value.content);
        REQUIRE(name.success);
        CHECK(name.value.der() == issuer.subject.der());
        REQUIRE(cursor.advance(cert_issuer.bytes_consumed));

        auto serial = parse_context_tagged(cursor.remaining());
        REQUIRE(serial.success);
        CHECK(serial.value.tag == 2);
        CHECK_FALSE(serial.value.constructed);
        CHECK(Bytes(serial.value.content.begin(), serial.value.content.end()) == Bytes{0x01, 0x02});
        REQUIRE(cursor.advance(serial.bytes_consumed));
        CHECK(cursor.empty());
    }

    TEST_CASE("exactly one AKI form is emitted") {
        auto with_ski = issuer_from(build_issuer_certificate("CN=Root A", ec_p256_spki(), kIssuerSki));
        auto without_ski = issuer_from(build_issuer_certificate("CN=Root B", ec_p256_spki(), std::nullopt));

        auto key_id_form = encode_authority_key_identifier(with_ski);
        auto name_form = encode_authority_key_identifier(without_ski);
        CHECK(key_id_form[2] == 0x80);
        CHECK(name_form[2] == 0xA1);
        CHECK(std::count(key_id_form.begin(), key_id_form.end(), uint8_t{0xA1}) == 0);
    }

    TEST_CASE("AIA and CRL distribution point encodings") {
        const std::string ca_url = "http://pki.example/ca.crt";
        const std::string crl_url = "http://pki.example/ca.crl";

        Bytes aia{0x30, 0x27, 0x30, 0x25, 0x06, 0x08, 0x2B, 0x06, 0x01, 0x05, 0x05, 0x07, 0x30, 0x02, 0x86, 0x19};
        auto ca_bytes = ascii(ca_url);
        aia.insert(aia.end(), ca_bytes.begin(), ca_bytes.end());
        CHECK(encode_authority_info_access(ca_url) == aia);

        Bytes crldp{0x30, 0x21, 0x30, 0x1F, 0xA0, 0x1D, 0xA0, 0x1B, 0x86, 0x19};
        auto crl_bytes = ascii(crl_url);
        crldp.insert(crldp.end(), crl_bytes.begin(), crl_bytes.end());
        CHECK(encode_crl_distribution_points(crl_url) == crldp);
    }

    TEST_CASE("configured URLs add non-critical AIA and CRLDP") {
        auto issuer = issuer_from(build_issuer_certificate("CN=Slot Root", ec_p256_spki(), kIssuerSki));
        LinkageConfig config;
        config.authority_access_url = "http://pki.example/ca.crt";
        config.crl_distribution_url = "http://pki.example/ca.crl";

        auto linkage = build_authority_linkage(issuer, config);
        REQUIRE(linkage.authority_info_access.has_value());
        REQUIRE(linkage.crl_distribution_points.has_value());
        CHECK_FALSE(linkage.authority_info_access->critical);
        CHECK_FALSE(linkage.crl_distribution_points->critical);
        CHECK(linkage.authority_info_access->oid == oid::make(oid::kAuthorityInfoAccess));
        CHECK(linkage.crl_distribution_points->oid == oid::make(oid::kCrlDistributionPoints));

        auto list = linkage.to_list();
        REQUIRE(list.size() == 3);
        CHECK(list[0].id == ExtensionId::AuthorityKeyIdentifier);
        CHECK(list[1].id == ExtensionId::AuthorityInfoAccess);
        CHECK(list[2].id == ExtensionId::CRLDistributionPoints);
    }
}
