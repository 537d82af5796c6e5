#include <doctest/doctest.h>

#include <chrono>
#include <vector>

#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/utils/sodium_utils.hpp>

using namespace slotca::cert;
using Bytes = std::vector<uint8_t>;

TEST_SUITE("cert/asn1") {
    TEST_CASE("integer encoding is minimal and positive") {
        CHECK(der::encode_integer(uint64_t{0}) == Bytes{0x02, 0x01, 0x00});
        CHECK(der::encode_integer(uint64_t{127}) == Bytes{0x02, 0x01, 0x7F});
        CHECK(der::encode_integer(uint64_t{128}) == Bytes{0x02, 0x02, 0x00, 0x80});
        CHECK(der::encode_integer(Bytes{0x00, 0x00, 0x05}) == Bytes{0x02, 0x01, 0x05});
        CHECK(der::encode_integer(Bytes{0xFF, 0x01}) == Bytes{0x02, 0x03, 0x00, 0xFF, 0x01});
    }

    TEST_CASE("long form lengths") {
        Bytes content(300, 0xAB);
        auto encoded = der::encode_octet_string(content);
        REQUIRE(encoded.size() == 304);
        CHECK(encoded[0] == 0x04);
        CHECK(encoded[1] == 0x82);
        CHECK(encoded[2] == 0x01);
        CHECK(encoded[3] == 0x2C);

        auto parsed = parse_octet_string(encoded);
        REQUIRE(parsed.success);
        CHECK(parsed.value.size() == 300);
        CHECK(parsed.bytes_consumed == encoded.size());
    }

    TEST_CASE("object identifiers") {
        auto encoded = der::encode_oid(oid::make(oid::kSha256WithRsa));
        CHECK(slotca::utils::to_hex(encoded) == "06092a864886f70d01010b");

        auto parsed = parse_oid(encoded);
        REQUIRE(parsed.success);
        CHECK(parsed.value.to_string() == "1.2.840.113549.1.1.11");
        CHECK(oid::matches(parsed.value, oid::kSha256WithRsa));
        CHECK(find_hash_by_oid(oid::make(oid::kSha384)) == slotca::hash::Algorithm::SHA384);
        CHECK(find_extension_by_oid(oid::make(oid::kAuthorityKeyId)) == ExtensionId::AuthorityKeyIdentifier);
        CHECK(find_curve_by_oid(oid::make(oid::kSecp384r1)) == CurveId::Secp384r1);
        CHECK(curve_bits(CurveId::Secp521r1) == 521);
    }

    TEST_CASE("context tags") {
        auto implicit = der::encode_implicit(6, Bytes{'a', 'b'});
        CHECK(implicit == Bytes{0x86, 0x02, 'a', 'b'});

        auto explicit_tag = der::encode_explicit(3, der::encode_null());
        CHECK(explicit_tag == Bytes{0xA3, 0x02, 0x05, 0x00});

        auto view = parse_context_tagged(explicit_tag);
        REQUIRE(view.success);
        CHECK(view.value.tag == 3);
        CHECK(view.value.constructed);
        CHECK(view.value.content.size() == 2);
    }

    TEST_CASE("time encoding switches to GeneralizedTime after 2049") {
        using namespace std::chrono;
        const auto in_range = system_clock::from_time_t(1704067200); // 2024-01-01
        auto utc = der::serialize_time(in_range);
        CHECK(utc[0] == static_cast<uint8_t>(ASN1Tag::UTCTime));
        auto parsed = parse_time(utc);
        REQUIRE(parsed.success);
        CHECK(parsed.value == in_range);

        const auto far = system_clock::from_time_t(2524608000); // 2050-01-01
        auto generalized = der::serialize_time(far);
        CHECK(generalized[0] == static_cast<uint8_t>(ASN1Tag::GeneralizedTime));
        auto parsed_far = parse_time(generalized);
        REQUIRE(parsed_far.success);
        CHECK(parsed_far.value == far);
    }

    TEST_CASE("malformed input is rejected") {
        SUBCASE("truncated") {
            Bytes truncated{0x30, 0x05, 0x02, 0x01};
            CHECK_FALSE(parse_sequence(truncated).success);
        }
        SUBCASE("wrong tag") {
            CHECK_FALSE(parse_integer(der::encode_null()).success);
        }
        SUBCASE("empty integer") {
            CHECK_FALSE(parse_integer(Bytes{0x02, 0x00}).success);
        }
        SUBCASE("bit string unused bits out of range") {
            CHECK_FALSE(parse_bit_string(Bytes{0x03, 0x02, 0x08, 0x00}).success);
        }
        SUBCASE("time without seconds") {
            Bytes no_seconds{0x17, 0x0B, '2', '4', '0', '1', '0', '1', '0', '0', '0', '0', 'Z'};
            CHECK_FALSE(parse_time(no_seconds).success);
        }
    }
}
