#include <doctest/doctest.h>

#include "issuance_test_helpers.hpp"

#include <slotca/hash/digest.hpp>
#include <slotca/utils/sodium_utils.hpp>

using namespace slotca::cert;
using namespace issuance_test;

TEST_SUITE("cert/public_key") {
    TEST_CASE("EC keys report the curve size") {
        auto p256 = parse_public_key_info(ec_p256_spki());
        REQUIRE(p256.success);
        CHECK(p256.value.algorithm == KeyAlgorithm::Ecdsa);
        CHECK(p256.value.curve == CurveId::Secp256r1);
        CHECK(p256.value.key_size_bits == 256);
        CHECK(p256.value.subject_public_key.size() == 65);

        auto p384 = parse_public_key_info(ec_p384_spki());
        REQUIRE(p384.success);
        CHECK(p384.value.curve == CurveId::Secp384r1);
        CHECK(p384.value.key_size_bits == 384);
    }

    TEST_CASE("RSA keys report the modulus length") {
        auto spki = rsa_spki(2048);
        auto rsa = parse_public_key_info(spki);
        REQUIRE(rsa.success);
        CHECK(rsa.value.algorithm == KeyAlgorithm::Rsa);
        CHECK(rsa.value.key_size_bits == 2048);
        CHECK(rsa.value.spki_der == spki);
        CHECK(rsa.bytes_consumed == spki.size());

        auto rsa3072 = parse_public_key_info(rsa_spki(3072));
        REQUIRE(rsa3072.success);
        CHECK(rsa3072.value.key_size_bits == 3072);
    }

    TEST_CASE("unsupported keys are rejected") {
        SUBCASE("unknown algorithm") {
            auto algorithm = der::encode_sequence(der::encode_oid(Oid{{1, 3, 101, 112}}));
            auto spki = der::encode_sequence(der::concat({algorithm, der::encode_bit_string(Bytes(32, 0x01))}));
            CHECK_FALSE(parse_public_key_info(spki).success);
        }
        SUBCASE("unknown curve") {
            auto algorithm = der::encode_sequence(
                der::concat({der::encode_oid(oid::make(oid::kEcPublicKey)), der::encode_oid(Oid{{1, 3, 132, 0, 10}})}));
            auto spki = der::encode_sequence(der::concat({algorithm, der::encode_bit_string(Bytes(65, 0x04))}));
            CHECK_FALSE(parse_public_key_info(spki).success);
        }
        SUBCASE("garbage") {
            CHECK_FALSE(parse_public_key_info(Bytes{0x30, 0x03, 0x02, 0x01, 0x00}).success);
        }
    }

    TEST_CASE("key identifier and fingerprint") {
        auto key = key_from_spki(ec_p256_spki());
        auto ski = compute_subject_key_identifier(key);
        auto full = slotca::hash::digest(slotca::hash::Algorithm::SHA256, key.subject_public_key);
        CHECK(ski.size() == 32);
        CHECK(ski == full.data);

        auto spki_hash = slotca::hash::digest(slotca::hash::Algorithm::SHA256, key.spki_der);
        CHECK(public_key_fingerprint(key) == slotca::utils::to_base64(spki_hash.data));
        CHECK(public_key_fingerprint(key).size() == 44);

        auto other = key_from_spki(ec_p256_spki(0x12));
        CHECK(compute_subject_key_identifier(other) != ski);
    }
}
