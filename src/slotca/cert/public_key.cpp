#include <slotca/cert/public_key.hpp>

#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/hash/digest.hpp>
#include <slotca/utils/sodium_utils.hpp>

namespace slotca::cert {

    namespace {

        size_t bit_length(ByteSpan magnitude) {
            size_t i = 0;
            while (i < magnitude.size() && magnitude[i] == 0) {
                ++i;
            }
            if (i == magnitude.size()) {
                return 0;
            }
            size_t bits = (magnitude.size() - i - 1) * 8;
            for (uint8_t top = magnitude[i]; top != 0; top >>= 1U) {
                ++bits;
            }
            return bits;
        }

        // RSAPublicKey ::= SEQUENCE { modulus INTEGER, publicExponent INTEGER }
        bool read_rsa_modulus_bits(ByteSpan key_bits, size_t &bits, std::string &error) {
            auto seq = parse_sequence(key_bits);
            if (!seq.success) {
                error = "RSAPublicKey: " + seq.error;
                return false;
            }
            DerCursor cursor(seq.value);
            auto modulus = parse_integer(cursor.remaining());
            if (!modulus.success) {
                error = "RSA modulus: " + modulus.error;
                return false;
            }
            cursor.advance(modulus.bytes_consumed);
            auto exponent = parse_integer(cursor.remaining());
            if (!exponent.success) {
                error = "RSA exponent: " + exponent.error;
                return false;
            }
            bits = bit_length(modulus.value);
            if (bits == 0) {
                error = "RSA modulus is zero";
                return false;
            }
            return true;
        }

    } // namespace

    const char *key_algorithm_name(KeyAlgorithm algorithm) {
        switch (algorithm) {
        case KeyAlgorithm::Rsa:
            return "RSA";
        case KeyAlgorithm::Ecdsa:
            return "ECDSA";
        case KeyAlgorithm::Unknown:
        default:
            return "unknown";
        }
    }

    PublicKeyResult parse_public_key_info(ByteSpan der) {
        auto spki = parse_sequence(der);
        if (!spki.success) {
            return PublicKeyResult::failure("SubjectPublicKeyInfo: " + spki.error);
        }
        DerCursor cursor(spki.value);

        auto alg = parse_sequence(cursor.remaining());
        if (!alg.success) {
            return PublicKeyResult::failure("AlgorithmIdentifier: " + alg.error);
        }
        cursor.advance(alg.bytes_consumed);

        DerCursor alg_cursor(alg.value);
        auto alg_oid = parse_oid(alg_cursor.remaining());
        if (!alg_oid.success) {
            return PublicKeyResult::failure("key algorithm: " + alg_oid.error);
        }
        alg_cursor.advance(alg_oid.bytes_consumed);

        auto key_bits = parse_bit_string(cursor.remaining());
        if (!key_bits.success) {
            return PublicKeyResult::failure("subjectPublicKey: " + key_bits.error);
        }
        cursor.advance(key_bits.bytes_consumed);
        if (!cursor.empty()) {
            return PublicKeyResult::failure("extra data in SubjectPublicKeyInfo");
        }

        PublicKeyInfo info{};
        info.spki_der.assign(der.begin(), der.begin() + static_cast<std::ptrdiff_t>(spki.bytes_consumed));
        info.subject_public_key.assign(key_bits.value.bytes.begin(), key_bits.value.bytes.end());

        if (oid::matches(alg_oid.value, oid::kRsaEncryption)) {
            std::string error;
            if (!read_rsa_modulus_bits(key_bits.value.bytes, info.key_size_bits, error)) {
                return PublicKeyResult::failure(error);
            }
            info.algorithm = KeyAlgorithm::Rsa;
        } else if (oid::matches(alg_oid.value, oid::kEcPublicKey)) {
            auto curve_oid = parse_oid(alg_cursor.remaining());
            if (!curve_oid.success) {
                return PublicKeyResult::failure("EC named curve: " + curve_oid.error);
            }
            info.curve = find_curve_by_oid(curve_oid.value);
            if (info.curve == CurveId::Unknown) {
                return PublicKeyResult::failure("unsupported EC curve " + curve_oid.value.to_string());
            }
            info.algorithm = KeyAlgorithm::Ecdsa;
            info.key_size_bits = curve_bits(info.curve);
        } else {
            return PublicKeyResult::failure("unsupported key algorithm " + alg_oid.value.to_string());
        }

        return PublicKeyResult::ok(std::move(info), spki.bytes_consumed);
    }

    std::vector<uint8_t> compute_subject_key_identifier(const PublicKeyInfo &key) {
        return hash::digest(hash::Algorithm::SHA256, key.subject_public_key).data;
    }

    std::string public_key_fingerprint(const PublicKeyInfo &key) {
        return utils::to_base64(hash::digest(hash::Algorithm::SHA256, key.spki_der).data);
    }

} // namespace slotca::cert
