#include <slotca/sign/digest_formatter.hpp>

#include <algorithm>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/utils/sodium_utils.hpp>

namespace slotca::sign {

    namespace {

        constexpr size_t kPkcs1MinPadding = 8;

        FormatResult check_handle(const SigningKeyHandle &handle, const SignatureScheme &scheme) {
            if (handle.algorithm == cert::KeyAlgorithm::Unknown) {
                return FormatResult::failure(ErrorCode::UnsupportedAlgorithm, "signing key algorithm unknown");
            }
            if (handle.algorithm != scheme_key_algorithm(scheme)) {
                return FormatResult::failure(ErrorCode::UnsupportedAlgorithm,
                                             std::string(scheme_name(scheme)) + " cannot be used with a " +
                                                 cert::key_algorithm_name(handle.algorithm) + " key");
            }
            if (handle.key_size_bits == 0) {
                return FormatResult::failure(ErrorCode::UnsupportedKeySize, "signing key size unknown");
            }
            return FormatResult::ok({});
        }

    } // namespace

    std::vector<uint8_t> digest_info(hash::Algorithm digest, const std::vector<uint8_t> &hashed) {
        namespace der = cert::der;
        auto algorithm =
            der::encode_sequence(der::concat({der::encode_oid(cert::oid_for_hash(digest)), der::encode_null()}));
        return der::encode_sequence(der::concat({algorithm, der::encode_octet_string(hashed)}));
    }

    std::vector<uint8_t> mgf1(hash::Algorithm digest, std::span<const uint8_t> seed, size_t length) {
        std::vector<uint8_t> mask;
        mask.reserve(length + hash::output_size(digest));
        std::vector<uint8_t> block(seed.begin(), seed.end());
        block.resize(seed.size() + 4);
        for (uint32_t counter = 0; mask.size() < length; ++counter) {
            block[seed.size()] = static_cast<uint8_t>(counter >> 24U);
            block[seed.size() + 1] = static_cast<uint8_t>(counter >> 16U);
            block[seed.size() + 2] = static_cast<uint8_t>(counter >> 8U);
            block[seed.size() + 3] = static_cast<uint8_t>(counter);
            auto chunk = hash::digest(digest, block);
            mask.insert(mask.end(), chunk.data.begin(), chunk.data.end());
        }
        mask.resize(length);
        return mask;
    }

    FormatResult DigestFormatter::format(const SigningKeyHandle &handle, const SignatureScheme &scheme,
                                         std::string_view digest_name, std::span<const uint8_t> tbs) {
        auto digest = hash::algorithm_from_name(digest_name);
        if (!digest) {
            return FormatResult::failure(ErrorCode::UnsupportedDigest,
                                         "unsupported digest algorithm '" + std::string(digest_name) + "'");
        }
        return format(handle, scheme, *digest, tbs);
    }

    FormatResult DigestFormatter::format(const SigningKeyHandle &handle, const SignatureScheme &scheme,
                                         hash::Algorithm digest, std::span<const uint8_t> tbs) {
        auto checked = check_handle(handle, scheme);
        if (!checked.success) {
            return checked;
        }

        auto hashed = hash::digest(digest, tbs);
        if (!hashed.success) {
            return FormatResult::failure(ErrorCode::UnsupportedDigest, hashed.error_message);
        }
        spdlog::debug("[DigestFormatter] {} over {} bytes, {} for {}-bit key in slot {:#04x}",
                      hash::algorithm_name(digest), tbs.size(), scheme_name(scheme), handle.key_size_bits,
                      handle.slot);

        return std::visit(
            [&](const auto &s) -> FormatResult {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, Ecdsa>) {
                    return format_ecdsa(handle, hashed.data);
                } else if constexpr (std::is_same_v<T, RsaPkcs1>) {
                    return format_pkcs1(handle, digest, hashed.data);
                } else {
                    static_assert(std::is_same_v<T, RsaPss>, "unhandled signature scheme");
                    return format_pss(handle, digest, hashed.data, utils::random_bytes(pss_salt_length(s, digest)));
                }
            },
            scheme);
    }

    FormatResult DigestFormatter::format_ecdsa(const SigningKeyHandle &handle, const std::vector<uint8_t> &hashed) {
        const size_t width = handle.key_size_bytes();
        if (hashed.size() > width) {
            return FormatResult::failure(ErrorCode::UnsupportedKeySize,
                                         std::to_string(hashed.size() * 8) + "-bit digest does not fit a " +
                                             std::to_string(handle.key_size_bits) + "-bit curve");
        }
        std::vector<uint8_t> out(width - hashed.size(), 0x00);
        out.insert(out.end(), hashed.begin(), hashed.end());
        return FormatResult::ok(std::move(out));
    }

    FormatResult DigestFormatter::format_pkcs1(const SigningKeyHandle &handle, hash::Algorithm digest,
                                               const std::vector<uint8_t> &hashed) {
        const auto t = digest_info(digest, hashed);
        const size_t k = handle.key_size_bytes();
        if (k < t.size() + kPkcs1MinPadding + 3) {
            return FormatResult::failure(ErrorCode::UnsupportedKeySize,
                                         std::to_string(handle.key_size_bits) + "-bit modulus too short for " +
                                             std::string(hash::algorithm_name(digest)) + " DigestInfo");
        }
        std::vector<uint8_t> em;
        em.reserve(k);
        em.push_back(0x00);
        em.push_back(0x01);
        em.insert(em.end(), k - t.size() - 3, 0xFF);
        em.push_back(0x00);
        em.insert(em.end(), t.begin(), t.end());
        return FormatResult::ok(std::move(em));
    }

    // RFC 8017 9.1.1 with emBits = modBits - 1.
    FormatResult DigestFormatter::format_pss(const SigningKeyHandle &handle, hash::Algorithm digest,
                                             const std::vector<uint8_t> &hashed, const std::vector<uint8_t> &salt) {
        const size_t h_len = hashed.size();
        const size_t em_bits = handle.key_size_bits > 0 ? handle.key_size_bits - 1 : 0;
        const size_t em_len = (em_bits + 7) / 8;
        if (em_len < h_len + salt.size() + 2) {
            return FormatResult::failure(ErrorCode::UnsupportedKeySize,
                                         std::to_string(handle.key_size_bits) + "-bit modulus too short for PSS with " +
                                             std::to_string(salt.size()) + "-byte salt");
        }

        std::vector<uint8_t> m_prime(8, 0x00);
        m_prime.insert(m_prime.end(), hashed.begin(), hashed.end());
        m_prime.insert(m_prime.end(), salt.begin(), salt.end());
        const auto h = hash::digest(digest, m_prime).data;

        const size_t db_len = em_len - h_len - 1;
        std::vector<uint8_t> db(db_len - salt.size() - 1, 0x00);
        db.push_back(0x01);
        db.insert(db.end(), salt.begin(), salt.end());

        const auto mask = mgf1(digest, h, db_len);
        std::transform(db.begin(), db.end(), mask.begin(), db.begin(), [](uint8_t a, uint8_t b) {
            return static_cast<uint8_t>(a ^ b);
        });
        db[0] &= static_cast<uint8_t>(0xFFU >> (8 * em_len - em_bits));

        std::vector<uint8_t> out;
        out.reserve(handle.key_size_bytes());
        out.insert(out.end(), handle.key_size_bytes() - em_len, 0x00);
        out.insert(out.end(), db.begin(), db.end());
        out.insert(out.end(), h.begin(), h.end());
        out.push_back(0xBC);
        return FormatResult::ok(std::move(out));
    }

} // namespace slotca::sign
