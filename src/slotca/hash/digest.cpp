#include "slotca/hash/digest.hpp"

#include <algorithm>
#include <cctype>

#include <sodium.h>

#include "slotca/utils/sodium_utils.hpp"

namespace slotca::hash {

    namespace {

        // FIPS 180-4 section 5.3.4
        constexpr uint64_t kSha384InitialState[8] = {
            0xcbbb9d5dc1059ed8ULL, 0x629a292a367cd507ULL, 0x9159015a3070dd17ULL, 0x152fecd8f70e5939ULL,
            0x67332667ffc00b31ULL, 0x8eb44a8768581511ULL, 0xdb0c2e0d64f98fa7ULL, 0x47b5481dbefa4fa4ULL};

        constexpr size_t kSha384Bytes = 48;

        // SHA-384 is SHA-512 with a different IV and a truncated output.
        std::vector<uint8_t> sha384(std::span<const uint8_t> data) {
            crypto_hash_sha512_state state;
            crypto_hash_sha512_init(&state);
            std::copy(std::begin(kSha384InitialState), std::end(kSha384InitialState), state.state);

            crypto_hash_sha512_update(&state, data.data(), data.size());
            std::vector<uint8_t> full(crypto_hash_sha512_BYTES);
            crypto_hash_sha512_final(&state, full.data());
            full.resize(kSha384Bytes);
            return full;
        }

        std::string normalize(std::string_view name) {
            std::string out;
            out.reserve(name.size());
            for (char c : name) {
                if (c == '-' || c == '_') {
                    continue;
                }
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
            return out;
        }

    } // namespace

    std::optional<Algorithm> algorithm_from_name(std::string_view name) {
        const auto normalized = normalize(name);
        if (normalized == "SHA256") {
            return Algorithm::SHA256;
        }
        if (normalized == "SHA384") {
            return Algorithm::SHA384;
        }
        if (normalized == "SHA512") {
            return Algorithm::SHA512;
        }
        return std::nullopt;
    }

    std::string_view algorithm_name(Algorithm algo) {
        switch (algo) {
        case Algorithm::SHA256:
            return "SHA256";
        case Algorithm::SHA384:
            return "SHA384";
        case Algorithm::SHA512:
            return "SHA512";
        }
        return "unknown";
    }

    size_t output_size(Algorithm algo) {
        switch (algo) {
        case Algorithm::SHA256:
            return crypto_hash_sha256_BYTES;
        case Algorithm::SHA384:
            return kSha384Bytes;
        case Algorithm::SHA512:
            return crypto_hash_sha512_BYTES;
        }
        return 0;
    }

    Result digest(Algorithm algo, std::span<const uint8_t> data) {
        utils::ensure_sodium_init();

        switch (algo) {
        case Algorithm::SHA256: {
            std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
            crypto_hash_sha256(digest.data(), data.data(), data.size());
            return {true, digest, ""};
        }
        case Algorithm::SHA384:
            return {true, sha384(data), ""};
        case Algorithm::SHA512: {
            std::vector<uint8_t> digest(crypto_hash_sha512_BYTES);
            crypto_hash_sha512(digest.data(), data.data(), data.size());
            return {true, digest, ""};
        }
        }

        return {false, {}, "Unsupported hash algorithm"};
    }

} // namespace slotca::hash
