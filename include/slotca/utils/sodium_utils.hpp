#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sodium.h>

namespace slotca::utils {

    inline void ensure_sodium_init() {
        static std::once_flag sodium_flag;
        static int status = -1;
        std::call_once(sodium_flag, []() { status = sodium_init(); });

        if (status < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    // CSPRNG output, used for serial numbers and PSS salts.
    inline std::vector<uint8_t> random_bytes(size_t size) {
        ensure_sodium_init();
        std::vector<uint8_t> bytes(size);
        if (!bytes.empty()) {
            randombytes_buf(bytes.data(), bytes.size());
        }
        return bytes;
    }

    inline std::string to_hex(const std::vector<uint8_t> &data) {
        ensure_sodium_init();
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.resize(data.size() * 2);
        return hex;
    }

    inline std::vector<uint8_t> from_hex(std::string_view hex) {
        ensure_sodium_init();
        std::vector<uint8_t> bytes(hex.size() / 2);
        size_t written = 0;
        if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(), ":", &written, nullptr) != 0) {
            return {};
        }
        bytes.resize(written);
        return bytes;
    }

    inline std::string to_base64(const std::vector<uint8_t> &data) {
        ensure_sodium_init();
        const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(encoded_len, '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        encoded.resize(encoded_len - 1);
        return encoded;
    }

} // namespace slotca::utils
