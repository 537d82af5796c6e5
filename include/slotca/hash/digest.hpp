#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace slotca::hash {

    enum class Algorithm { SHA256, SHA384, SHA512 };

    struct Result {
        bool success;
        std::vector<uint8_t> data;
        std::string error_message;
    };

    // Accepts "SHA256", "sha-256", "SHA384", ... Anything else is unknown.
    std::optional<Algorithm> algorithm_from_name(std::string_view name);
    std::string_view algorithm_name(Algorithm algo);
    size_t output_size(Algorithm algo);

    Result digest(Algorithm algo, std::span<const uint8_t> data);

    inline Result digest(Algorithm algo, const std::vector<uint8_t> &data) {
        return digest(algo, std::span<const uint8_t>(data.data(), data.size()));
    }

} // namespace slotca::hash
