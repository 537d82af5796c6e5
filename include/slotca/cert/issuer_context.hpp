#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <slotca/cert/certificate.hpp>

namespace slotca::cert {

    // What an issued certificate needs to know about its CA, taken from the CA certificate.
    struct IssuerContext {
        struct Result;

        DistinguishedName subject;
        std::optional<std::vector<uint8_t>> subject_key_identifier;
        std::vector<uint8_t> serial_number;
        PublicKeyInfo public_key{};

        static Result from_certificate(const Certificate &certificate);
        static Result from_certificate(ByteSpan der);
    };

    struct IssuerContext::Result {
        bool success{};
        IssuerContext value{};
        std::string error{};

        static Result failure(std::string message) { return Result{false, {}, std::move(message)}; }
        static Result ok(IssuerContext value) { return Result{true, std::move(value), {}}; }
    };

} // namespace slotca::cert
