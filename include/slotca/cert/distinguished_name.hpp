#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <slotca/cert/asn1_common.hpp>

namespace slotca::cert {

    enum class NameAttribute {
        Unknown = 0,
        CommonName,
        CountryName,
        OrganizationName,
        OrganizationalUnitName,
        StateOrProvinceName,
        LocalityName
    };

    struct NameEntry {
        Oid type{};
        NameAttribute attribute{NameAttribute::Unknown};
        std::string value;
    };

    using RelativeDistinguishedName = std::vector<NameEntry>;

    /**
     * X.501 Name. Built either from its DER encoding (taken verbatim from a CSR or issuer
     * certificate, so the issuer name in an issued certificate matches the CA byte for byte)
     * or from a "CN=..,O=.." string for self-signed CA creation.
     */
    class DistinguishedName {
      public:
        struct Result;

        DistinguishedName() = default;

        static Result from_string(std::string_view input);
        static Result from_der(ByteSpan der_bytes);

        [[nodiscard]] const std::vector<uint8_t> &der() const noexcept { return der_; }
        [[nodiscard]] const std::vector<RelativeDistinguishedName> &rdns() const noexcept { return rdns_; }
        [[nodiscard]] bool empty() const noexcept { return rdns_.empty(); }

        [[nodiscard]] std::optional<std::string> first(NameAttribute attribute) const;
        [[nodiscard]] std::string to_string() const;

      private:
        std::vector<uint8_t> der_;
        std::vector<RelativeDistinguishedName> rdns_;
    };

    struct DistinguishedName::Result {
        bool success{};
        DistinguishedName value{};
        std::string error{};

        static Result failure(std::string message) { return Result{false, {}, std::move(message)}; }
        static Result ok(DistinguishedName value) { return Result{true, std::move(value), {}}; }
    };

} // namespace slotca::cert
