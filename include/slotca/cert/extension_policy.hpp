#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <slotca/cert/asn1_common.hpp>

namespace slotca::cert {

    // AND the requested KeyUsage bits with this mask.
    struct KeyUsageMask {
        uint16_t allowed{};
    };

    // Keep requested EKU purposes found in this list, in request order.
    struct EkuAllowList {
        std::vector<Oid> allowed;
    };

    struct Deny {};

    using ExtensionRule = std::variant<KeyUsageMask, EkuAllowList, Deny>;

    /**
     * Administrator policy for requester-supplied extensions, keyed by extension OID.
     * Extensions without a rule are denied. A value type: each issuance gets its own copy.
     */
    class ExtensionPolicy {
      public:
        ExtensionPolicy() = default;

        // KeyUsage: DigitalSignature | DataEncipherment | KeyAgreement
        // EKU: DocumentSigning, CodeSigning, EmailProtection
        static ExtensionPolicy defaults();

        ExtensionPolicy &set_rule(const Oid &extension, ExtensionRule rule);

        // nullptr when the OID has no rule.
        [[nodiscard]] const ExtensionRule *rule_for(const Oid &extension) const;
        [[nodiscard]] const std::vector<std::pair<Oid, ExtensionRule>> &rules() const noexcept { return rules_; }

        // A KeyUsageMask only makes sense on KeyUsage, an EkuAllowList only on EKU.
        [[nodiscard]] std::optional<std::string> validate() const;

      private:
        std::vector<std::pair<Oid, ExtensionRule>> rules_;
    };

    struct FilteredExtensions {
        std::optional<RawExtension> key_usage;
        std::optional<RawExtension> extended_key_usage;

        // KeyUsage first, then EKU.
        [[nodiscard]] std::vector<RawExtension> to_list() const;
    };

    std::optional<uint16_t> filter_key_usage(std::optional<uint16_t> requested, const KeyUsageMask &rule);
    std::vector<Oid> filter_extended_key_usage(const std::vector<Oid> &requested, const EkuAllowList &rule);

    /**
     * Narrows a CSR's extension list to what the policy grants. Never fails: undecodable
     * or missing KeyUsage/EKU requests produce no extension, as does an EKU request that
     * filters to nothing. Every other requested extension is dropped.
     */
    FilteredExtensions filter_extensions(const std::vector<RawExtension> &requested, const ExtensionPolicy &policy);

} // namespace slotca::cert
