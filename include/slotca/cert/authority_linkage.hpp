#pragma once

#include <optional>
#include <string>
#include <vector>

#include <slotca/cert/asn1_common.hpp>
#include <slotca/cert/issuer_context.hpp>

namespace slotca::cert {

    struct LinkageConfig {
        // Where the issuer certificate can be fetched (AIA caIssuers).
        std::optional<std::string> authority_access_url;
        // Where the issuer publishes its CRL.
        std::optional<std::string> crl_distribution_url;
    };

    struct AuthorityLinkage {
        RawExtension authority_key_identifier;
        std::optional<RawExtension> authority_info_access;
        std::optional<RawExtension> crl_distribution_points;

        // AKI, AIA, CRLDP
        [[nodiscard]] std::vector<RawExtension> to_list() const;
    };

    // keyIdentifier form when the issuer has an SKI, otherwise authorityCertIssuer + serial.
    std::vector<uint8_t> encode_authority_key_identifier(const IssuerContext &issuer);
    std::vector<uint8_t> encode_authority_key_identifier(const std::vector<uint8_t> &key_id);

    std::vector<uint8_t> encode_authority_info_access(const std::string &ca_issuers_url);
    std::vector<uint8_t> encode_crl_distribution_points(const std::string &crl_url);

    // Always yields exactly one AKI; AIA and CRLDP only when their URL is configured.
    AuthorityLinkage build_authority_linkage(const IssuerContext &issuer, const LinkageConfig &config);

} // namespace slotca::cert
