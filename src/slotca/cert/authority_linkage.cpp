#include <slotca/cert/authority_linkage.hpp>

#include <spdlog/spdlog.h>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/utils/sodium_utils.hpp>

namespace slotca::cert {

    namespace {

        // GeneralName uniformResourceIdentifier [6] IMPLICIT IA5String
        std::vector<uint8_t> encode_uri(const std::string &url) {
            return der::encode_implicit(6, ByteSpan(reinterpret_cast<const uint8_t *>(url.data()), url.size()));
        }

    } // namespace

    std::vector<RawExtension> AuthorityLinkage::to_list() const {
        std::vector<RawExtension> out{authority_key_identifier};
        if (authority_info_access) {
            out.push_back(*authority_info_access);
        }
        if (crl_distribution_points) {
            out.push_back(*crl_distribution_points);
        }
        return out;
    }

    std::vector<uint8_t> encode_authority_key_identifier(const std::vector<uint8_t> &key_id) {
        return der::encode_sequence(der::encode_implicit(0, key_id));
    }

    std::vector<uint8_t> encode_authority_key_identifier(const IssuerContext &issuer) {
        if (issuer.subject_key_identifier) {
            return encode_authority_key_identifier(*issuer.subject_key_identifier);
        }
        // authorityCertIssuer [1] GeneralNames { directoryName [4] Name }, authorityCertSerialNumber [2]
        auto directory_name = der::encode_explicit(4, issuer.subject.der());
        auto cert_issuer = der::encode_implicit(1, directory_name, true);
        auto serial = der::encode_implicit(2, issuer.serial_number);
        return der::encode_sequence(der::concat({cert_issuer, serial}));
    }

    std::vector<uint8_t> encode_authority_info_access(const std::string &ca_issuers_url) {
        auto method = der::encode_oid(oid::make(oid::kCaIssuers));
        auto access = der::encode_sequence(der::concat({method, encode_uri(ca_issuers_url)}));
        return der::encode_sequence(access);
    }

    // DistributionPoint { distributionPoint [0] { fullName [0] GeneralNames } }
    std::vector<uint8_t> encode_crl_distribution_points(const std::string &crl_url) {
        auto full_name = der::encode_implicit(0, encode_uri(crl_url), true);
        auto point_name = der::encode_explicit(0, full_name);
        return der::encode_sequence(der::encode_sequence(point_name));
    }

    AuthorityLinkage build_authority_linkage(const IssuerContext &issuer, const LinkageConfig &config) {
        AuthorityLinkage linkage{};
        linkage.authority_key_identifier =
            make_extension(ExtensionId::AuthorityKeyIdentifier, false, encode_authority_key_identifier(issuer));
        if (issuer.subject_key_identifier) {
            spdlog::info("[AuthorityLinkage] AKI from issuer key identifier {}",
                         utils::to_hex(*issuer.subject_key_identifier));
        } else {
            spdlog::info("[AuthorityLinkage] AKI from issuer name {} and serial {}", issuer.subject.to_string(),
                         utils::to_hex(issuer.serial_number));
        }

        if (config.authority_access_url) {
            linkage.authority_info_access = make_extension(ExtensionId::AuthorityInfoAccess, false,
                                                           encode_authority_info_access(*config.authority_access_url));
            spdlog::info("[AuthorityLinkage] AIA caIssuers {}", *config.authority_access_url);
        }
        if (config.crl_distribution_url) {
            auto crldp = encode_crl_distribution_points(*config.crl_distribution_url);
            linkage.crl_distribution_points = make_extension(ExtensionId::CRLDistributionPoints, false, crldp);
            spdlog::info("[AuthorityLinkage] CRL distribution point {}", *config.crl_distribution_url);
        }
        return linkage;
    }

} // namespace slotca::cert
