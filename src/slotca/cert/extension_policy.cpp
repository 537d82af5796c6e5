#include <slotca/cert/extension_policy.hpp>

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include <slotca/cert/extensions.hpp>
#include <slotca/cert/oid_registry.hpp>

namespace slotca::cert {

    namespace {

        std::string join_oids(const std::vector<Oid> &oids) {
            std::string out;
            for (const auto &entry : oids) {
                if (!out.empty()) {
                    out += ", ";
                }
                out += entry.to_string();
            }
            return out.empty() ? "none" : out;
        }

        std::optional<RawExtension> apply_key_usage(const RawExtension &requested, const KeyUsageMask &rule) {
            const auto bits = decode_key_usage(requested.value);
            if (!bits) {
                spdlog::info("[ExtensionPolicy] Ignoring undecodable KeyUsage request");
                return std::nullopt;
            }
            const auto granted = filter_key_usage(bits, rule);
            spdlog::info("[ExtensionPolicy] Requested key usages: {}", key_usage::describe(*bits));
            spdlog::info("[ExtensionPolicy] Granted key usages: {}", key_usage::describe(*granted));
            return make_extension(ExtensionId::KeyUsage, true, encode_key_usage(*granted));
        }

        std::optional<RawExtension> apply_extended_key_usage(const RawExtension &requested, const EkuAllowList &rule) {
            const auto purposes = decode_extended_key_usage(requested.value);
            if (!purposes) {
                spdlog::info("[ExtensionPolicy] Ignoring undecodable EKU request");
                return std::nullopt;
            }
            const auto granted = filter_extended_key_usage(*purposes, rule);
            spdlog::info("[ExtensionPolicy] Requested EKUs: {}", join_oids(*purposes));
            spdlog::info("[ExtensionPolicy] Granted EKUs: {}", join_oids(granted));
            if (granted.empty()) {
                return std::nullopt;
            }
            return make_extension(ExtensionId::ExtendedKeyUsage, requested.critical,
                                  encode_extended_key_usage(granted));
        }

    } // namespace

    ExtensionPolicy ExtensionPolicy::defaults() {
        ExtensionPolicy policy;
        policy.set_rule(oid::make(oid::kKeyUsage),
                        KeyUsageMask{static_cast<uint16_t>(key_usage::DataEncipherment | key_usage::DigitalSignature |
                                                           key_usage::KeyAgreement)});
        policy.set_rule(oid::make(oid::kExtendedKeyUsage),
                        EkuAllowList{{oid::make(oid::kEkuDocumentSigning), oid::make(oid::kEkuCodeSigning),
                                      oid::make(oid::kEkuEmailProtection)}});
        return policy;
    }

    ExtensionPolicy &ExtensionPolicy::set_rule(const Oid &extension, ExtensionRule rule) {
        auto existing = std::find_if(rules_.begin(), rules_.end(),
                                     [&](const auto &entry) { return entry.first == extension; });
        if (existing != rules_.end()) {
            existing->second = std::move(rule);
        } else {
            rules_.emplace_back(extension, std::move(rule));
        }
        return *this;
    }

    const ExtensionRule *ExtensionPolicy::rule_for(const Oid &extension) const {
        for (const auto &[key, rule] : rules_) {
            if (key == extension) {
                return &rule;
            }
        }
        return nullptr;
    }

    std::optional<std::string> ExtensionPolicy::validate() const {
        for (const auto &[key, rule] : rules_) {
            const auto id = find_extension_by_oid(key);
            if (std::holds_alternative<KeyUsageMask>(rule) && id != ExtensionId::KeyUsage) {
                return "KeyUsageMask rule attached to " + key.to_string();
            }
            if (std::holds_alternative<EkuAllowList>(rule) && id != ExtensionId::ExtendedKeyUsage) {
                return "EkuAllowList rule attached to " + key.to_string();
            }
        }
        return std::nullopt;
    }

    std::vector<RawExtension> FilteredExtensions::to_list() const {
        std::vector<RawExtension> out;
        if (key_usage) {
            out.push_back(*key_usage);
        }
        if (extended_key_usage) {
            out.push_back(*extended_key_usage);
        }
        return out;
    }

    std::optional<uint16_t> filter_key_usage(std::optional<uint16_t> requested, const KeyUsageMask &rule) {
        if (!requested) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(*requested & rule.allowed);
    }

    std::vector<Oid> filter_extended_key_usage(const std::vector<Oid> &requested, const EkuAllowList &rule) {
        std::vector<Oid> granted;
        std::copy_if(requested.begin(), requested.end(), std::back_inserter(granted), [&](const Oid &purpose) {
            return std::find(rule.allowed.begin(), rule.allowed.end(), purpose) != rule.allowed.end();
        });
        return granted;
    }

    FilteredExtensions filter_extensions(const std::vector<RawExtension> &requested, const ExtensionPolicy &policy) {
        FilteredExtensions result;
        bool key_usage_seen = false;
        bool eku_seen = false;

        for (const auto &ext : requested) {
            const auto *rule = policy.rule_for(ext.oid);
            const auto *mask = rule != nullptr ? std::get_if<KeyUsageMask>(rule) : nullptr;
            const auto *allow = rule != nullptr ? std::get_if<EkuAllowList>(rule) : nullptr;

            if (ext.id == ExtensionId::KeyUsage && mask != nullptr) {
                if (!key_usage_seen) {
                    key_usage_seen = true;
                    result.key_usage = apply_key_usage(ext, *mask);
                }
                continue;
            }
            if (ext.id == ExtensionId::ExtendedKeyUsage && allow != nullptr) {
                if (!eku_seen) {
                    eku_seen = true;
                    result.extended_key_usage = apply_extended_key_usage(ext, *allow);
                }
                continue;
            }
            spdlog::info("[ExtensionPolicy] Dropping requested extension {}", ext.oid.to_string());
        }

        if (!key_usage_seen) {
            spdlog::info("[ExtensionPolicy] No key usage requested");
        }
        if (!eku_seen) {
            spdlog::info("[ExtensionPolicy] No EKU requested");
        }
        return result;
    }

} // namespace slotca::cert
