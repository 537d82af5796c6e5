#include <doctest/doctest.h>

#include "issuance_test_helpers.hpp"

#include <slotca/cert/extension_policy.hpp>

using namespace issuance_test;

TEST_SUITE("cert/extension_policy") {
    TEST_CASE("key usage is the intersection of request and mask") {
        const KeyUsageMask mask{static_cast<uint16_t>(key_usage::DigitalSignature | key_usage::KeyAgreement)};

        CHECK(filter_key_usage(key_usage::DigitalSignature | key_usage::KeyEncipherment, mask) ==
              key_usage::DigitalSignature);
        CHECK(filter_key_usage(key_usage::KeyCertSign, mask) == uint16_t{0});
        CHECK_FALSE(filter_key_usage(std::nullopt, mask).has_value());
    }

    TEST_CASE("EKU keeps allowed purposes in request order") {
        const EkuAllowList allow{{oid::make(oid::kEkuEmailProtection), oid::make(oid::kEkuCodeSigning)}};
        const std::vector<Oid> requested{oid::make(oid::kEkuCodeSigning), oid::make(oid::kEkuServerAuth),
                                         oid::make(oid::kEkuEmailProtection)};

        auto granted = filter_extended_key_usage(requested, allow);
        REQUIRE(granted.size() == 2);
        CHECK(granted[0] == oid::make(oid::kEkuCodeSigning));
        CHECK(granted[1] == oid::make(oid::kEkuEmailProtection));

        CHECK(filter_extended_key_usage({oid::make(oid::kEkuServerAuth)}, allow).empty());
    }

    TEST_CASE("default policy") {
        auto policy = ExtensionPolicy::defaults();
        CHECK_FALSE(policy.validate().has_value());

        const auto *ku_rule = policy.rule_for(oid::make(oid::kKeyUsage));
        REQUIRE(ku_rule != nullptr);
        const auto *mask = std::get_if<KeyUsageMask>(ku_rule);
        REQUIRE(mask != nullptr);
        CHECK(mask->allowed ==
              (key_usage::DigitalSignature | key_usage::DataEncipherment | key_usage::KeyAgreement));

        const auto *eku_rule = policy.rule_for(oid::make(oid::kExtendedKeyUsage));
        REQUIRE(eku_rule != nullptr);
        CHECK(std::get_if<EkuAllowList>(eku_rule)->allowed.size() == 3);

        CHECK(policy.rule_for(oid::make(oid::kSubjectAltName)) == nullptr);
    }

    TEST_CASE("misattached rules fail validation") {
        ExtensionPolicy policy;
        policy.set_rule(oid::make(oid::kSubjectAltName), KeyUsageMask{0xFFFF});
        CHECK(policy.validate().has_value());

        ExtensionPolicy eku_on_ku;
        eku_on_ku.set_rule(oid::make(oid::kKeyUsage), EkuAllowList{});
        CHECK(eku_on_ku.validate().has_value());

        ExtensionPolicy deny_anything;
        deny_anything.set_rule(oid::make(oid::kSubjectAltName), Deny{});
        CHECK_FALSE(deny_anything.validate().has_value());
    }

    TEST_CASE("set_rule replaces an existing rule") {
        auto policy = ExtensionPolicy::defaults();
        policy.set_rule(oid::make(oid::kKeyUsage), Deny{});
        CHECK(policy.rules().size() == 2);
        CHECK(std::holds_alternative<Deny>(*policy.rule_for(oid::make(oid::kKeyUsage))));
    }

    TEST_CASE("filtering a CSR extension list") {
        auto policy = ExtensionPolicy::defaults();

        SUBCASE("only KeyUsage and EKU survive") {
            std::vector<RawExtension> requested{
                san_request("device.example"),
                key_usage_request(key_usage::DigitalSignature | key_usage::KeyEncipherment, false),
                eku_request({oid::make(oid::kEkuServerAuth), oid::make(oid::kEkuDocumentSigning)}, true),
                make_extension(ExtensionId::BasicConstraints, true, encode_basic_constraints(true, std::nullopt)),
            };
            auto filtered = filter_extensions(requested, policy);

            REQUIRE(filtered.key_usage.has_value());
            CHECK(filtered.key_usage->critical);
            CHECK(decode_key_usage(filtered.key_usage->value) == key_usage::DigitalSignature);

            REQUIRE(filtered.extended_key_usage.has_value());
            CHECK(filtered.extended_key_usage->critical);
            auto purposes = decode_extended_key_usage(filtered.extended_key_usage->value);
            REQUIRE(purposes.has_value());
            REQUIRE(purposes->size() == 1);
            CHECK((*purposes)[0] == oid::make(oid::kEkuDocumentSigning));

            auto list = filtered.to_list();
            REQUIRE(list.size() == 2);
            CHECK(list[0].id == ExtensionId::KeyUsage);
            CHECK(list[1].id == ExtensionId::ExtendedKeyUsage);
        }

        SUBCASE("absent requests produce no extensions") {
            auto filtered = filter_extensions({san_request("device.example")}, policy);
            CHECK_FALSE(filtered.key_usage.has_value());
            CHECK_FALSE(filtered.extended_key_usage.has_value());
            CHECK(filtered.to_list().empty());
        }

        SUBCASE("EKU filtered to nothing is omitted") {
            auto filtered = filter_extensions({eku_request({oid::make(oid::kEkuServerAuth)})}, policy);
            CHECK_FALSE(filtered.extended_key_usage.has_value());
        }

        SUBCASE("KeyUsage filtered to nothing is still emitted") {
            auto filtered = filter_extensions({key_usage_request(key_usage::KeyCertSign)}, policy);
            REQUIRE(filtered.key_usage.has_value());
            CHECK(decode_key_usage(filtered.key_usage->value) == uint16_t{0});
            CHECK(filtered.key_usage->value == Bytes{0x03, 0x01, 0x00});
        }

        SUBCASE("only the first KeyUsage request counts") {
            auto filtered = filter_extensions(
                {key_usage_request(key_usage::KeyAgreement), key_usage_request(key_usage::DigitalSignature)}, policy);
            REQUIRE(filtered.key_usage.has_value());
            CHECK(decode_key_usage(filtered.key_usage->value) == key_usage::KeyAgreement);
        }

        SUBCASE("undecodable KeyUsage is ignored") {
            auto broken = make_extension(ExtensionId::KeyUsage, true, Bytes{0x04, 0x01, 0x00});
            auto filtered = filter_extensions({broken}, policy);
            CHECK_FALSE(filtered.key_usage.has_value());
        }

        SUBCASE("denied KeyUsage") {
            policy.set_rule(oid::make(oid::kKeyUsage), Deny{});
            auto filtered = filter_extensions({key_usage_request(key_usage::DigitalSignature)}, policy);
            CHECK_FALSE(filtered.key_usage.has_value());
        }
    }

    TEST_CASE("key usage encoding") {
        CHECK(encode_key_usage(key_usage::DigitalSignature) == Bytes{0x03, 0x02, 0x07, 0x80});
        CHECK(encode_key_usage(key_usage::KeyCertSign | key_usage::CRLSign | key_usage::DigitalSignature) ==
              Bytes{0x03, 0x02, 0x01, 0x86});
        CHECK(encode_key_usage(key_usage::DecipherOnly) == Bytes{0x03, 0x03, 0x07, 0x00, 0x80});
        CHECK(key_usage::describe(0) == "None");
        CHECK(key_usage::describe(key_usage::DigitalSignature | key_usage::KeyAgreement) ==
              "DigitalSignature, KeyAgreement");
    }
}
