#include <slotca/cert/distinguished_name.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/asn1_writer.hpp>

namespace slotca::cert {

    namespace {

        struct AttributeInfo {
            NameAttribute attribute;
            const char *label;
            uint32_t arc; // 2.5.4.<arc>
        };

        constexpr std::array<AttributeInfo, 6> kAttributes{{
            {NameAttribute::CommonName, "CN", 3},
            {NameAttribute::CountryName, "C", 6},
            {NameAttribute::LocalityName, "L", 7},
            {NameAttribute::StateOrProvinceName, "ST", 8},
            {NameAttribute::OrganizationName, "O", 10},
            {NameAttribute::OrganizationalUnitName, "OU", 11},
        }};

        const AttributeInfo *info_for(NameAttribute attribute) {
            for (const auto &info : kAttributes) {
                if (info.attribute == attribute) {
                    return &info;
                }
            }
            return nullptr;
        }

        NameAttribute attribute_for(const Oid &type) {
            if (type.nodes.size() != 4 || type.nodes[0] != 2 || type.nodes[1] != 5 || type.nodes[2] != 4) {
                return NameAttribute::Unknown;
            }
            for (const auto &info : kAttributes) {
                if (info.arc == type.nodes[3]) {
                    return info.attribute;
                }
            }
            return NameAttribute::Unknown;
        }

        std::optional<NameAttribute> attribute_for_label(std::string_view label) {
            if (label == "S") {
                return NameAttribute::StateOrProvinceName;
            }
            for (const auto &info : kAttributes) {
                if (label == info.label) {
                    return info.attribute;
                }
            }
            return std::nullopt;
        }

        bool printable(std::string_view str) {
            static constexpr std::string_view kExtra = " '()+,-./:=?";
            return std::all_of(str.begin(), str.end(), [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) != 0 || kExtra.find(c) != std::string_view::npos;
            });
        }

        std::vector<uint8_t> encode_value(const NameEntry &entry) {
            if (entry.attribute == NameAttribute::CountryName || printable(entry.value)) {
                return der::encode_printable_string(entry.value);
            }
            return der::encode_utf8_string(entry.value);
        }

        std::string_view trim(std::string_view view) {
            while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) {
                view.remove_prefix(1);
            }
            while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back()))) {
                view.remove_suffix(1);
            }
            return view;
        }

        std::vector<uint8_t> encode_name(const std::vector<RelativeDistinguishedName> &rdns) {
            std::vector<std::vector<uint8_t>> sets;
            sets.reserve(rdns.size());
            for (const auto &rdn : rdns) {
                std::vector<std::vector<uint8_t>> pairs;
                for (const auto &entry : rdn) {
                    auto pair = der::concat({der::encode_oid(entry.type), encode_value(entry)});
                    pairs.push_back(der::encode_sequence(pair));
                }
                sets.push_back(der::encode_set(der::concat(pairs)));
            }
            return der::encode_sequence(der::concat(sets));
        }

    } // namespace

    DistinguishedName::Result DistinguishedName::from_string(std::string_view input) {
        std::vector<RelativeDistinguishedName> rdns;
        size_t start = 0;
        while (start <= input.size()) {
            const size_t comma = std::min(input.find(',', start), input.size());
            const auto component = trim(input.substr(start, comma - start));
            start = comma + 1;
            if (component.empty()) {
                continue;
            }

            RelativeDistinguishedName rdn;
            size_t pos = 0;
            while (pos <= component.size()) {
                const size_t plus = std::min(component.find('+', pos), component.size());
                const auto pair = trim(component.substr(pos, plus - pos));
                pos = plus + 1;

                const auto eq = pair.find('=');
                if (eq == std::string_view::npos) {
                    return Result::failure("invalid DN component: " + std::string(pair));
                }
                const auto label = trim(pair.substr(0, eq));
                const auto attribute = attribute_for_label(label);
                if (!attribute) {
                    return Result::failure("unsupported DN attribute: " + std::string(label));
                }
                const auto value = trim(pair.substr(eq + 1));
                if (value.empty()) {
                    return Result::failure("empty value for DN attribute " + std::string(label));
                }
                NameEntry entry{};
                entry.attribute = *attribute;
                entry.type = Oid{{2, 5, 4, info_for(*attribute)->arc}};
                entry.value = std::string(value);
                rdn.push_back(std::move(entry));
            }
            rdns.push_back(std::move(rdn));
        }

        if (rdns.empty()) {
            return Result::failure("DN string empty");
        }

        DistinguishedName dn;
        dn.der_ = encode_name(rdns);
        dn.rdns_ = std::move(rdns);
        return Result::ok(std::move(dn));
    }

    DistinguishedName::Result DistinguishedName::from_der(ByteSpan der_bytes) {
        auto name = parse_sequence(der_bytes);
        if (!name.success) {
            return Result::failure("Name: " + name.error);
        }

        DistinguishedName dn;
        DerCursor cursor(name.value);
        while (!cursor.empty()) {
            auto set = parse_set(cursor.remaining());
            if (!set.success) {
                return Result::failure("RDN: " + set.error);
            }
            cursor.advance(set.bytes_consumed);

            RelativeDistinguishedName rdn;
            DerCursor set_cursor(set.value);
            while (!set_cursor.empty()) {
                auto pair = parse_sequence(set_cursor.remaining());
                if (!pair.success) {
                    return Result::failure("AttributeTypeAndValue: " + pair.error);
                }
                set_cursor.advance(pair.bytes_consumed);

                DerCursor pair_cursor(pair.value);
                auto type = parse_oid(pair_cursor.remaining());
                if (!type.success) {
                    return Result::failure("attribute type: " + type.error);
                }
                pair_cursor.advance(type.bytes_consumed);
                auto value = parse_directory_string(pair_cursor.remaining());
                if (!value.success) {
                    return Result::failure("attribute value: " + value.error);
                }
                pair_cursor.advance(value.bytes_consumed);
                if (!pair_cursor.empty()) {
                    return Result::failure("trailing data in AttributeTypeAndValue");
                }

                NameEntry entry{};
                entry.attribute = attribute_for(type.value);
                entry.type = std::move(type.value);
                entry.value = std::move(value.value);
                rdn.push_back(std::move(entry));
            }
            dn.rdns_.push_back(std::move(rdn));
        }

        dn.der_.assign(der_bytes.begin(), der_bytes.begin() + static_cast<std::ptrdiff_t>(name.bytes_consumed));
        return Result::ok(std::move(dn));
    }

    std::optional<std::string> DistinguishedName::first(NameAttribute attribute) const {
        for (const auto &rdn : rdns_) {
            for (const auto &entry : rdn) {
                if (entry.attribute == attribute) {
                    return entry.value;
                }
            }
        }
        return std::nullopt;
    }

    std::string DistinguishedName::to_string() const {
        std::ostringstream oss;
        bool first_entry = true;
        for (const auto &rdn : rdns_) {
            for (const auto &entry : rdn) {
                if (!first_entry) {
                    oss << ", ";
                }
                first_entry = false;
                const auto *info = info_for(entry.attribute);
                if (info != nullptr) {
                    oss << info->label;
                } else {
                    oss << entry.type.to_string();
                }
                oss << "=" << entry.value;
            }
        }
        return oss.str();
    }

} // namespace slotca::cert
