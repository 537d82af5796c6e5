#include <slotca/cert/asn1_reader.hpp>

#include <limits>
#include <string_view>

namespace slotca::cert {

    namespace {

        constexpr size_t kMaxLengthOctets = sizeof(size_t);
        constexpr uint32_t kMaxTagNumber = (1U << 28);

        using TimePoint = std::chrono::system_clock::time_point;

        // Header of a universal, primitive-or-constructed element with the expected tag.
        ASN1Result<ParsedHeader> expect_universal(ByteSpan input, ASN1Tag tag, bool constructed, const char *name) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return header;
            }
            const auto &id = header.value.identifier;
            if (id.tag_class != ASN1Class::Universal || id.tag_number != static_cast<uint32_t>(tag)) {
                return ASN1Result<ParsedHeader>::failure(std::string("expected ") + name);
            }
            if (id.constructed != constructed) {
                return ASN1Result<ParsedHeader>::failure(std::string(name) +
                                                         (constructed ? " must be constructed" : " must be primitive"));
            }
            return header;
        }

        ByteSpan content_of(ByteSpan input, const ParsedHeader &header) {
            return input.subspan(header.header_bytes, header.length);
        }

        size_t total_of(const ParsedHeader &header) { return header.header_bytes + header.length; }

        ASN1Result<ByteSpan> parse_universal_content(ByteSpan input, ASN1Tag tag, bool constructed, const char *name) {
            auto header = expect_universal(input, tag, constructed, name);
            if (!header.success) {
                return ASN1Result<ByteSpan>::failure(header.error);
            }
            return ASN1Result<ByteSpan>::ok(content_of(input, header.value), total_of(header.value));
        }

        bool read_digits(std::string_view text, size_t pos, size_t count, int &out) {
            out = 0;
            if (pos + count > text.size()) {
                return false;
            }
            for (size_t i = pos; i < pos + count; ++i) {
                if (text[i] < '0' || text[i] > '9') {
                    return false;
                }
                out = (out * 10) + (text[i] - '0');
            }
            return true;
        }

        ASN1Result<TimePoint> make_time_point(int year, int month, int day, int hour, int minute, int second) {
            using namespace std::chrono;
            if (hour > 23 || minute > 59 || second > 60) {
                return ASN1Result<TimePoint>::failure("invalid time component");
            }
            const year_month_day ymd{std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} /
                                     std::chrono::day{static_cast<unsigned>(day)}};
            if (!ymd.ok()) {
                return ASN1Result<TimePoint>::failure("invalid calendar date");
            }
            const TimePoint tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
            return ASN1Result<TimePoint>::ok(tp, 0);
        }

    } // namespace

    ASN1Result<ParsedHeader> parse_id_len(ByteSpan input) {
        if (input.empty()) {
            return ASN1Result<ParsedHeader>::failure("input too small for ASN.1 header");
        }

        size_t offset = 0;
        const uint8_t first = input[offset++];

        ASN1Identifier identifier{};
        identifier.tag_class = static_cast<ASN1Class>(first & 0xC0U);
        identifier.constructed = (first & 0x20U) != 0;
        identifier.tag_number = first & 0x1FU;

        if (identifier.tag_number == 0x1FU) {
            uint32_t tag = 0;
            uint8_t byte = 0;
            do {
                if (offset >= input.size()) {
                    return ASN1Result<ParsedHeader>::failure("unterminated long-form tag number");
                }
                byte = input[offset++];
                tag = (tag << 7U) | (byte & 0x7FU);
                if (tag > kMaxTagNumber) {
                    return ASN1Result<ParsedHeader>::failure("tag number exceeds supported range");
                }
            } while ((byte & 0x80U) != 0);
            identifier.tag_number = tag;
        }

        if (offset >= input.size()) {
            return ASN1Result<ParsedHeader>::failure("missing length field");
        }
        const uint8_t len_byte = input[offset++];
        size_t length = len_byte;
        if ((len_byte & 0x80U) != 0) {
            const size_t octets = len_byte & 0x7FU;
            if (octets == 0) {
                return ASN1Result<ParsedHeader>::failure("indefinite lengths are not supported in DER");
            }
            if (octets > kMaxLengthOctets) {
                return ASN1Result<ParsedHeader>::failure("length uses more bytes than supported");
            }
            if (offset + octets > input.size()) {
                return ASN1Result<ParsedHeader>::failure("insufficient data for long-form length");
            }
            length = 0;
            for (size_t i = 0; i < octets; ++i) {
                length = (length << 8U) | input[offset++];
            }
        }

        if (length > input.size() - offset) {
            return ASN1Result<ParsedHeader>::failure("value length exceeds buffer");
        }

        ParsedHeader header{identifier, length, offset};
        return ASN1Result<ParsedHeader>::ok(header, offset + length);
    }

    ASN1Result<ByteSpan> parse_integer(ByteSpan input) {
        auto result = parse_universal_content(input, ASN1Tag::Integer, false, "INTEGER");
        if (result.success && result.value.empty()) {
            return ASN1Result<ByteSpan>::failure("INTEGER has empty body");
        }
        return result;
    }

    ASN1Result<BitStringView> parse_bit_string(ByteSpan input) {
        auto content = parse_universal_content(input, ASN1Tag::BitString, false, "BIT STRING");
        if (!content.success) {
            return ASN1Result<BitStringView>::failure(content.error);
        }
        if (content.value.empty()) {
            return ASN1Result<BitStringView>::failure("BIT STRING missing unused-bits byte");
        }
        const uint8_t unused_bits = content.value[0];
        if (unused_bits > 7) {
            return ASN1Result<BitStringView>::failure("invalid unused bits");
        }
        return ASN1Result<BitStringView>::ok(BitStringView{unused_bits, content.value.subspan(1)},
                                             content.bytes_consumed);
    }

    ASN1Result<ByteSpan> parse_octet_string(ByteSpan input) {
        return parse_universal_content(input, ASN1Tag::OctetString, false, "OCTET STRING");
    }

    ASN1Result<Oid> parse_oid(ByteSpan input) {
        auto content = parse_universal_content(input, ASN1Tag::ObjectIdentifier, false, "OBJECT IDENTIFIER");
        if (!content.success) {
            return ASN1Result<Oid>::failure(content.error);
        }
        const auto body = content.value;
        if (body.empty()) {
            return ASN1Result<Oid>::failure("OBJECT IDENTIFIER has empty body");
        }

        std::vector<uint32_t> arcs;
        uint32_t value = 0;
        for (size_t i = 0; i < body.size(); ++i) {
            if (value > (std::numeric_limits<uint32_t>::max() >> 7U)) {
                return ASN1Result<Oid>::failure("OBJECT IDENTIFIER arc overflow");
            }
            value = (value << 7U) | (body[i] & 0x7FU);
            if ((body[i] & 0x80U) != 0) {
                if (i + 1 == body.size()) {
                    return ASN1Result<Oid>::failure("truncated OBJECT IDENTIFIER arc");
                }
                continue;
            }
            if (arcs.empty()) {
                const uint32_t first = value < 80U ? value / 40U : 2U;
                arcs.push_back(first);
                arcs.push_back(value - (first * 40U));
            } else {
                arcs.push_back(value);
            }
            value = 0;
        }

        return ASN1Result<Oid>::ok(Oid{std::move(arcs)}, content.bytes_consumed);
    }

    ASN1Result<ByteSpan> parse_sequence(ByteSpan input) {
        return parse_universal_content(input, ASN1Tag::Sequence, true, "SEQUENCE");
    }

    ASN1Result<ByteSpan> parse_set(ByteSpan input) {
        return parse_universal_content(input, ASN1Tag::Set, true, "SET");
    }

    ASN1Result<bool> parse_boolean(ByteSpan input) {
        auto content = parse_universal_content(input, ASN1Tag::Boolean, false, "BOOLEAN");
        if (!content.success) {
            return ASN1Result<bool>::failure(content.error);
        }
        if (content.value.size() != 1) {
            return ASN1Result<bool>::failure("BOOLEAN length must be 1");
        }
        return ASN1Result<bool>::ok(content.value[0] != 0, content.bytes_consumed);
    }

    ASN1Result<TaggedView> parse_context_tagged(ByteSpan input) {
        auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<TaggedView>::failure(header.error);
        }
        const auto &id = header.value.identifier;
        if (id.tag_class != ASN1Class::ContextSpecific) {
            return ASN1Result<TaggedView>::failure("expected context-specific tag");
        }
        TaggedView view{id.tag_number, id.constructed, content_of(input, header.value)};
        return ASN1Result<TaggedView>::ok(view, total_of(header.value));
    }

    ASN1Result<TimePoint> parse_time(ByteSpan input) {
        auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<TimePoint>::failure(header.error);
        }
        const auto &id = header.value.identifier;
        const bool utc = id.tag_number == static_cast<uint32_t>(ASN1Tag::UTCTime);
        const bool generalized = id.tag_number == static_cast<uint32_t>(ASN1Tag::GeneralizedTime);
        if (id.tag_class != ASN1Class::Universal || id.constructed || (!utc && !generalized)) {
            return ASN1Result<TimePoint>::failure("expected UTCTime or GeneralizedTime");
        }

        const auto content = content_of(input, header.value);
        const std::string_view text(reinterpret_cast<const char *>(content.data()), content.size());
        // DER mandates seconds and the Z suffix: YYMMDDHHMMSSZ / YYYYMMDDHHMMSSZ.
        const size_t year_digits = utc ? 2 : 4;
        if (text.size() != year_digits + 11 || text.back() != 'Z') {
            return ASN1Result<TimePoint>::failure("malformed time value");
        }

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        size_t pos = 0;
        bool ok = read_digits(text, pos, year_digits, year);
        pos += year_digits;
        ok = ok && read_digits(text, pos, 2, month) && read_digits(text, pos + 2, 2, day) &&
             read_digits(text, pos + 4, 2, hour) && read_digits(text, pos + 6, 2, minute) &&
             read_digits(text, pos + 8, 2, second);
        if (!ok) {
            return ASN1Result<TimePoint>::failure("invalid time digits");
        }
        if (utc) {
            year += (year >= 50) ? 1900 : 2000;
        }

        auto tp = make_time_point(year, month, day, hour, minute, second);
        if (tp.success) {
            tp.bytes_consumed = total_of(header.value);
        }
        return tp;
    }

    ASN1Result<std::string> parse_directory_string(ByteSpan input) {
        auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<std::string>::failure(header.error);
        }
        const auto &id = header.value.identifier;
        if (id.tag_class != ASN1Class::Universal || id.constructed) {
            return ASN1Result<std::string>::failure("directory string invalid tag");
        }
        const auto content = content_of(input, header.value);

        switch (static_cast<ASN1Tag>(id.tag_number)) {
        case ASN1Tag::PrintableString:
        case ASN1Tag::IA5String:
        case ASN1Tag::UTF8String:
        case ASN1Tag::T61String:
            return ASN1Result<std::string>::ok(
                std::string(reinterpret_cast<const char *>(content.data()), content.size()), total_of(header.value));
        case ASN1Tag::BMPString: {
            if (content.size() % 2 != 0) {
                return ASN1Result<std::string>::failure("BMPString must have even length");
            }
            std::string utf8;
            utf8.reserve(content.size());
            for (size_t i = 0; i < content.size(); i += 2) {
                const uint16_t cp = static_cast<uint16_t>((content[i] << 8U) | content[i + 1]);
                if (cp <= 0x7F) {
                    utf8.push_back(static_cast<char>(cp));
                } else if (cp <= 0x7FF) {
                    utf8.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    utf8.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else {
                    utf8.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    utf8.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    utf8.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }
            return ASN1Result<std::string>::ok(std::move(utf8), total_of(header.value));
        }
        default:
            return ASN1Result<std::string>::failure("unsupported directory string tag");
        }
    }

} // namespace slotca::cert
