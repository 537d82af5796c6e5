#include <slotca/cert/asn1_writer.hpp>

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace slotca::cert::der {

    namespace {

        // Base-128, most significant group first, continuation bit on all but the last.
        void append_base128(std::vector<uint8_t> &out, uint32_t value) {
            std::array<uint8_t, 5> buffer{};
            size_t idx = buffer.size() - 1;
            buffer[idx] = static_cast<uint8_t>(value & 0x7FU);
            value >>= 7U;
            while (value > 0) {
                buffer[--idx] = static_cast<uint8_t>((value & 0x7FU) | 0x80U);
                value >>= 7U;
            }
            out.insert(out.end(), buffer.begin() + static_cast<std::ptrdiff_t>(idx), buffer.end());
        }

        void append_identifier(std::vector<uint8_t> &out, ASN1Class cls, bool constructed, uint32_t tag) {
            uint8_t first = static_cast<uint8_t>(cls) | (constructed ? 0x20U : 0x00U);
            if (tag < 31) {
                out.push_back(static_cast<uint8_t>(first | tag));
                return;
            }
            out.push_back(static_cast<uint8_t>(first | 0x1FU));
            append_base128(out, tag);
        }

        void append_length(std::vector<uint8_t> &out, size_t length) {
            if (length < 0x80U) {
                out.push_back(static_cast<uint8_t>(length));
                return;
            }
            std::array<uint8_t, sizeof(size_t)> buffer{};
            size_t idx = buffer.size();
            while (length > 0) {
                buffer[--idx] = static_cast<uint8_t>(length & 0xFFU);
                length >>= 8U;
            }
            out.push_back(static_cast<uint8_t>(0x80U | (buffer.size() - idx)));
            out.insert(out.end(), buffer.begin() + static_cast<std::ptrdiff_t>(idx), buffer.end());
        }

        std::vector<uint8_t> encode_string(std::string_view str, ASN1Tag tag) {
            ByteSpan bytes(reinterpret_cast<const uint8_t *>(str.data()), str.size());
            return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(tag), bytes);
        }

        std::string format_time(const std::tm &tm, bool utc_time) {
            std::ostringstream oss;
            oss << std::setfill('0');
            if (utc_time) {
                oss << std::setw(2) << ((tm.tm_year + 1900) % 100);
            } else {
                oss << std::setw(4) << (tm.tm_year + 1900);
            }
            oss << std::setw(2) << (tm.tm_mon + 1) << std::setw(2) << tm.tm_mday << std::setw(2) << tm.tm_hour
                << std::setw(2) << tm.tm_min << std::setw(2) << tm.tm_sec << 'Z';
            return oss.str();
        }

    } // namespace

    std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts) {
        size_t total = 0;
        for (const auto &part : parts) {
            total += part.size();
        }
        std::vector<uint8_t> out;
        out.reserve(total);
        for (const auto &part : parts) {
            out.insert(out.end(), part.begin(), part.end());
        }
        return out;
    }

    std::vector<uint8_t> encode_tlv(ASN1Class cls, bool constructed, uint32_t tag, ByteSpan content) {
        std::vector<uint8_t> out;
        out.reserve(content.size() + 6);
        append_identifier(out, cls, constructed, tag);
        append_length(out, content.size());
        out.insert(out.end(), content.begin(), content.end());
        return out;
    }

    std::vector<uint8_t> encode_sequence(const std::vector<uint8_t> &content) {
        return encode_tlv(ASN1Class::Universal, true, static_cast<uint32_t>(ASN1Tag::Sequence), content);
    }

    std::vector<uint8_t> encode_set(const std::vector<uint8_t> &content) {
        return encode_tlv(ASN1Class::Universal, true, static_cast<uint32_t>(ASN1Tag::Set), content);
    }

    // Value is an unsigned big-endian magnitude.
    std::vector<uint8_t> encode_integer(const std::vector<uint8_t> &value) {
        size_t start = 0;
        while (start + 1 < value.size() && value[start] == 0x00) {
            ++start;
        }
        std::vector<uint8_t> content;
        if (value.empty() || (value[start] & 0x80U) != 0) {
            content.push_back(0x00);
        }
        content.insert(content.end(), value.begin() + static_cast<std::ptrdiff_t>(start), value.end());
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::Integer), content);
    }

    std::vector<uint8_t> encode_integer(uint64_t value) {
        std::vector<uint8_t> buffer;
        do {
            buffer.insert(buffer.begin(), static_cast<uint8_t>(value & 0xFFU));
            value >>= 8U;
        } while (value);
        return encode_integer(buffer);
    }

    std::vector<uint8_t> encode_bit_string(ByteSpan bits, uint8_t unused_bits) {
        std::vector<uint8_t> content;
        content.reserve(bits.size() + 1);
        content.push_back(unused_bits);
        content.insert(content.end(), bits.begin(), bits.end());
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::BitString), content);
    }

    std::vector<uint8_t> encode_octet_string(ByteSpan bytes) {
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::OctetString), bytes);
    }

    std::vector<uint8_t> encode_boolean(bool value) {
        const uint8_t byte = value ? 0xFF : 0x00;
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::Boolean), ByteSpan(&byte, 1));
    }

    std::vector<uint8_t> encode_null() { return {static_cast<uint8_t>(ASN1Tag::Null), 0x00}; }

    std::vector<uint8_t> encode_oid(const Oid &oid) {
        std::vector<uint8_t> body;
        if (oid.nodes.size() < 2) {
            body.push_back(0);
        } else {
            append_base128(body, (oid.nodes[0] * 40U) + oid.nodes[1]);
            for (size_t i = 2; i < oid.nodes.size(); ++i) {
                append_base128(body, oid.nodes[i]);
            }
        }
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::ObjectIdentifier), body);
    }

    std::vector<uint8_t> encode_utf8_string(std::string_view str) { return encode_string(str, ASN1Tag::UTF8String); }

    std::vector<uint8_t> encode_printable_string(std::string_view str) {
        return encode_string(str, ASN1Tag::PrintableString);
    }

    std::vector<uint8_t> encode_explicit(uint32_t tag, const std::vector<uint8_t> &inner) {
        return encode_tlv(ASN1Class::ContextSpecific, true, tag, inner);
    }

    std::vector<uint8_t> encode_implicit(uint32_t tag, ByteSpan content, bool constructed) {
        return encode_tlv(ASN1Class::ContextSpecific, constructed, tag, content);
    }

    // RFC 5280 4.1.2.5: UTCTime through 2049, GeneralizedTime afterwards.
    std::vector<uint8_t> serialize_time(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        const int year = tm.tm_year + 1900;
        const bool use_utc = (year >= 1950 && year <= 2049);
        return encode_string(format_time(tm, use_utc), use_utc ? ASN1Tag::UTCTime : ASN1Tag::GeneralizedTime);
    }

} // namespace slotca::cert::der
