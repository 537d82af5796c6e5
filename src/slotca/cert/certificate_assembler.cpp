#include <slotca/cert/certificate_assembler.hpp>

#include <algorithm>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/sign/digest_formatter.hpp>
#include <slotca/utils/sodium_utils.hpp>

namespace slotca::cert {

    namespace {

        constexpr size_t kSerialLength = 16;

        void append(std::vector<RawExtension> &out, const std::optional<RawExtension> &ext) {
            if (ext) {
                out.push_back(*ext);
            }
        }

        std::vector<uint8_t> encode_tbs(const TbsCertificate &tbs, const std::vector<uint8_t> &signature_algorithm) {
            std::vector<std::vector<uint8_t>> fields;
            fields.push_back(der::encode_explicit(0, der::encode_integer(static_cast<uint64_t>(tbs.version - 1))));
            fields.push_back(der::encode_integer(tbs.serial_number));
            fields.push_back(signature_algorithm);
            fields.push_back(tbs.issuer.der());
            auto not_before = der::serialize_time(tbs.validity.not_before);
            auto not_after = der::serialize_time(tbs.validity.not_after);
            fields.push_back(der::encode_sequence(der::concat({not_before, not_after})));
            fields.push_back(tbs.subject.der());
            fields.push_back(tbs.public_key.spki_der);
            if (!tbs.extensions.empty()) {
                fields.push_back(der::encode_explicit(3, encode_extension_list(tbs.extensions)));
            }
            return der::encode_sequence(der::concat(fields));
        }

    } // namespace

    const char *draft_state_name(DraftState state) {
        switch (state) {
        case DraftState::Draft:
            return "Draft";
        case DraftState::ExtensionsApplied:
            return "ExtensionsApplied";
        case DraftState::ToBeSignedEncoded:
            return "ToBeSignedEncoded";
        case DraftState::Signed:
            return "Signed";
        case DraftState::Finalized:
            return "Finalized";
        case DraftState::Aborted:
            return "Aborted";
        }
        return "Unknown";
    }

    ExtensionSet ExtensionSet::merge(const FilteredExtensions &filtered, const AuthorityLinkage &linkage) {
        ExtensionSet set{};
        set.key_usage = filtered.key_usage;
        set.extended_key_usage = filtered.extended_key_usage;
        set.authority_key_identifier = linkage.authority_key_identifier;
        set.authority_info_access = linkage.authority_info_access;
        set.crl_distribution_points = linkage.crl_distribution_points;
        return set;
    }

    std::vector<RawExtension> ExtensionSet::ordered() const {
        std::vector<RawExtension> out;
        append(out, key_usage);
        append(out, extended_key_usage);
        append(out, authority_key_identifier);
        append(out, authority_info_access);
        append(out, crl_distribution_points);
        append(out, basic_constraints);
        append(out, subject_key_identifier);
        return out;
    }

    std::vector<uint8_t> generate_serial_number() {
        auto serial = utils::random_bytes(kSerialLength);
        serial[0] = static_cast<uint8_t>(serial[0] & 0x7FU);
        return serial;
    }

    uint32_t max_validity_days(std::chrono::system_clock::time_point now) {
        using namespace std::chrono;
        const sys_seconds start = floor<seconds>(now);
        const sys_seconds clock_limit = floor<seconds>(system_clock::time_point::max());
        const sys_seconds format_limit = sys_days{year{9999} / December / 31} + hours(23) + minutes(59) + seconds(59);
        const sys_seconds limit = std::min(clock_limit, format_limit);
        if (start >= limit) {
            return 0;
        }
        const int64_t room = floor<days>(limit - start).count();
        return static_cast<uint32_t>(std::min<int64_t>(room, std::numeric_limits<uint32_t>::max()));
    }

    IssuanceResult<CertificateDraft> CertificateDraft::create(DistinguishedName subject, PublicKeyInfo public_key,
                                                              DistinguishedName issuer, uint32_t validity_days,
                                                              std::chrono::system_clock::time_point now) {
        using Result = IssuanceResult<CertificateDraft>;
        if (subject.empty()) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft, "subject name is empty");
        }
        if (public_key.empty() || public_key.algorithm == KeyAlgorithm::Unknown) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft, "subject public key missing");
        }
        if (issuer.empty()) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft, "issuer name is empty");
        }
        if (validity_days == 0) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft, "validity period must be positive");
        }
        if (validity_days > max_validity_days(now)) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft,
                                   "validity period of " + std::to_string(validity_days) + " days is out of range");
        }

        // DER drops leading zero octets; keep the serial exactly as it will be encoded.
        auto serial = generate_serial_number();
        serial.erase(serial.begin(), std::find_if(serial.begin(), serial.end() - 1, [](uint8_t b) { return b != 0; }));

        CertificateDraft draft;
        draft.tbs_.version = 3;
        draft.tbs_.serial_number = std::move(serial);
        draft.tbs_.subject = std::move(subject);
        draft.tbs_.public_key = std::move(public_key);
        draft.tbs_.issuer = std::move(issuer);
        const auto start = std::chrono::floor<std::chrono::seconds>(now);
        draft.tbs_.validity.not_before = start;
        draft.tbs_.validity.not_after = start + std::chrono::hours(24) * validity_days;

        spdlog::info("[CertificateDraft] Draft for {} issued by {}, serial {}, valid {} days",
                     draft.tbs_.subject.to_string(), draft.tbs_.issuer.to_string(),
                     utils::to_hex(draft.tbs_.serial_number), validity_days);
        return Result::ok(std::move(draft));
    }

    std::optional<IssuanceError> CertificateDraft::apply_extensions(ExtensionSet extensions) {
        if (auto err = expect_state(DraftState::Draft, Stage::ExtensionsApplied)) {
            return err;
        }
        if (!extensions.authority_key_identifier) {
            return fail(ErrorCode::InvalidRequest, Stage::ExtensionsApplied, "authority key identifier missing");
        }
        tbs_.extensions = extensions.ordered();
        state_ = DraftState::ExtensionsApplied;
        spdlog::debug("[CertificateDraft] {} extensions applied", tbs_.extensions.size());
        return std::nullopt;
    }

    std::optional<IssuanceError> CertificateDraft::encode_to_be_signed(const sign::SigningKeyHandle &handle,
                                                                       const sign::SignatureScheme &scheme,
                                                                       std::string_view digest_name) {
        if (auto err = expect_state(DraftState::ExtensionsApplied, Stage::ToBeSignedEncoded)) {
            return err;
        }
        auto digest = hash::algorithm_from_name(digest_name);
        if (!digest) {
            return fail(ErrorCode::UnsupportedDigest, Stage::ToBeSignedEncoded,
                        "unsupported digest algorithm '" + std::string(digest_name) + "'");
        }
        if (handle.algorithm != sign::scheme_key_algorithm(scheme)) {
            return fail(ErrorCode::UnsupportedAlgorithm, Stage::ToBeSignedEncoded,
                        std::string(sign::scheme_name(scheme)) + " cannot be used with a " +
                            key_algorithm_name(handle.algorithm) + " key");
        }

        scheme_ = scheme;
        digest_ = *digest;
        signature_algorithm_ = sign::encode_algorithm_identifier(scheme, digest_);
        tbs_der_ = encode_tbs(tbs_, signature_algorithm_);
        state_ = DraftState::ToBeSignedEncoded;
        spdlog::debug("[CertificateDraft] TBSCertificate encoded, {} bytes, {} with {}", tbs_der_.size(),
                      sign::scheme_name(scheme), hash::algorithm_name(digest_));
        return std::nullopt;
    }

    std::optional<IssuanceError> CertificateDraft::sign(sign::Signer &signer, const sign::SigningKeyHandle &handle) {
        if (auto err = expect_state(DraftState::ToBeSignedEncoded, Stage::Signed)) {
            return err;
        }

        auto formatted = sign::DigestFormatter::format(handle, *scheme_, digest_, tbs_der_);
        if (!formatted.success) {
            return fail(formatted.code.value_or(ErrorCode::UnsupportedAlgorithm), Stage::Signed,
                        formatted.error_message);
        }

        spdlog::info("[CertificateDraft] Requesting signature from slot {:#04x}", handle.slot);
        auto signed_bytes = signer.sign(handle, formatted.data);
        if (!signed_bytes.success) {
            return fail(signed_bytes.code.value_or(ErrorCode::DeviceError), Stage::Signed, signed_bytes.error_message);
        }
        if (signed_bytes.signature.empty()) {
            return fail(ErrorCode::DeviceError, Stage::Signed, "signer returned an empty signature");
        }

        signature_ = std::move(signed_bytes.signature);
        state_ = DraftState::Signed;
        return std::nullopt;
    }

    IssuanceResult<Certificate> CertificateDraft::finalize() {
        if (auto err = expect_state(DraftState::Signed, Stage::Finalized)) {
            return IssuanceResult<Certificate>::failure(*err);
        }

        auto encoded =
            der::encode_sequence(der::concat({tbs_der_, signature_algorithm_, der::encode_bit_string(signature_)}));
        Certificate certificate(tbs_, signature_algorithm_, signature_, std::move(encoded), tbs_der_);
        state_ = DraftState::Finalized;

        spdlog::info("[CertificateDraft] Issued certificate serial {} fingerprint {}",
                     utils::to_hex(certificate.serial_number()), certificate.fingerprint_hex());
        return IssuanceResult<Certificate>::ok(std::move(certificate));
    }

    void CertificateDraft::abort(IssuanceError error) {
        if (state_ == DraftState::Finalized || state_ == DraftState::Aborted) {
            return;
        }
        spdlog::error("[CertificateDraft] Issuance of serial {} aborted: {}", utils::to_hex(tbs_.serial_number),
                      error.to_string());
        state_ = DraftState::Aborted;
        abort_reason_ = std::move(error);
        tbs_.extensions.clear();
        tbs_der_.clear();
        signature_.clear();
        signature_algorithm_.clear();
        scheme_.reset();
    }

    std::optional<IssuanceError> CertificateDraft::expect_state(DraftState expected, Stage step) {
        if (state_ == expected) {
            return std::nullopt;
        }
        std::string message = std::string("cannot enter ") + stage_name(step) + " from " + draft_state_name(state_);
        if (state_ == DraftState::Finalized || state_ == DraftState::Aborted) {
            return IssuanceError{ErrorCode::InvalidState, step, std::move(message)};
        }
        return fail(ErrorCode::InvalidState, step, std::move(message));
    }

    IssuanceError CertificateDraft::fail(ErrorCode code, Stage step, std::string message) {
        IssuanceError error{code, step, std::move(message)};
        abort(error);
        return error;
    }

} // namespace slotca::cert
