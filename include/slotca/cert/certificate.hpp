#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <slotca/cert/asn1_common.hpp>
#include <slotca/cert/distinguished_name.hpp>
#include <slotca/cert/public_key.hpp>

namespace slotca::cert {

    struct Validity {
        std::chrono::system_clock::time_point not_before{};
        std::chrono::system_clock::time_point not_after{};
    };

    struct TbsCertificate {
        int version{3};
        std::vector<uint8_t> serial_number;
        DistinguishedName issuer;
        Validity validity{};
        DistinguishedName subject;
        PublicKeyInfo public_key{};
        std::vector<RawExtension> extensions;
    };

    /**
     * Immutable X.509 certificate. Holds the exact DER it was built from or parsed out of,
     * along with the TBSCertificate bytes the signature covers.
     */
    class Certificate {
      public:
        struct Result;

        Certificate() = default;
        Certificate(TbsCertificate tbs, std::vector<uint8_t> signature_algorithm, std::vector<uint8_t> signature,
                    std::vector<uint8_t> der, std::vector<uint8_t> tbs_der);

        static Result parse(ByteSpan der);

        [[nodiscard]] const std::vector<uint8_t> &der() const noexcept { return der_; }
        [[nodiscard]] const std::vector<uint8_t> &tbs_der() const noexcept { return tbs_der_; }
        [[nodiscard]] const std::vector<uint8_t> &signature_algorithm() const noexcept { return signature_algorithm_; }
        [[nodiscard]] const std::vector<uint8_t> &signature() const noexcept { return signature_; }

        [[nodiscard]] int version() const noexcept { return tbs_.version; }
        [[nodiscard]] const std::vector<uint8_t> &serial_number() const noexcept { return tbs_.serial_number; }
        [[nodiscard]] const DistinguishedName &issuer() const noexcept { return tbs_.issuer; }
        [[nodiscard]] const DistinguishedName &subject() const noexcept { return tbs_.subject; }
        [[nodiscard]] const Validity &validity() const noexcept { return tbs_.validity; }
        [[nodiscard]] const PublicKeyInfo &public_key() const noexcept { return tbs_.public_key; }
        [[nodiscard]] const std::vector<RawExtension> &extensions() const noexcept { return tbs_.extensions; }

        [[nodiscard]] const RawExtension *find_extension(ExtensionId id) const;
        [[nodiscard]] size_t count_extensions(ExtensionId id) const;

        // SHA-256 over the whole certificate DER.
        [[nodiscard]] std::vector<uint8_t> fingerprint() const;
        [[nodiscard]] std::string fingerprint_hex() const;

      private:
        TbsCertificate tbs_;
        std::vector<uint8_t> signature_algorithm_;
        std::vector<uint8_t> signature_;
        std::vector<uint8_t> der_;
        std::vector<uint8_t> tbs_der_;
    };

    struct Certificate::Result {
        bool success{};
        Certificate value{};
        std::string error{};

        static Result failure(std::string message) { return Result{false, {}, std::move(message)}; }
        static Result ok(Certificate value) { return Result{true, std::move(value), {}}; }
    };

} // namespace slotca::cert
