#pragma once

#include <string>
#include <utility>
#include <vector>

#include <slotca/cert/asn1_common.hpp>
#include <slotca/cert/distinguished_name.hpp>
#include <slotca/cert/public_key.hpp>

namespace slotca::cert {

    // Decoded PKCS#10 request. Untrusted input: its extensions only reach a certificate
    // through the extension policy.
    struct SigningRequest {
        DistinguishedName subject;
        PublicKeyInfo public_key{};
        std::vector<RawExtension> requested_extensions;
    };

    struct SigningRequestResult {
        bool success{};
        SigningRequest value{};
        std::string error{};

        static SigningRequestResult failure(std::string message) {
            return SigningRequestResult{false, {}, std::move(message)};
        }
        static SigningRequestResult ok(SigningRequest request) {
            return SigningRequestResult{true, std::move(request), {}};
        }
    };

    /**
     * Parses a DER CertificationRequest and collects the extensions from its PKCS#9
     * extensionRequest attribute. Other attributes are skipped. The request signature
     * is not checked.
     */
    SigningRequestResult parse_signing_request(ByteSpan der);

} // namespace slotca::cert
