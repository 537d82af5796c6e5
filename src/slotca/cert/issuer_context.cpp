#include <slotca/cert/issuer_context.hpp>

#include <spdlog/spdlog.h>

#include <slotca/cert/extensions.hpp>

namespace slotca::cert {

    IssuerContext::Result IssuerContext::from_certificate(const Certificate &certificate) {
        if (certificate.subject().empty()) {
            return Result::failure("issuer certificate has an empty subject");
        }
        if (certificate.public_key().algorithm == KeyAlgorithm::Unknown) {
            return Result::failure("issuer certificate has no usable public key");
        }

        IssuerContext context{};
        context.subject = certificate.subject();
        context.serial_number = certificate.serial_number();
        context.public_key = certificate.public_key();

        if (const auto *ski = certificate.find_extension(ExtensionId::SubjectKeyIdentifier)) {
            context.subject_key_identifier = decode_key_identifier(ski->value);
            if (!context.subject_key_identifier) {
                spdlog::warn("[IssuerContext] Ignoring malformed SubjectKeyIdentifier on {}",
                             certificate.subject().to_string());
            }
        }

        spdlog::debug("[IssuerContext] Issuer {} ({} {} bit), SKI {}", context.subject.to_string(),
                      key_algorithm_name(context.public_key.algorithm), context.public_key.key_size_bits,
                      context.subject_key_identifier ? "present" : "absent");
        return Result::ok(std::move(context));
    }

    IssuerContext::Result IssuerContext::from_certificate(ByteSpan der) {
        auto parsed = Certificate::parse(der);
        if (!parsed.success) {
            return Result::failure("issuer certificate: " + parsed.error);
        }
        return from_certificate(parsed.value);
    }

} // namespace slotca::cert
