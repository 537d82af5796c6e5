#pragma once

// Umbrella header: CSR and CA certificate issuance against a hardware-held key.

#include <slotca/cert/asn1_common.hpp>
#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/authority_linkage.hpp>
#include <slotca/cert/certificate.hpp>
#include <slotca/cert/certificate_assembler.hpp>
#include <slotca/cert/csr_builder.hpp>
#include <slotca/cert/distinguished_name.hpp>
#include <slotca/cert/extension_policy.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/cert/issuer_context.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/cert/public_key.hpp>
#include <slotca/cert/signing_request.hpp>
#include <slotca/hash/digest.hpp>
#include <slotca/issuance.hpp>
#include <slotca/issuance_error.hpp>
#include <slotca/sign/digest_formatter.hpp>
#include <slotca/sign/signature_scheme.hpp>
#include <slotca/sign/signer.hpp>
#include <slotca/utils/sodium_utils.hpp>
