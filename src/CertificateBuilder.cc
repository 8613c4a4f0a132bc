// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "CertificateBuilder.hh"

#include <array>
#include <utility>
#include <openssl/objects.h>

#include "caregen/Errors.hh"

namespace caregen
{
  CertificateBuilder::CertificateBuilder(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
  {
  }

  outcome::std_result<void> CertificateBuilder::init()
  {
    cert_.reset(X509_new());
    if (!cert_ || X509_set_version(cert_.get(), X509_VERSION_3) != 1)
      {
        logger_->error("Failed to create certificate: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_serial_number(const ASN1_INTEGER *serial)
  {
    openssl::Asn1IntegerPtr copy(ASN1_INTEGER_dup(serial));
    if (!copy || X509_set_serialNumber(cert_.get(), copy.get()) != 1)
      {
        logger_->error("Failed to set serial number: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_random_serial_number(int bits, const ASN1_INTEGER *avoid)
  {
    openssl::BignumPtr bn(BN_new());
    if (!bn)
      {
        return CaError::SigningError;
      }

    constexpr int max_attempts = 8;
    for (int attempt = 0; attempt < max_attempts; ++attempt)
      {
        if (BN_rand(bn.get(), bits, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1)
          {
            logger_->error("Failed to generate serial number: {}", openssl::last_error());
            return CaError::SigningError;
          }

        openssl::Asn1IntegerPtr serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
        if (!serial)
          {
            logger_->error("Failed to convert serial number: {}", openssl::last_error());
            return CaError::SigningError;
          }

        if (BN_is_zero(bn.get()) || (avoid != nullptr && ASN1_INTEGER_cmp(serial.get(), avoid) == 0))
          {
            continue;
          }

        return set_serial_number(serial.get());
      }

    logger_->error("Failed to generate a usable serial number after {} attempts", max_attempts);
    return CaError::SigningError;
  }

  outcome::std_result<void> CertificateBuilder::set_validity(const ASN1_TIME *not_before, const ASN1_TIME *not_after)
  {
    if (X509_set1_notBefore(cert_.get(), not_before) != 1 || X509_set1_notAfter(cert_.get(), not_after) != 1)
      {
        logger_->error("Failed to copy validity: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_validity(std::chrono::system_clock::time_point not_before,
                                                             std::chrono::system_clock::time_point not_after)
  {
    if (ASN1_TIME_set(X509_getm_notBefore(cert_.get()), std::chrono::system_clock::to_time_t(not_before)) == nullptr
        || ASN1_TIME_set(X509_getm_notAfter(cert_.get()), std::chrono::system_clock::to_time_t(not_after)) == nullptr)
      {
        logger_->error("Failed to set validity: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_subject(const X509_NAME *name)
  {
    if (X509_set_subject_name(cert_.get(), name) != 1)
      {
        logger_->error("Failed to set subject: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_subject_common_name(const std::string &common_name)
  {
    openssl::X509NamePtr name(X509_NAME_new());
    if (!name
        || X509_NAME_add_entry_by_NID(name.get(),
                                      NID_commonName,
                                      MBSTRING_UTF8,
                                      reinterpret_cast<const unsigned char *>(common_name.c_str()),
                                      -1,
                                      -1,
                                      0)
             != 1)
      {
        logger_->error("Failed to build subject CN={}: {}", common_name, openssl::last_error());
        return CaError::SigningError;
      }
    return set_subject(name.get());
  }

  outcome::std_result<void> CertificateBuilder::set_issuer(const X509_NAME *name)
  {
    if (X509_set_issuer_name(cert_.get(), name) != 1)
      {
        logger_->error("Failed to set issuer: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::set_public_key(EVP_PKEY *pkey)
  {
    if (X509_set_pubkey(cert_.get(), pkey) != 1)
      {
        logger_->error("Failed to set public key: {}", openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::add_extension(int nid, const std::string &value, X509 *issuer)
  {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer != nullptr ? issuer : cert_.get(), cert_.get(), nullptr, nullptr, 0);

    openssl::X509ExtensionPtr extension(X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str()));
    if (!extension)
      {
        logger_->error("Failed to create extension {}={}: {}", OBJ_nid2sn(nid), value, openssl::last_error());
        return CaError::SigningError;
      }

    if (X509_add_ext(cert_.get(), extension.get(), -1) != 1)
      {
        logger_->error("Failed to add extension {}: {}", OBJ_nid2sn(nid), openssl::last_error());
        return CaError::SigningError;
      }
    return outcome::success();
  }

  outcome::std_result<void> CertificateBuilder::add_extended_key_usage(const std::vector<std::string> &oids)
  {
    if (oids.empty())
      {
        return outcome::success();
      }

    std::string value;
    for (const auto &oid: oids)
      {
        if (!value.empty())
          {
            value += ",";
          }
        value += oid;
      }
    return add_extension(NID_ext_key_usage, value);
  }

  outcome::std_result<std::shared_ptr<Certificate>> CertificateBuilder::sign(EVP_PKEY *signing_key, const EVP_MD *digest)
  {
    if (X509_sign(cert_.get(), signing_key, digest) <= 0)
      {
        logger_->error("Failed to sign certificate: {}", openssl::last_error());
        return CaError::SigningError;
      }

    int length = i2d_X509(cert_.get(), nullptr);
    if (length <= 0)
      {
        logger_->error("Failed to encode signed certificate: {}", openssl::last_error());
        return CaError::EncodingError;
      }

    std::vector<uint8_t> der(static_cast<std::size_t>(length));
    unsigned char *p = der.data();
    i2d_X509(cert_.get(), &p);

    auto certificate = Certificate::from_der(der);
    if (!certificate)
      {
        logger_->error("Failed to parse signed certificate: {}", certificate.error().message());
        return CaError::EncodingError;
      }
    return certificate.value();
  }

  X509 *CertificateBuilder::get_x509() const
  {
    return cert_.get();
  }

  std::string CertificateBuilder::key_usage_names(uint32_t key_usage)
  {
    static const std::array<std::pair<uint32_t, const char *>, 9> names{{
      {KU_DIGITAL_SIGNATURE, "digitalSignature"},
      {KU_NON_REPUDIATION, "nonRepudiation"},
      {KU_KEY_ENCIPHERMENT, "keyEncipherment"},
      {KU_DATA_ENCIPHERMENT, "dataEncipherment"},
      {KU_KEY_AGREEMENT, "keyAgreement"},
      {KU_KEY_CERT_SIGN, "keyCertSign"},
      {KU_CRL_SIGN, "cRLSign"},
      {KU_ENCIPHER_ONLY, "encipherOnly"},
      {KU_DECIPHER_ONLY, "decipherOnly"},
    }};

    std::string result;
    for (const auto &[bit, name]: names)
      {
        if ((key_usage & bit) == 0)
          {
            continue;
          }
        if (!result.empty())
          {
            result += ",";
          }
        result += name;
      }
    return result;
  }

  const EVP_MD *CertificateBuilder::signature_digest(const X509 *cert)
  {
    int digest_nid = NID_undef;
    int key_nid = NID_undef;
    if (OBJ_find_sigid_algs(X509_get_signature_nid(cert), &digest_nid, &key_nid) == 1 && digest_nid != NID_undef)
      {
        const EVP_MD *digest = EVP_get_digestbynid(digest_nid);
        if (digest != nullptr)
          {
            return digest;
          }
      }
    return EVP_sha256();
  }

} // namespace caregen
