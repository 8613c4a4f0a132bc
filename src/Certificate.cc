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

#include "caregen/Certificate.hh"

#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "Logging.hh"
#include "OpenSSLUtils.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  namespace
  {
    std::string name_to_string(const X509_NAME *name)
    {
      openssl::BioPtr bio(BIO_new(BIO_s_mem()));
      if (!bio || X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0)
        {
          return {};
        }
      return openssl::bio_to_string(bio.get());
    }

    std::shared_ptr<spdlog::logger> logger()
    {
      static auto logger = Logging::create("caregen:certificate");
      return logger;
    }
  } // namespace

  void Certificate::X509Free::operator()(X509 *cert) const
  {
    X509_free(cert);
  }

  Certificate::Certificate(X509 *cert)
    : cert_(cert)
  {
  }

  Certificate::~Certificate() = default;

  outcome::std_result<std::shared_ptr<Certificate>> Certificate::from_pem(std::string_view pem)
  {
    openssl::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio)
      {
        return CaError::ParseError;
      }

    X509 *cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (cert == nullptr)
      {
        logger()->debug("Failed to parse PEM certificate: {}", openssl::last_error());
        return CaError::ParseError;
      }

    return std::make_shared<Certificate>(cert);
  }

  outcome::std_result<std::shared_ptr<Certificate>> Certificate::from_der(const std::vector<uint8_t> &der)
  {
    const unsigned char *p = der.data();
    const unsigned char *end = p + der.size();

    X509 *cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (cert == nullptr)
      {
        logger()->debug("Failed to parse DER certificate: {}", openssl::last_error());
        return CaError::ParseError;
      }

    auto certificate = std::make_shared<Certificate>(cert);
    if (p != end)
      {
        logger()->debug("Trailing data after DER certificate ({} bytes)", end - p);
        return CaError::ParseError;
      }

    return certificate;
  }

  outcome::std_result<std::shared_ptr<Certificate>> Certificate::from_der(std::string_view der)
  {
    return from_der(std::vector<uint8_t>(der.begin(), der.end()));
  }

  std::string Certificate::to_pem() const
  {
    openssl::BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert_.get()) != 1)
      {
        logger()->error("Failed to encode certificate as PEM: {}", openssl::last_error());
        return {};
      }
    return openssl::bio_to_string(bio.get());
  }

  std::vector<uint8_t> Certificate::to_der() const
  {
    int length = i2d_X509(cert_.get(), nullptr);
    if (length <= 0)
      {
        return {};
      }

    std::vector<uint8_t> der(static_cast<std::size_t>(length));
    unsigned char *p = der.data();
    i2d_X509(cert_.get(), &p);
    return der;
  }

  std::string Certificate::subject() const
  {
    return name_to_string(X509_get_subject_name(cert_.get()));
  }

  std::string Certificate::issuer() const
  {
    return name_to_string(X509_get_issuer_name(cert_.get()));
  }

  std::string Certificate::common_name() const
  {
    const X509_NAME *name = X509_get_subject_name(cert_.get());
    int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (index < 0)
      {
        return {};
      }

    const ASN1_STRING *data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
    unsigned char *utf8 = nullptr;
    int length = ASN1_STRING_to_UTF8(&utf8, data);
    if (length < 0)
      {
        return {};
      }

    std::string result(reinterpret_cast<const char *>(utf8), static_cast<std::size_t>(length));
    OPENSSL_free(utf8);
    return result;
  }

  std::string Certificate::serial_number() const
  {
    openssl::BignumPtr bn(ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert_.get()), nullptr));
    if (!bn)
      {
        return {};
      }

    char *hex = BN_bn2hex(bn.get());
    if (hex == nullptr)
      {
        return {};
      }

    std::string result(hex);
    OPENSSL_free(hex);
    return result;
  }

  std::chrono::system_clock::time_point Certificate::not_before() const
  {
    return openssl::to_time_point(X509_get0_notBefore(cert_.get()));
  }

  std::chrono::system_clock::time_point Certificate::not_after() const
  {
    return openssl::to_time_point(X509_get0_notAfter(cert_.get()));
  }

  std::vector<uint8_t> Certificate::public_key_der() const
  {
    X509_PUBKEY *key = X509_get_X509_PUBKEY(cert_.get());
    int length = i2d_X509_PUBKEY(key, nullptr);
    if (length <= 0)
      {
        return {};
      }

    std::vector<uint8_t> der(static_cast<std::size_t>(length));
    unsigned char *p = der.data();
    i2d_X509_PUBKEY(key, &p);
    return der;
  }

  bool Certificate::same_public_key(const Certificate &other) const
  {
    const EVP_PKEY *key = X509_get0_pubkey(cert_.get());
    const EVP_PKEY *other_key = X509_get0_pubkey(other.get_x509());
    return key != nullptr && other_key != nullptr && EVP_PKEY_eq(key, other_key) == 1;
  }

  std::optional<uint32_t> Certificate::key_usage() const
  {
    if ((X509_get_extension_flags(cert_.get()) & EXFLAG_KUSAGE) == 0)
      {
        return std::nullopt;
      }
    return X509_get_key_usage(cert_.get());
  }

  std::vector<std::string> Certificate::extended_key_usage() const
  {
    std::vector<std::string> result;
    openssl::ExtendedKeyUsagePtr eku(
      static_cast<EXTENDED_KEY_USAGE *>(X509_get_ext_d2i(cert_.get(), NID_ext_key_usage, nullptr, nullptr)));
    if (!eku)
      {
        return result;
      }

    for (int i = 0; i < sk_ASN1_OBJECT_num(eku.get()); ++i)
      {
        result.push_back(openssl::object_to_oid(sk_ASN1_OBJECT_value(eku.get(), i)));
      }
    return result;
  }

  std::vector<std::string> Certificate::dns_names() const
  {
    std::vector<std::string> result;
    openssl::GeneralNamesPtr names(
      static_cast<GENERAL_NAMES *>(X509_get_ext_d2i(cert_.get(), NID_subject_alt_name, nullptr, nullptr)));
    if (!names)
      {
        return result;
      }

    for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); ++i)
      {
        const GENERAL_NAME *name = sk_GENERAL_NAME_value(names.get(), i);
        if (name->type != GEN_DNS)
          {
            continue;
          }
        const ASN1_IA5STRING *dns = name->d.dNSName;
        result.emplace_back(reinterpret_cast<const char *>(ASN1_STRING_get0_data(dns)), static_cast<std::size_t>(ASN1_STRING_length(dns)));
      }
    return result;
  }

  std::optional<std::string> Certificate::subject_key_id() const
  {
    const ASN1_OCTET_STRING *id = X509_get0_subject_key_id(cert_.get());
    if (id == nullptr)
      {
        return std::nullopt;
      }
    return openssl::to_hex(ASN1_STRING_get0_data(id), static_cast<std::size_t>(ASN1_STRING_length(id)));
  }

  std::optional<std::string> Certificate::authority_key_id() const
  {
    const ASN1_OCTET_STRING *id = X509_get0_authority_key_id(cert_.get());
    if (id == nullptr)
      {
        return std::nullopt;
      }
    return openssl::to_hex(ASN1_STRING_get0_data(id), static_cast<std::size_t>(ASN1_STRING_length(id)));
  }

  std::optional<BasicConstraints> Certificate::basic_constraints() const
  {
    int location = X509_get_ext_by_NID(cert_.get(), NID_basic_constraints, -1);
    if (location < 0)
      {
        return std::nullopt;
      }

    BasicConstraints result;
    result.critical = X509_EXTENSION_get_critical(X509_get_ext(cert_.get(), location)) != 0;

    openssl::BasicConstraintsPtr bc(
      static_cast<BASIC_CONSTRAINTS *>(X509_get_ext_d2i(cert_.get(), NID_basic_constraints, nullptr, nullptr)));
    if (!bc)
      {
        logger()->warn("Basic constraints extension of {} cannot be decoded", subject());
        return result;
      }

    result.is_ca = bc->ca != 0;
    if (bc->pathlen != nullptr)
      {
        result.path_length = ASN1_INTEGER_get(bc->pathlen);
      }
    return result;
  }

  bool Certificate::is_ca() const
  {
    auto bc = basic_constraints();
    return bc && bc->is_ca;
  }

  bool Certificate::is_self_signed() const
  {
    return X509_self_signed(cert_.get(), 1) == 1;
  }

  outcome::std_result<void> Certificate::verify_issued_by(const Certificate &issuer) const
  {
    int result = X509_check_issued(issuer.get_x509(), cert_.get());
    if (result != X509_V_OK)
      {
        return make_x509_verify_error(result);
      }

    EVP_PKEY *issuer_key = X509_get0_pubkey(issuer.get_x509());
    if (issuer_key == nullptr || X509_verify(cert_.get(), issuer_key) != 1)
      {
        logger()->debug("Signature of {} does not verify with key of {}: {}", subject(), issuer.subject(), openssl::last_error());
        return make_x509_verify_error(X509_V_ERR_CERT_SIGNATURE_FAILURE);
      }

    return outcome::success();
  }

  X509 *Certificate::get_x509() const
  {
    return cert_.get();
  }

} // namespace caregen
