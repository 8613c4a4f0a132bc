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

#ifndef CAREGEN_CERTIFICATE_BUILDER_HH
#define CAREGEN_CERTIFICATE_BUILDER_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "OpenSSLUtils.hh"
#include "caregen/Certificate.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief Assembles and signs a v3 certificate
   *
   * Every setter reports CaError::SigningError on failure, the error class
   * for "certificate construction or signing failed".
   */
  class CertificateBuilder
  {
  public:
    explicit CertificateBuilder(std::shared_ptr<spdlog::logger> logger);
    ~CertificateBuilder() = default;

    CertificateBuilder(const CertificateBuilder &) = delete;
    CertificateBuilder &operator=(const CertificateBuilder &) = delete;
    CertificateBuilder(CertificateBuilder &&) noexcept = default;
    CertificateBuilder &operator=(CertificateBuilder &&) noexcept = default;

    // Version
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.1
    outcome::std_result<void> init();

    // Serial Number
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.2
    outcome::std_result<void> set_serial_number(const ASN1_INTEGER *serial);
    outcome::std_result<void> set_random_serial_number(int bits, const ASN1_INTEGER *avoid = nullptr);

    // Validity
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.5
    outcome::std_result<void> set_validity(const ASN1_TIME *not_before, const ASN1_TIME *not_after);
    outcome::std_result<void> set_validity(std::chrono::system_clock::time_point not_before, std::chrono::system_clock::time_point not_after);

    // Subject and Issuer
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.4
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.6
    outcome::std_result<void> set_subject(const X509_NAME *name);
    outcome::std_result<void> set_subject_common_name(const std::string &common_name);
    outcome::std_result<void> set_issuer(const X509_NAME *name);

    // Subject Public Key Info
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.7
    outcome::std_result<void> set_public_key(EVP_PKEY *pkey);

    /**
     * @brief Adds an extension from its openssl.cnf style value
     *
     * A value starting with "critical," marks the extension critical.
     * Extensions that refer to the issuer (authorityKeyIdentifier) use
     * issuer, the certificate under construction when null.
     */
    outcome::std_result<void> add_extension(int nid, const std::string &value, X509 *issuer = nullptr);

    // Extended Key Usage
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.12
    outcome::std_result<void> add_extended_key_usage(const std::vector<std::string> &oids);

    /**
     * @brief Signs the certificate and parses the signed encoding back
     *
     * @return The signed certificate, CaError::SigningError when signing
     *         fails, CaError::EncodingError when the result cannot be parsed
     */
    outcome::std_result<std::shared_ptr<Certificate>> sign(EVP_PKEY *signing_key, const EVP_MD *digest);

    X509 *get_x509() const;

    /// openssl.cnf names for the KU_* bits set in key_usage
    static std::string key_usage_names(uint32_t key_usage);

    /// Digest of the signature algorithm of cert, SHA-256 when it has none
    static const EVP_MD *signature_digest(const X509 *cert);

  private:
    std::shared_ptr<spdlog::logger> logger_;
    openssl::X509Ptr cert_;
  };

} // namespace caregen

#endif // CAREGEN_CERTIFICATE_BUILDER_HH
