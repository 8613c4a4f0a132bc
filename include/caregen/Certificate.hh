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

#ifndef CAREGEN_CERTIFICATE_HH
#define CAREGEN_CERTIFICATE_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <openssl/x509.h>

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief Basic constraints extension as found in a certificate
   */
  struct BasicConstraints
  {
    bool critical{false};                 ///< Extension is flagged critical
    bool is_ca{false};                    ///< cA boolean
    std::optional<long> path_length;      ///< pathLenConstraint, if present
  };

  /**
   * @brief Owned, parsed X.509 certificate
   *
   * Certificate wraps an OpenSSL X509 object and offers the read-only views
   * needed to compare an original CA with its regenerated copy: identity,
   * validity, key material and the extensions that influence path building.
   *
   * @par Usage Example
   * @code
   * auto cert = caregen::Certificate::from_pem(pem);
   * if (cert) {
   *     auto bc = cert.value()->basic_constraints();
   *     std::cout << "critical: " << (bc && bc->critical) << std::endl;
   * }
   * @endcode
   */
  class Certificate
  {
  public:
    /**
     * @brief Takes ownership of an OpenSSL certificate
     *
     * @param cert Certificate to adopt, must not be null
     */
    explicit Certificate(X509 *cert);
    ~Certificate();

    Certificate(const Certificate &) = delete;
    Certificate &operator=(const Certificate &) = delete;
    Certificate(Certificate &&) noexcept = default;
    Certificate &operator=(Certificate &&) noexcept = default;

    /**
     * @brief Parses the first PEM CERTIFICATE block
     *
     * @return The certificate, or CaError::ParseError
     */
    static outcome::std_result<std::shared_ptr<Certificate>> from_pem(std::string_view pem);

    /**
     * @brief Parses a DER encoded certificate
     *
     * Trailing bytes after the certificate are rejected.
     *
     * @return The certificate, or CaError::ParseError
     */
    static outcome::std_result<std::shared_ptr<Certificate>> from_der(const std::vector<uint8_t> &der);
    static outcome::std_result<std::shared_ptr<Certificate>> from_der(std::string_view der);

    std::string to_pem() const;
    std::vector<uint8_t> to_der() const;

    /// Subject in RFC 2253 form
    std::string subject() const;
    /// Issuer in RFC 2253 form
    std::string issuer() const;
    std::string common_name() const;

    /// Serial number as upper case hex without leading zeros
    std::string serial_number() const;

    std::chrono::system_clock::time_point not_before() const;
    std::chrono::system_clock::time_point not_after() const;

    /// DER encoded SubjectPublicKeyInfo
    std::vector<uint8_t> public_key_der() const;
    bool same_public_key(const Certificate &other) const;

    /// KU_* bits, empty when the certificate has no key usage extension
    std::optional<uint32_t> key_usage() const;
    /// Dotted OIDs of the extended key usage extension, in encoding order
    std::vector<std::string> extended_key_usage() const;
    std::vector<std::string> dns_names() const;

    std::optional<std::string> subject_key_id() const;
    std::optional<std::string> authority_key_id() const;

    /**
     * @brief Basic constraints of the certificate
     *
     * @return The decoded extension including its criticality, empty when
     *         the certificate does not carry one
     */
    std::optional<BasicConstraints> basic_constraints() const;

    bool is_ca() const;

    /**
     * @brief Checks the certificate is self-signed
     *
     * Issuer must equal subject and the signature must verify with the
     * certificate's own public key.
     */
    bool is_self_signed() const;

    /**
     * @brief Checks this certificate was issued by issuer
     *
     * Compares names and key identifiers and verifies the signature with the
     * issuer's public key.
     *
     * @return Success, or an x509-verify error describing the mismatch
     */
    outcome::std_result<void> verify_issued_by(const Certificate &issuer) const;

    /**
     * @brief Underlying OpenSSL certificate
     *
     * @warning Non-owning; valid for the lifetime of this Certificate.
     */
    X509 *get_x509() const;

  private:
    struct X509Free
    {
      void operator()(X509 *cert) const;
    };

    std::unique_ptr<X509, X509Free> cert_;
  };

} // namespace caregen

#endif // CAREGEN_CERTIFICATE_HH
