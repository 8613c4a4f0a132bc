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

#ifndef CAREGEN_LEAF_ISSUER_HH
#define CAREGEN_LEAF_ISSUER_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/logger.h>

#include "caregen/CertificateAuthority.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  struct LeafCertificate
  {
    std::shared_ptr<Certificate> certificate;
    std::shared_ptr<const PrivateKey> private_key;
    std::shared_ptr<Certificate> issuer;
  };

  struct LeafOptions
  {
    std::string hostname{"localhost"};
    int key_bits{2048};
    int serial_bits{128};
    int validity_years{1};
  };

  /**
   * @brief Issues TLS server certificates under a CA
   */
  class LeafIssuer
  {
  public:
    explicit LeafIssuer(LeafOptions options = {});
    ~LeafIssuer() = default;

    LeafIssuer(const LeafIssuer &) = delete;
    LeafIssuer &operator=(const LeafIssuer &) = delete;
    LeafIssuer(LeafIssuer &&) noexcept = default;
    LeafIssuer &operator=(LeafIssuer &&) noexcept = default;

    /**
     * @brief Generates a key pair and a server certificate signed by issuer
     *
     * @return The leaf, CaError::KeyGenError, CaError::SigningError or
     *         CaError::EncodingError
     */
    outcome::std_result<LeafCertificate> issue(const CertificateAuthority &issuer) const;

  private:
    LeafOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_LEAF_ISSUER_HH
