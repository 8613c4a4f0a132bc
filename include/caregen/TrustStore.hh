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

#ifndef CAREGEN_TRUST_STORE_HH
#define CAREGEN_TRUST_STORE_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>
#include <spdlog/logger.h>

#include "caregen/Certificate.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief Trust anchors consisting of exactly one CA certificate
   */
  class TrustStore
  {
  public:
    explicit TrustStore(std::shared_ptr<Certificate> anchor);
    ~TrustStore() = default;

    TrustStore(const TrustStore &) = delete;
    TrustStore &operator=(const TrustStore &) = delete;
    TrustStore(TrustStore &&) noexcept = default;
    TrustStore &operator=(TrustStore &&) noexcept = default;

    /**
     * @brief Validates the path from certificate to the anchor
     *
     * Validation uses the TLS server purpose. When hostname is not empty the
     * certificate must also match it.
     *
     * @return Success, or an error of x509_verify_category() holding the
     *         OpenSSL verify result
     */
    outcome::std_result<void> verify(const Certificate &certificate, const std::string &hostname = {}) const;

    /// Makes the anchor the only trusted CA of a TLS client context
    outcome::std_result<void> install(SSL_CTX *ctx) const;

    const std::shared_ptr<Certificate> &anchor() const;

  private:
    X509_STORE *build_store() const;

  private:
    std::shared_ptr<Certificate> anchor_;
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_TRUST_STORE_HH
