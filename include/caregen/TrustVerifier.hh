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

#ifndef CAREGEN_TRUST_VERIFIER_HH
#define CAREGEN_TRUST_VERIFIER_HH

#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <spdlog/logger.h>

#include "caregen/Certificate.hh"
#include "caregen/Endpoint.hh"

namespace caregen
{
  enum class TrustFailure
  {
    None,
    UnknownAuthority,
    InvalidCertificate,
    HostnameMismatch,
    HandshakeFailed,
    ConnectionRefused,
    Timeout,
    RequestFailed,
  };

  std::string to_string(TrustFailure failure);

  /**
   * @brief Result of one TLS client attempt against the server
   *
   * An accepted outcome carries the HTTP status and body. A rejected outcome
   * carries a CaError (HandshakeError, RequestError or TimeoutError), the
   * failure class and the underlying cause text.
   */
  struct VerificationOutcome
  {
    std::string label;
    bool accepted{false};
    unsigned status{0};
    std::string body;

    std::error_code error;
    TrustFailure failure{TrustFailure::None};
    long verify_result{0}; ///< X509_V_OK or an X509_V_ERR_* code
    std::string cause;

    std::string message() const;
  };

  /**
   * @brief Connects to a TLS endpoint trusting exactly one CA
   *
   * Each call performs a single attempt: resolve, connect, handshake with
   * peer and host name verification, one GET request, and reading the full
   * response, all under one deadline. Failures are reported in the returned
   * outcome, never as errors of the call itself.
   */
  class TrustVerifier
  {
  public:
    explicit TrustVerifier(Endpoint endpoint, std::chrono::milliseconds timeout = std::chrono::seconds(10));
    ~TrustVerifier() = default;

    TrustVerifier(const TrustVerifier &) = delete;
    TrustVerifier &operator=(const TrustVerifier &) = delete;
    TrustVerifier(TrustVerifier &&) noexcept = default;
    TrustVerifier &operator=(TrustVerifier &&) noexcept = default;

    VerificationOutcome verify(const std::shared_ptr<Certificate> &ca, const std::string &label) const;

    const Endpoint &endpoint() const;

  private:
    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_TRUST_VERIFIER_HH
