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

#ifndef CAREGEN_CA_REGENERATOR_HH
#define CAREGEN_CA_REGENERATOR_HH

#include <memory>
#include <boost/outcome/std_result.hpp>
#include <spdlog/logger.h>

#include "caregen/CertificateAuthority.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief What the regenerated certificate actually carries
   */
  struct BasicConstraintsReport
  {
    bool present{false};
    bool critical{false};
    bool is_ca{false};
  };

  struct RegeneratedAuthority
  {
    CertificateAuthority authority;            ///< New certificate, original key
    std::shared_ptr<Certificate> original;     ///< Certificate it was derived from
    BasicConstraintsReport basic_constraints;  ///< Observed in the emitted extension list
  };

  struct RegenerationOptions
  {
    /// Flag basic constraints critical in the new certificate
    bool critical_basic_constraints{true};
  };

  /**
   * @brief Re-issues a self-signed CA certificate under the same key
   *
   * The new certificate keeps the subject, serial number, validity window,
   * key usage, extended key usage and public key of the original and
   * asserts CA:TRUE in a basic constraints extension whose criticality is
   * taken from RegenerationOptions.
   *
   * @par Example
   * @code
   * caregen::CaRegenerator regenerator;
   * auto regenerated = regenerator.regenerate(original);
   * if (regenerated && regenerated.value().basic_constraints.critical) {
   *     // issue leaf certificates under regenerated.value().authority
   * }
   * @endcode
   */
  class CaRegenerator
  {
  public:
    explicit CaRegenerator(RegenerationOptions options = {});
    ~CaRegenerator() = default;

    CaRegenerator(const CaRegenerator &) = delete;
    CaRegenerator &operator=(const CaRegenerator &) = delete;
    CaRegenerator(CaRegenerator &&) noexcept = default;
    CaRegenerator &operator=(CaRegenerator &&) noexcept = default;

    /**
     * @brief Builds and self-signs the new CA certificate
     *
     * @param original Authority to derive from
     * @return The regenerated authority, CaError::SigningError when
     *         construction or signing fails, CaError::EncodingError when the
     *         signed certificate cannot be parsed back
     */
    outcome::std_result<RegeneratedAuthority> regenerate(const CertificateAuthority &original) const;

  private:
    BasicConstraintsReport inspect_basic_constraints(const Certificate &certificate) const;

  private:
    RegenerationOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_CA_REGENERATOR_HH
