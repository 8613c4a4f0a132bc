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

#ifndef CAREGEN_CA_LOADER_HH
#define CAREGEN_CA_LOADER_HH

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <spdlog/logger.h>

#include "caregen/CertificateAuthority.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief Loads an existing CA certificate and its RSA private key from PEM
   *
   * The private key may be a PKCS#1 RSAPrivateKey or a PKCS#8
   * PrivateKeyInfo; PKCS#1 is tried first. Failures are reported as
   * CaError::DecodeError (no PEM block), CaError::ParseError (bad DER, or a
   * key in neither format), CaError::KeyTypeError (PKCS#8 key that is not
   * RSA) or CaError::KeyMismatch (key does not belong to the certificate).
   */
  class CaLoader
  {
  public:
    CaLoader();
    ~CaLoader() = default;

    CaLoader(const CaLoader &) = delete;
    CaLoader &operator=(const CaLoader &) = delete;
    CaLoader(CaLoader &&) noexcept = default;
    CaLoader &operator=(CaLoader &&) noexcept = default;

    outcome::std_result<CertificateAuthority> load(std::string_view certificate_pem, std::string_view key_pem) const;

    /// Reads both files and loads them; unreadable files give CaError::IoError
    outcome::std_result<CertificateAuthority> load_from_files(const std::filesystem::path &certificate_path,
                                                              const std::filesystem::path &key_path) const;

    outcome::std_result<std::shared_ptr<Certificate>> decode_certificate(std::string_view pem) const;
    outcome::std_result<std::shared_ptr<PrivateKey>> decode_private_key(std::string_view pem) const;

  private:
    outcome::std_result<std::vector<uint8_t>> decode_pem(std::string_view pem, std::string_view what) const;
    outcome::std_result<std::string> read_file(const std::filesystem::path &path) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_CA_LOADER_HH
