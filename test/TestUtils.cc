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

#include "TestUtils.hh"

#include <chrono>
#include <fstream>
#include <random>
#include <stdexcept>
#include <fmt/format.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509v3.h>

#include "CertificateBuilder.hh"
#include "Logging.hh"

namespace caregen::test
{
  std::shared_ptr<PrivateKey> make_ec_key()
  {
    EVP_PKEY *pkey = EVP_EC_gen("P-256");
    if (pkey == nullptr)
      {
        throw std::runtime_error("EC key generation failed");
      }
    return std::make_shared<PrivateKey>(pkey);
  }

  CertificateAuthority make_test_ca(const TestCaOptions &options)
  {
    std::shared_ptr<PrivateKey> key;
    if (options.ec_key)
      {
        key = make_ec_key();
      }
    else
      {
        auto rsa = PrivateKey::generate_rsa(options.key_bits);
        if (!rsa)
          {
            throw std::runtime_error("RSA key generation failed");
          }
        key = rsa.value();
      }

    auto now = std::chrono::system_clock::now();

    CertificateBuilder builder(Logging::create("caregen:test"));
    bool ok = builder.init() && builder.set_random_serial_number(64, nullptr) && builder.set_subject_common_name(options.common_name);
    ok = ok && builder.set_issuer(X509_get_subject_name(builder.get_x509()));
    ok = ok && builder.set_validity(now - std::chrono::hours(1), now + std::chrono::hours(24 * 30));
    ok = ok && builder.set_public_key(key->get_pkey());
    if (options.basic_constraints)
      {
        ok = ok && builder.add_extension(NID_basic_constraints, options.critical_basic_constraints ? "critical,CA:TRUE" : "CA:TRUE");
      }
    ok = ok && builder.add_extension(NID_key_usage, "critical,keyCertSign,cRLSign");
    ok = ok && builder.add_extension(NID_ext_key_usage, "serverAuth,clientAuth");
    ok = ok && builder.add_extension(NID_subject_key_identifier, options.subject_key_id);
    if (!ok)
      {
        throw std::runtime_error("Failed to build test CA");
      }

    auto certificate = builder.sign(key->get_pkey(), EVP_sha256());
    if (!certificate)
      {
        throw std::runtime_error("Failed to sign test CA");
      }
    return CertificateAuthority{certificate.value(), key};
  }

  TempDir::TempDir()
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / fmt::format("caregen-test-{:016x}", (static_cast<uint64_t>(rd()) << 32) | rd());
    std::filesystem::create_directories(path_);
  }

  TempDir::~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path &TempDir::path() const
  {
    return path_;
  }

  std::filesystem::path TempDir::write(const std::string &name, const std::string &content) const
  {
    auto file_path = path_ / name;
    std::ofstream file(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
    file << content;
    return file_path;
  }
} // namespace caregen::test
