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

#ifndef CAREGEN_TEST_UTILS_HH
#define CAREGEN_TEST_UTILS_HH

#include <filesystem>
#include <memory>
#include <string>

#include "caregen/CertificateAuthority.hh"
#include "caregen/PrivateKey.hh"

namespace caregen::test
{
  struct TestCaOptions
  {
    std::string common_name{"caregen Test Root"};
    bool basic_constraints{true};
    bool critical_basic_constraints{false};
    // "hash" for the RFC 5280 method (1) identifier, otherwise hex bytes
    std::string subject_key_id{"hash"};
    bool ec_key{false};
    int key_bits{2048};
  };

  CertificateAuthority make_test_ca(const TestCaOptions &options = {});

  std::shared_ptr<PrivateKey> make_ec_key();

  // Unique directory below the system temp dir, removed on destruction.
  class TempDir
  {
  public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
    TempDir(TempDir &&) noexcept = delete;
    TempDir &operator=(TempDir &&) noexcept = delete;

    const std::filesystem::path &path() const;
    std::filesystem::path write(const std::string &name, const std::string &content) const;

  private:
    std::filesystem::path path_;
  };
} // namespace caregen::test

#endif // CAREGEN_TEST_UTILS_HH
