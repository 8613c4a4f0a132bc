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

#ifndef CAREGEN_ERRORS_HH
#define CAREGEN_ERRORS_HH

#include <string>
#include <system_error>

namespace caregen
{
  enum class CaError
  {
    DecodeError = 1,
    ParseError,
    KeyTypeError,
    KeyMismatch,
    KeyGenError,
    SigningError,
    EncodingError,
    HandshakeError,
    RequestError,
    TimeoutError,
    ServerError,
    IoError,
    UsageError,
  };

  class CaErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "caregen";
    }

    std::string message(int ev) const override
    {
      switch (static_cast<CaError>(ev))
        {
        case CaError::DecodeError:
          return "Malformed PEM data";
        case CaError::ParseError:
          return "Malformed certificate or key";
        case CaError::KeyTypeError:
          return "Unsupported key algorithm";
        case CaError::KeyMismatch:
          return "Private key does not match certificate";
        case CaError::KeyGenError:
          return "Key generation failed";
        case CaError::SigningError:
          return "Certificate construction or signing failed";
        case CaError::EncodingError:
          return "Signed certificate could not be re-parsed";
        case CaError::HandshakeError:
          return "TLS handshake failed";
        case CaError::RequestError:
          return "HTTP request failed";
        case CaError::TimeoutError:
          return "Operation timed out";
        case CaError::ServerError:
          return "TLS server error";
        case CaError::IoError:
          return "I/O error";
        case CaError::UsageError:
          return "Invalid command line";
        default:
          return "Unknown error";
        }
    }
  };

  // Values are OpenSSL X509_V_ERR_* codes.
  class X509VerifyErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "x509-verify";
    }

    std::string message(int ev) const override;
  };

  const std::error_category &ca_error_category();
  std::error_code make_error_code(CaError e);

  const std::error_category &x509_verify_category();
  std::error_code make_x509_verify_error(long verify_result);

} // namespace caregen

namespace std
{
  template<>
  struct is_error_code_enum<caregen::CaError> : std::true_type
  {
  };
} // namespace std

#endif // CAREGEN_ERRORS_HH
