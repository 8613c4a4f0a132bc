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

#include "caregen/Errors.hh"

#include <openssl/x509.h>

namespace caregen
{
  std::string X509VerifyErrorCategory::message(int ev) const
  {
    return X509_verify_cert_error_string(ev);
  }

  const std::error_category &ca_error_category()
  {
    static const CaErrorCategory category;
    return category;
  }

  std::error_code make_error_code(CaError e)
  {
    return {static_cast<int>(e), ca_error_category()};
  }

  const std::error_category &x509_verify_category()
  {
    static const X509VerifyErrorCategory category;
    return category;
  }

  std::error_code make_x509_verify_error(long verify_result)
  {
    return {static_cast<int>(verify_result), x509_verify_category()};
  }

} // namespace caregen
