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

#include "OpenSSLUtils.hh"

#include <array>
#include <ctime>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/objects.h>

namespace caregen::openssl
{
  std::string last_error()
  {
    std::string result;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0)
      {
        std::array<char, 256> buffer{};
        ERR_error_string_n(code, buffer.data(), buffer.size());
        if (!result.empty())
          {
            result += "; ";
          }
        result += buffer.data();
      }
    return result.empty() ? "no OpenSSL error reported" : result;
  }

  std::string bio_to_string(BIO *bio)
  {
    char *data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr)
      {
        return {};
      }
    return {data, static_cast<std::size_t>(length)};
  }

  std::string to_hex(const unsigned char *data, std::size_t length)
  {
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i)
      {
        result += fmt::format("{:02x}", data[i]);
      }
    return result;
  }

  std::string object_to_oid(const ASN1_OBJECT *object)
  {
    std::array<char, 128> buffer{};
    int length = OBJ_obj2txt(buffer.data(), static_cast<int>(buffer.size()), object, 1);
    if (length <= 0)
      {
        return {};
      }
    return buffer.data();
  }

  std::chrono::system_clock::time_point to_time_point(const ASN1_TIME *time)
  {
    std::tm tm{};
    if (time == nullptr || ASN1_TIME_to_tm(time, &tm) != 1)
      {
        return {};
      }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
  }
} // namespace caregen::openssl
