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

#ifndef CAREGEN_OPENSSL_UTILS_HH
#define CAREGEN_OPENSSL_UTILS_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/decoder.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace caregen::openssl
{
  template<auto Free>
  struct Deleter
  {
    template<typename T>
    void operator()(T *p) const
    {
      Free(p);
    }
  };

  using X509Ptr = std::unique_ptr<X509, Deleter<X509_free>>;
  using X509StorePtr = std::unique_ptr<X509_STORE, Deleter<X509_STORE_free>>;
  using X509StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, Deleter<X509_STORE_CTX_free>>;
  using X509ExtensionPtr = std::unique_ptr<X509_EXTENSION, Deleter<X509_EXTENSION_free>>;
  using X509NamePtr = std::unique_ptr<X509_NAME, Deleter<X509_NAME_free>>;
  using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, Deleter<EVP_PKEY_free>>;
  using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, Deleter<EVP_PKEY_CTX_free>>;
  using BioPtr = std::unique_ptr<BIO, Deleter<BIO_free_all>>;
  using BignumPtr = std::unique_ptr<BIGNUM, Deleter<BN_free>>;
  using Asn1IntegerPtr = std::unique_ptr<ASN1_INTEGER, Deleter<ASN1_INTEGER_free>>;
  using Pkcs8InfoPtr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, Deleter<PKCS8_PRIV_KEY_INFO_free>>;
  using DecoderCtxPtr = std::unique_ptr<OSSL_DECODER_CTX, Deleter<OSSL_DECODER_CTX_free>>;
  using ExtendedKeyUsagePtr = std::unique_ptr<EXTENDED_KEY_USAGE, Deleter<EXTENDED_KEY_USAGE_free>>;
  using GeneralNamesPtr = std::unique_ptr<GENERAL_NAMES, Deleter<GENERAL_NAMES_free>>;
  using BasicConstraintsPtr = std::unique_ptr<BASIC_CONSTRAINTS, Deleter<BASIC_CONSTRAINTS_free>>;
  using Asn1OctetStringPtr = std::unique_ptr<ASN1_OCTET_STRING, Deleter<ASN1_OCTET_STRING_free>>;

  // OPENSSL_free is a macro and cannot be passed to Deleter.
  struct FreeDeleter
  {
    void operator()(void *p) const
    {
      OPENSSL_free(p);
    }
  };

  using OpenSSLStringPtr = std::unique_ptr<char, FreeDeleter>;
  using OpenSSLBytesPtr = std::unique_ptr<unsigned char, FreeDeleter>;

  // Drains the OpenSSL error queue of the calling thread into one line.
  std::string last_error();

  std::string bio_to_string(BIO *bio);

  std::string to_hex(const unsigned char *data, std::size_t length);

  std::string object_to_oid(const ASN1_OBJECT *object);

  std::chrono::system_clock::time_point to_time_point(const ASN1_TIME *time);
} // namespace caregen::openssl

#endif // CAREGEN_OPENSSL_UTILS_HH
