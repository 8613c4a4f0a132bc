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

#include "caregen/PrivateKey.hh"

#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "Logging.hh"
#include "OpenSSLUtils.hh"
#include "caregen/Certificate.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  namespace
  {
    KeyAlgorithm classify(const EVP_PKEY *pkey)
    {
      switch (EVP_PKEY_get_base_id(pkey))
        {
        case EVP_PKEY_RSA:
          return KeyAlgorithm::Rsa;
        case EVP_PKEY_RSA_PSS:
          return KeyAlgorithm::RsaPss;
        case EVP_PKEY_EC:
          return KeyAlgorithm::Ec;
        case EVP_PKEY_ED25519:
          return KeyAlgorithm::Ed25519;
        case EVP_PKEY_ED448:
          return KeyAlgorithm::Ed448;
        case EVP_PKEY_DSA:
          return KeyAlgorithm::Dsa;
        default:
          return KeyAlgorithm::Other;
        }
    }

    std::shared_ptr<spdlog::logger> logger()
    {
      static auto logger = Logging::create("caregen:private_key");
      return logger;
    }
  } // namespace

  std::string to_string(KeyAlgorithm algorithm)
  {
    switch (algorithm)
      {
      case KeyAlgorithm::Rsa:
        return "RSA";
      case KeyAlgorithm::RsaPss:
        return "RSA-PSS";
      case KeyAlgorithm::Ec:
        return "EC";
      case KeyAlgorithm::Ed25519:
        return "Ed25519";
      case KeyAlgorithm::Ed448:
        return "Ed448";
      case KeyAlgorithm::Dsa:
        return "DSA";
      default:
        return "other";
      }
  }

  void PrivateKey::PkeyFree::operator()(EVP_PKEY *pkey) const
  {
    EVP_PKEY_free(pkey);
  }

  PrivateKey::PrivateKey(EVP_PKEY *pkey)
    : pkey_(pkey)
    , algorithm_(classify(pkey))
  {
  }

  PrivateKey::~PrivateKey() = default;

  outcome::std_result<std::shared_ptr<PrivateKey>> PrivateKey::generate_rsa(int bits)
  {
    openssl::EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx)
      {
        logger()->error("Failed to create RSA key generation context: {}", openssl::last_error());
        return CaError::KeyGenError;
      }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0)
      {
        logger()->error("Failed to initialise RSA-{} key generation: {}", bits, openssl::last_error());
        return CaError::KeyGenError;
      }

    EVP_PKEY *pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0)
      {
        logger()->error("Failed to generate RSA-{} key: {}", bits, openssl::last_error());
        return CaError::KeyGenError;
      }

    return std::make_shared<PrivateKey>(pkey);
  }

  KeyAlgorithm PrivateKey::algorithm() const
  {
    return algorithm_;
  }

  int PrivateKey::bits() const
  {
    return EVP_PKEY_get_bits(pkey_.get());
  }

  std::string PrivateKey::to_pem() const
  {
    openssl::BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
      {
        logger()->error("Failed to encode private key as PKCS#8: {}", openssl::last_error());
        return {};
      }
    return openssl::bio_to_string(bio.get());
  }

  std::string PrivateKey::to_pkcs1_pem() const
  {
    if (algorithm_ != KeyAlgorithm::Rsa)
      {
        return {};
      }

    openssl::BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey_traditional(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
      {
        logger()->error("Failed to encode private key as PKCS#1: {}", openssl::last_error());
        return {};
      }
    return openssl::bio_to_string(bio.get());
  }

  std::vector<uint8_t> PrivateKey::public_key_der() const
  {
    int length = i2d_PUBKEY(pkey_.get(), nullptr);
    if (length <= 0)
      {
        return {};
      }

    std::vector<uint8_t> der(static_cast<std::size_t>(length));
    unsigned char *p = der.data();
    i2d_PUBKEY(pkey_.get(), &p);
    return der;
  }

  bool PrivateKey::matches(const Certificate &certificate) const
  {
    if (X509_check_private_key(certificate.get_x509(), pkey_.get()) != 1)
      {
        logger()->debug("Private key does not match {}: {}", certificate.subject(), openssl::last_error());
        return false;
      }
    return true;
  }

  EVP_PKEY *PrivateKey::get_pkey() const
  {
    return pkey_.get();
  }

} // namespace caregen
