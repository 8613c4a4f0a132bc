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

#include "caregen/CaLoader.hh"

#include <fstream>
#include <iterator>
#include <openssl/err.h>
#include <openssl/pem.h>

#include "Logging.hh"
#include "OpenSSLUtils.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  namespace
  {
    EVP_PKEY *decode_pkcs1_rsa(const std::vector<uint8_t> &der)
    {
      EVP_PKEY *pkey = nullptr;
      openssl::DecoderCtxPtr ctx(OSSL_DECODER_CTX_new_for_pkey(&pkey, "DER", "type-specific", "RSA", EVP_PKEY_KEYPAIR, nullptr, nullptr));
      if (!ctx)
        {
          return nullptr;
        }

      const unsigned char *data = der.data();
      std::size_t length = der.size();
      if (OSSL_DECODER_from_data(ctx.get(), &data, &length) != 1)
        {
          EVP_PKEY_free(pkey);
          return nullptr;
        }
      return pkey;
    }

    EVP_PKEY *decode_pkcs8(const std::vector<uint8_t> &der)
    {
      const unsigned char *data = der.data();
      openssl::Pkcs8InfoPtr info(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &data, static_cast<long>(der.size())));
      if (!info)
        {
          return nullptr;
        }
      return EVP_PKCS82PKEY(info.get());
    }
  } // namespace

  CaLoader::CaLoader()
    : logger_(Logging::create("caregen:ca_loader"))
  {
  }

  outcome::std_result<CertificateAuthority> CaLoader::load(std::string_view certificate_pem, std::string_view key_pem) const
  {
    auto certificate = decode_certificate(certificate_pem);
    if (!certificate)
      {
        logger_->error("Failed to load CA certificate: {}", certificate.error().message());
        return certificate.error();
      }

    auto key = decode_private_key(key_pem);
    if (!key)
      {
        logger_->error("Failed to load CA private key: {}", key.error().message());
        return key.error();
      }

    if (!key.value()->matches(*certificate.value()))
      {
        logger_->error("CA private key does not belong to {}", certificate.value()->subject());
        return CaError::KeyMismatch;
      }

    if (!certificate.value()->is_ca())
      {
        logger_->warn("Certificate {} does not assert CA:TRUE", certificate.value()->subject());
      }
    if (!certificate.value()->is_self_signed())
      {
        logger_->warn("Certificate {} is not self-signed", certificate.value()->subject());
      }

    logger_->debug("Loaded CA {} (serial {}, {}-bit {} key)",
                   certificate.value()->subject(),
                   certificate.value()->serial_number(),
                   key.value()->bits(),
                   to_string(key.value()->algorithm()));

    return CertificateAuthority{certificate.value(), key.value()};
  }

  outcome::std_result<CertificateAuthority> CaLoader::load_from_files(const std::filesystem::path &certificate_path,
                                                                      const std::filesystem::path &key_path) const
  {
    auto certificate_pem = read_file(certificate_path);
    if (!certificate_pem)
      {
        return certificate_pem.error();
      }

    auto key_pem = read_file(key_path);
    if (!key_pem)
      {
        return key_pem.error();
      }

    return load(certificate_pem.value(), key_pem.value());
  }

  outcome::std_result<std::shared_ptr<Certificate>> CaLoader::decode_certificate(std::string_view pem) const
  {
    auto der = decode_pem(pem, "certificate");
    if (!der)
      {
        return der.error();
      }

    auto certificate = Certificate::from_der(der.value());
    if (!certificate)
      {
        logger_->error("Failed to parse CA certificate DER");
        return CaError::ParseError;
      }

    return certificate.value();
  }

  outcome::std_result<std::shared_ptr<PrivateKey>> CaLoader::decode_private_key(std::string_view pem) const
  {
    auto der = decode_pem(pem, "private key");
    if (!der)
      {
        return der.error();
      }

    EVP_PKEY *pkey = decode_pkcs1_rsa(der.value());
    if (pkey != nullptr)
      {
        logger_->debug("Decoded private key as PKCS#1");
        return std::make_shared<PrivateKey>(pkey);
      }
    logger_->debug("Private key is not PKCS#1: {}", openssl::last_error());

    pkey = decode_pkcs8(der.value());
    if (pkey == nullptr)
      {
        logger_->error("Failed to parse private key (tried PKCS#1 and PKCS#8): {}", openssl::last_error());
        return CaError::ParseError;
      }

    auto key = std::make_shared<PrivateKey>(pkey);
    if (key->algorithm() != KeyAlgorithm::Rsa)
      {
        logger_->error("CA private key is a {} key, not an RSA key", to_string(key->algorithm()));
        return CaError::KeyTypeError;
      }

    logger_->debug("Decoded private key as PKCS#8");
    return key;
  }

  outcome::std_result<std::vector<uint8_t>> CaLoader::decode_pem(std::string_view pem, std::string_view what) const
  {
    openssl::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio)
      {
        return CaError::DecodeError;
      }

    char *name = nullptr;
    char *header = nullptr;
    unsigned char *data = nullptr;
    long length = 0;
    int rc = PEM_read_bio(bio.get(), &name, &header, &data, &length);
    openssl::OpenSSLStringPtr name_owner(name);
    openssl::OpenSSLStringPtr header_owner(header);
    openssl::OpenSSLBytesPtr data_owner(data);
    if (rc != 1)
      {
        logger_->error("Failed to decode {} PEM: {}", what, openssl::last_error());
        return CaError::DecodeError;
      }

    logger_->debug("Decoded {} PEM block '{}' ({} bytes)", what, name, length);
    std::vector<uint8_t> der(data, data + length);
    return der;
  }

  outcome::std_result<std::string> CaLoader::read_file(const std::filesystem::path &path) const
  {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        logger_->error("Failed to open file: {}", path.string());
        return CaError::IoError;
      }

    std::string content;
    try
      {
        content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      }
    catch (const std::exception &e)
      {
        logger_->error("Error while reading file: {}: {}", path.string(), e.what());
        return CaError::IoError;
      }

    if (file.bad())
      {
        logger_->error("Error while reading file: {}", path.string());
        return CaError::IoError;
      }

    return content;
  }

} // namespace caregen
