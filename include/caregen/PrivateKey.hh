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

#ifndef CAREGEN_PRIVATE_KEY_HH
#define CAREGEN_PRIVATE_KEY_HH

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <openssl/evp.h>

namespace outcome = boost::outcome_v2;

namespace caregen
{
  class Certificate;

  /**
   * @brief Algorithm tag of a private key
   */
  enum class KeyAlgorithm
  {
    Rsa,     ///< rsaEncryption, the only algorithm accepted for a CA key
    RsaPss,  ///< RSASSA-PSS restricted RSA key
    Ec,      ///< Elliptic curve key
    Ed25519, ///< Ed25519 key
    Ed448,   ///< Ed448 key
    Dsa,     ///< DSA key
    Other    ///< Anything else OpenSSL can decode
  };

  std::string to_string(KeyAlgorithm algorithm);

  /**
   * @brief Owned asymmetric private key tagged with its algorithm
   */
  class PrivateKey
  {
  public:
    /**
     * @brief Takes ownership of an OpenSSL key
     *
     * @param pkey Key to adopt, must not be null
     */
    explicit PrivateKey(EVP_PKEY *pkey);
    ~PrivateKey();

    PrivateKey(const PrivateKey &) = delete;
    PrivateKey &operator=(const PrivateKey &) = delete;
    PrivateKey(PrivateKey &&) noexcept = default;
    PrivateKey &operator=(PrivateKey &&) noexcept = default;

    /**
     * @brief Generates a new RSA key pair
     *
     * @param bits Modulus size
     * @return The key, or CaError::KeyGenError
     */
    static outcome::std_result<std::shared_ptr<PrivateKey>> generate_rsa(int bits = 2048);

    KeyAlgorithm algorithm() const;
    int bits() const;

    /// PKCS#8 PrivateKeyInfo in PEM form ("PRIVATE KEY")
    std::string to_pem() const;

    /// PKCS#1 RSAPrivateKey in PEM form ("RSA PRIVATE KEY"), empty for non-RSA keys
    std::string to_pkcs1_pem() const;

    /// DER encoded SubjectPublicKeyInfo of the public half
    std::vector<uint8_t> public_key_der() const;

    /// True when the certificate carries the public half of this key
    bool matches(const Certificate &certificate) const;

    /**
     * @brief Underlying OpenSSL key
     *
     * @warning Non-owning; valid for the lifetime of this PrivateKey.
     */
    EVP_PKEY *get_pkey() const;

  private:
    struct PkeyFree
    {
      void operator()(EVP_PKEY *pkey) const;
    };

    std::unique_ptr<EVP_PKEY, PkeyFree> pkey_;
    KeyAlgorithm algorithm_;
  };

} // namespace caregen

#endif // CAREGEN_PRIVATE_KEY_HH
