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

#include "caregen/LeafIssuer.hh"

#include <chrono>
#include <ctime>
#include <boost/outcome/try.hpp>
#include <openssl/x509v3.h>

#include "CertificateBuilder.hh"
#include "Logging.hh"
#include "OpenSSLUtils.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  namespace
  {
    std::chrono::system_clock::time_point add_years(std::chrono::system_clock::time_point from, int years)
    {
      std::time_t t = std::chrono::system_clock::to_time_t(from);
      std::tm tm{};
      gmtime_r(&t, &tm);
      tm.tm_year += years;
      return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    // IP literals are matched against iPAddress entries, never DNS names.
    std::string subject_alt_name(const std::string &hostname)
    {
      openssl::Asn1OctetStringPtr ip(a2i_IPADDRESS(hostname.c_str()));
      return ip ? "IP:" + hostname : "DNS:" + hostname;
    }
  } // namespace

  LeafIssuer::LeafIssuer(LeafOptions options)
    : options_(std::move(options))
    , logger_(Logging::create("caregen:leaf_issuer"))
  {
  }

  outcome::std_result<LeafCertificate> LeafIssuer::issue(const CertificateAuthority &issuer) const
  {
    if (!issuer.certificate || !issuer.private_key)
      {
        logger_->error("Cannot issue a certificate without a complete issuing authority");
        return CaError::SigningError;
      }

    auto key = PrivateKey::generate_rsa(options_.key_bits);
    if (!key)
      {
        logger_->error("Failed to generate server key: {}", key.error().message());
        return key.error();
      }

    X509 *ca = issuer.certificate->get_x509();
    auto now = std::chrono::system_clock::now();

    CertificateBuilder builder(logger_);
    BOOST_OUTCOME_TRY(builder.init());
    BOOST_OUTCOME_TRY(builder.set_random_serial_number(options_.serial_bits, X509_get0_serialNumber(ca)));
    BOOST_OUTCOME_TRY(builder.set_subject_common_name(options_.hostname));
    BOOST_OUTCOME_TRY(builder.set_issuer(X509_get_subject_name(ca)));
    BOOST_OUTCOME_TRY(builder.set_validity(now, add_years(now, options_.validity_years)));
    BOOST_OUTCOME_TRY(builder.set_public_key(key.value()->get_pkey()));

    BOOST_OUTCOME_TRY(builder.add_extension(NID_key_usage, "critical,digitalSignature,keyEncipherment"));
    BOOST_OUTCOME_TRY(builder.add_extension(NID_ext_key_usage, "serverAuth"));
    if (issuer.certificate->subject_key_id())
      {
        BOOST_OUTCOME_TRY(builder.add_extension(NID_authority_key_identifier, "keyid", ca));
      }
    BOOST_OUTCOME_TRY(builder.add_extension(NID_subject_alt_name, subject_alt_name(options_.hostname)));

    BOOST_OUTCOME_TRY(certificate, builder.sign(issuer.private_key->get_pkey(), EVP_sha256()));

    logger_->debug("Issued {} (serial {}) by {}", certificate->subject(), certificate->serial_number(), issuer.certificate->subject());
    return LeafCertificate{certificate, key.value(), issuer.certificate};
  }

} // namespace caregen
