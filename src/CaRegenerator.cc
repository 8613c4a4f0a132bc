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

#include "caregen/CaRegenerator.hh"

#include <boost/outcome/try.hpp>
#include <openssl/x509v3.h>

#include "CertificateBuilder.hh"
#include "Logging.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  CaRegenerator::CaRegenerator(RegenerationOptions options)
    : options_(options)
    , logger_(Logging::create("caregen:ca_regenerator"))
  {
  }

  outcome::std_result<RegeneratedAuthority> CaRegenerator::regenerate(const CertificateAuthority &original) const
  {
    if (!original.certificate || !original.private_key)
      {
        logger_->error("Cannot regenerate an incomplete certificate authority");
        return CaError::SigningError;
      }

    X509 *source = original.certificate->get_x509();
    EVP_PKEY *key = original.private_key->get_pkey();

    if (X509_NAME_cmp(X509_get_issuer_name(source), X509_get_subject_name(source)) != 0)
      {
        logger_->warn("Original CA {} is issued by {}; the new certificate is self-issued",
                      original.certificate->subject(),
                      original.certificate->issuer());
      }

    CertificateBuilder builder(logger_);
    BOOST_OUTCOME_TRY(builder.init());
    BOOST_OUTCOME_TRY(builder.set_serial_number(X509_get0_serialNumber(source)));
    BOOST_OUTCOME_TRY(builder.set_subject(X509_get_subject_name(source)));
    BOOST_OUTCOME_TRY(builder.set_issuer(X509_get_subject_name(source)));
    BOOST_OUTCOME_TRY(builder.set_validity(X509_get0_notBefore(source), X509_get0_notAfter(source)));
    BOOST_OUTCOME_TRY(builder.set_public_key(X509_get0_pubkey(source)));

    auto key_usage = original.certificate->key_usage();
    if (key_usage && *key_usage != 0)
      {
        BOOST_OUTCOME_TRY(builder.add_extension(NID_key_usage, "critical," + CertificateBuilder::key_usage_names(*key_usage)));
      }
    BOOST_OUTCOME_TRY(builder.add_extended_key_usage(original.certificate->extended_key_usage()));

    // Basic Constraints
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.9
    BOOST_OUTCOME_TRY(builder.add_extension(NID_basic_constraints, options_.critical_basic_constraints ? "critical,CA:TRUE" : "CA:TRUE"));

    // Subject Key Identifier, method (1) of RFC 5280 section 4.2.1.2
    BOOST_OUTCOME_TRY(builder.add_extension(NID_subject_key_identifier, "hash"));

    BOOST_OUTCOME_TRY(certificate, builder.sign(key, CertificateBuilder::signature_digest(source)));

    RegeneratedAuthority regenerated{{certificate, original.private_key}, original.certificate, inspect_basic_constraints(*certificate)};

    logger_->debug("Regenerated CA {} (serial {}), {} bytes, original {} bytes",
                   certificate->subject(),
                   certificate->serial_number(),
                   certificate->to_der().size(),
                   original.certificate->to_der().size());
    return regenerated;
  }

  BasicConstraintsReport CaRegenerator::inspect_basic_constraints(const Certificate &certificate) const
  {
    BasicConstraintsReport report;

    X509 *cert = certificate.get_x509();
    for (int i = 0; i < X509_get_ext_count(cert); ++i)
      {
        X509_EXTENSION *extension = X509_get_ext(cert, i);
        if (OBJ_obj2nid(X509_EXTENSION_get_object(extension)) != NID_basic_constraints)
          {
            continue;
          }

        report.present = true;
        report.critical = X509_EXTENSION_get_critical(extension) != 0;
        report.is_ca = certificate.is_ca();
        break;
      }

    if (!report.present)
      {
        logger_->warn("Basic constraints extension is missing from the new CA");
      }
    else if (report.critical)
      {
        logger_->info("Verified: basic constraints are critical in the new CA");
      }
    else
      {
        logger_->warn("Basic constraints are not critical in the new CA");
      }

    return report;
  }

} // namespace caregen
