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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <openssl/x509v3.h>

#include "CertificateBuilder.hh"
#include "TestUtils.hh"
#include "caregen/CaRegenerator.hh"
#include "caregen/Errors.hh"

namespace caregen::test
{
  class CaRegeneratorTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      original_ = make_test_ca();
    }

    CertificateAuthority original_;
  };

  TEST_F(CaRegeneratorTest, KeepsIdentityAndKey)
  {
    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original_);
    ASSERT_TRUE(result);

    const auto &regenerated = result.value();
    const auto &cert = regenerated.authority.certificate;

    EXPECT_EQ(cert->public_key_der(), original_.certificate->public_key_der());
    EXPECT_EQ(cert->subject(), original_.certificate->subject());
    EXPECT_EQ(cert->issuer(), original_.certificate->subject());
    EXPECT_EQ(cert->serial_number(), original_.certificate->serial_number());
    EXPECT_EQ(cert->not_before(), original_.certificate->not_before());
    EXPECT_EQ(cert->not_after(), original_.certificate->not_after());
    EXPECT_EQ(cert->key_usage(), original_.certificate->key_usage());
    EXPECT_EQ(cert->extended_key_usage(), original_.certificate->extended_key_usage());
    EXPECT_NE(cert->to_der(), original_.certificate->to_der());

    EXPECT_EQ(regenerated.authority.private_key, original_.private_key);
    EXPECT_EQ(regenerated.original, original_.certificate);
  }

  TEST_F(CaRegeneratorTest, SelfSigned)
  {
    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original_);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().authority.certificate->is_self_signed());
    EXPECT_TRUE(original_.private_key->matches(*result.value().authority.certificate));
  }

  TEST_F(CaRegeneratorTest, BasicConstraintsCriticalByDefault)
  {
    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original_);
    ASSERT_TRUE(result);

    auto report = result.value().basic_constraints;
    EXPECT_TRUE(report.present);
    EXPECT_TRUE(report.critical);
    EXPECT_TRUE(report.is_ca);

    auto bc = result.value().authority.certificate->basic_constraints();
    ASSERT_TRUE(bc.has_value());
    EXPECT_TRUE(bc->critical);
    EXPECT_TRUE(bc->is_ca);
    EXPECT_FALSE(bc->path_length.has_value());
  }

  TEST_F(CaRegeneratorTest, BasicConstraintsNonCriticalOnRequest)
  {
    CaRegenerator regenerator(RegenerationOptions{false});
    auto result = regenerator.regenerate(original_);
    ASSERT_TRUE(result);

    EXPECT_TRUE(result.value().basic_constraints.present);
    EXPECT_FALSE(result.value().basic_constraints.critical);
    EXPECT_TRUE(result.value().authority.certificate->is_ca());
  }

  TEST_F(CaRegeneratorTest, AssertsCAForCertificateWithoutBasicConstraints)
  {
    auto original = make_test_ca(TestCaOptions{.basic_constraints = false});
    ASSERT_FALSE(original.certificate->is_ca());

    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().authority.certificate->is_ca());
  }

  TEST_F(CaRegeneratorTest, SubjectKeyIdentifierIsKeyHash)
  {
    auto original = make_test_ca(TestCaOptions{.subject_key_id = "01:02:03:04"});

    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original);
    ASSERT_TRUE(result);

    auto skid = result.value().authority.certificate->subject_key_id();
    ASSERT_TRUE(skid.has_value());
    EXPECT_NE(*skid, "01020304");
    // SHA-1 of the public key bit string
    EXPECT_EQ(skid->size(), 40U);
    EXPECT_FALSE(result.value().authority.certificate->authority_key_id().has_value());
  }

  TEST_F(CaRegeneratorTest, KeepsSignatureDigest)
  {
    CaRegenerator regenerator;
    auto result = regenerator.regenerate(original_);
    ASSERT_TRUE(result);
    EXPECT_EQ(X509_get_signature_nid(result.value().authority.certificate->get_x509()), NID_sha256WithRSAEncryption);
  }

  TEST_F(CaRegeneratorTest, IncompleteAuthority)
  {
    CertificateAuthority incomplete{original_.certificate, nullptr};

    CaRegenerator regenerator;
    auto result = regenerator.regenerate(incomplete);
    EXPECT_FALSE(result);
    EXPECT_EQ(CaError::SigningError, result.error());
  }

  TEST(CertificateBuilderTest, KeyUsageNames)
  {
    EXPECT_EQ(CertificateBuilder::key_usage_names(KU_KEY_CERT_SIGN | KU_CRL_SIGN), "keyCertSign,cRLSign");
    EXPECT_EQ(CertificateBuilder::key_usage_names(KU_DIGITAL_SIGNATURE | KU_KEY_ENCIPHERMENT), "digitalSignature,keyEncipherment");
    EXPECT_EQ(CertificateBuilder::key_usage_names(0), "");
  }
} // namespace caregen::test
