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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <openssl/x509_vfy.h>

#include "TestUtils.hh"
#include "caregen/CaRegenerator.hh"
#include "caregen/EphemeralTlsServer.hh"
#include "caregen/Errors.hh"
#include "caregen/LeafIssuer.hh"
#include "caregen/TrustVerifier.hh"

namespace caregen::test
{
  class TrustVerifierTest : public ::testing::Test
  {
  protected:
    struct Setup
    {
      CertificateAuthority original;
      CertificateAuthority regenerated;
      std::unique_ptr<EphemeralTlsServer> server;
    };

    static Setup serve(const TestCaOptions &options)
    {
      Setup setup;
      setup.original = make_test_ca(options);

      auto regenerated = CaRegenerator().regenerate(setup.original);
      EXPECT_TRUE(regenerated);
      setup.regenerated = regenerated.value().authority;

      auto leaf = LeafIssuer().issue(setup.regenerated);
      EXPECT_TRUE(leaf);

      setup.server = std::make_unique<EphemeralTlsServer>(leaf.value());
      auto port = setup.server->start("127.0.0.1", 0);
      EXPECT_TRUE(port);
      return setup;
    }

    static std::uint16_t unused_port()
    {
      boost::asio::io_context ioc;
      boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
      return acceptor.local_endpoint().port();
    }
  };

  TEST_F(TrustVerifierTest, KeyIdentifierMismatchRejectsOriginal)
  {
    auto setup = serve(TestCaOptions{.subject_key_id = "11:22:33:44:55:66:77:88"});
    TrustVerifier verifier(setup.server->endpoint());

    auto original = verifier.verify(setup.original.certificate, "original");
    EXPECT_FALSE(original.accepted);
    EXPECT_EQ(CaError::HandshakeError, original.error);
    EXPECT_EQ(original.failure, TrustFailure::UnknownAuthority);
    EXPECT_EQ(original.verify_result, X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY);
    EXPECT_THAT(original.cause, ::testing::HasSubstr("unable to get local issuer certificate"));
    EXPECT_EQ(original.label, "original");

    auto regenerated = verifier.verify(setup.regenerated.certificate, "regenerated");
    EXPECT_TRUE(regenerated.accepted) << regenerated.message();
    EXPECT_EQ(regenerated.status, 200U);
    EXPECT_EQ(regenerated.body, "Hello from regenerated CA server!");
    EXPECT_FALSE(regenerated.error);
  }

  TEST_F(TrustVerifierTest, CriticalityChangeAloneKeepsOriginalTrusted)
  {
    auto setup = serve(TestCaOptions{.critical_basic_constraints = false});
    TrustVerifier verifier(setup.server->endpoint());

    auto original = verifier.verify(setup.original.certificate, "original");
    EXPECT_TRUE(original.accepted) << original.message();

    auto regenerated = verifier.verify(setup.regenerated.certificate, "regenerated");
    EXPECT_TRUE(regenerated.accepted) << regenerated.message();
  }

  TEST_F(TrustVerifierTest, UnrelatedAuthority)
  {
    auto setup = serve({});
    auto other = make_test_ca(TestCaOptions{.common_name = "Other Root"});

    auto result = TrustVerifier(setup.server->endpoint()).verify(other.certificate, "other");
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.failure, TrustFailure::UnknownAuthority);
    EXPECT_THAT(result.message(), ::testing::HasSubstr("unknown authority"));
  }

  TEST_F(TrustVerifierTest, HostnameMismatch)
  {
    auto setup = serve({});
    TrustVerifier verifier(Endpoint{"127.0.0.1", setup.server->port()});

    auto result = verifier.verify(setup.regenerated.certificate, "by address");
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(CaError::HandshakeError, result.error);
    EXPECT_EQ(result.failure, TrustFailure::HostnameMismatch);
    EXPECT_THAT(result.verify_result, ::testing::AnyOf(X509_V_ERR_HOSTNAME_MISMATCH, X509_V_ERR_IP_ADDRESS_MISMATCH));
  }

  TEST_F(TrustVerifierTest, ConnectionRefused)
  {
    TrustVerifier verifier(Endpoint{"127.0.0.1", unused_port()});
    auto ca = make_test_ca();

    auto result = verifier.verify(ca.certificate, "nobody listening");
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(CaError::RequestError, result.error);
    EXPECT_EQ(result.failure, TrustFailure::ConnectionRefused);
    EXPECT_FALSE(result.cause.empty());
  }

  TEST_F(TrustVerifierTest, TimeoutWhenServerNeverResponds)
  {
    // Connections complete in the backlog but are never accepted
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});

    TrustVerifier verifier(Endpoint{"127.0.0.1", acceptor.local_endpoint().port()}, std::chrono::milliseconds(300));
    auto ca = make_test_ca();

    auto start = std::chrono::steady_clock::now();
    auto result = verifier.verify(ca.certificate, "silent");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(CaError::TimeoutError, result.error);
    EXPECT_EQ(result.failure, TrustFailure::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
  }

  TEST(TrustFailureTest, Names)
  {
    EXPECT_EQ(to_string(TrustFailure::UnknownAuthority), "unknown authority");
    EXPECT_EQ(to_string(TrustFailure::ConnectionRefused), "connection refused");
    EXPECT_EQ(to_string(TrustFailure::None), "none");
  }
} // namespace caregen::test
