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

#include "caregen/TrustVerifier.hh"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include "Logging.hh"
#include "caregen/Errors.hh"
#include "caregen/TrustStore.hh"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace caregen
{
  namespace
  {
    enum class Stage
    {
      Resolve,
      Connect,
      Handshake,
      Request,
    };

    TrustFailure classify_verify_result(long verify_result)
    {
      switch (verify_result)
        {
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
        case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
        case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
          return TrustFailure::UnknownAuthority;
        case X509_V_ERR_HOSTNAME_MISMATCH:
        case X509_V_ERR_IP_ADDRESS_MISMATCH:
          return TrustFailure::HostnameMismatch;
        default:
          return TrustFailure::InvalidCertificate;
        }
    }

    void classify(VerificationOutcome &result, Stage stage, const boost::system::error_code &ec, long verify_result)
    {
      result.accepted = false;
      result.cause = ec.message();

      if (ec == beast::error::timeout)
        {
          result.error = CaError::TimeoutError;
          result.failure = TrustFailure::Timeout;
          return;
        }

      switch (stage)
        {
        case Stage::Resolve:
        case Stage::Connect:
          result.error = CaError::RequestError;
          result.failure = ec == asio::error::connection_refused ? TrustFailure::ConnectionRefused : TrustFailure::RequestFailed;
          break;

        case Stage::Handshake:
          result.error = CaError::HandshakeError;
          result.verify_result = verify_result;
          if (verify_result != X509_V_OK)
            {
              result.failure = classify_verify_result(verify_result);
              result.cause = fmt::format("{} ({})", ec.message(), X509_verify_cert_error_string(verify_result));
            }
          else
            {
              result.failure = TrustFailure::HandshakeFailed;
            }
          break;

        case Stage::Request:
          result.error = CaError::RequestError;
          result.failure = TrustFailure::RequestFailed;
          break;
        }
    }

    asio::awaitable<VerificationOutcome> attempt(Endpoint endpoint,
                                                 std::chrono::milliseconds timeout,
                                                 ssl::context &ctx,
                                                 std::string label,
                                                 std::shared_ptr<spdlog::logger> logger)
    {
      VerificationOutcome result;
      result.label = std::move(label);

      auto executor = co_await asio::this_coro::executor;
      tcp::resolver resolver(executor);
      beast::ssl_stream<beast::tcp_stream> stream(executor, ctx);

      Stage stage = Stage::Resolve;
      try
        {
          beast::get_lowest_layer(stream).expires_after(timeout);

          auto endpoints = co_await resolver.async_resolve(endpoint.host, std::to_string(endpoint.port), asio::use_awaitable);

          stage = Stage::Connect;
          co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::use_awaitable);

          SSL *ssl = stream.native_handle();
          if (!SSL_set_tlsext_host_name(ssl, endpoint.host.c_str()) || SSL_set1_host(ssl, endpoint.host.c_str()) != 1)
            {
              logger->warn("Failed to configure host name {} on TLS client", endpoint.host);
            }

          stage = Stage::Handshake;
          co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

          stage = Stage::Request;
          http::request<http::empty_body> request{http::verb::get, "/", 11};
          request.set(http::field::host, endpoint.host);
          request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
          co_await http::async_write(stream, request, asio::use_awaitable);

          beast::flat_buffer buffer;
          http::response<http::string_body> response;
          co_await http::async_read(stream, buffer, response, asio::use_awaitable);

          result.accepted = true;
          result.status = response.result_int();
          result.body = response.body();
        }
      catch (const boost::system::system_error &e)
        {
          classify(result, stage, e.code(), SSL_get_verify_result(stream.native_handle()));
          co_return result;
        }

      try
        {
          co_await stream.async_shutdown(asio::use_awaitable);
        }
      catch (const boost::system::system_error &e)
        {
          logger->debug("TLS shutdown: {}", e.code().message());
        }

      co_return result;
    }
  } // namespace

  std::string to_string(TrustFailure failure)
  {
    switch (failure)
      {
      case TrustFailure::None:
        return "none";
      case TrustFailure::UnknownAuthority:
        return "unknown authority";
      case TrustFailure::InvalidCertificate:
        return "invalid certificate";
      case TrustFailure::HostnameMismatch:
        return "host name mismatch";
      case TrustFailure::HandshakeFailed:
        return "handshake failed";
      case TrustFailure::ConnectionRefused:
        return "connection refused";
      case TrustFailure::Timeout:
        return "timeout";
      case TrustFailure::RequestFailed:
        return "request failed";
      }
    return "unknown";
  }

  std::string VerificationOutcome::message() const
  {
    if (accepted)
      {
        return fmt::format("accepted (HTTP {}): {}", status, body);
      }
    return fmt::format("rejected, {}: {}", to_string(failure), cause);
  }

  TrustVerifier::TrustVerifier(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout)
    , logger_(Logging::create("caregen:trust_verifier"))
  {
  }

  const Endpoint &TrustVerifier::endpoint() const
  {
    return endpoint_;
  }

  VerificationOutcome TrustVerifier::verify(const std::shared_ptr<Certificate> &ca, const std::string &label) const
  {
    VerificationOutcome result;
    result.label = label;

    TrustStore store(ca);
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_verify_mode(ssl::verify_peer);

    auto installed = store.install(ctx.native_handle());
    if (!installed)
      {
        result.error = installed.error();
        result.failure = TrustFailure::HandshakeFailed;
        result.cause = "failed to install trust store";
        logger_->warn("{}: {}", label, result.message());
        return result;
      }

    logger_->debug("{}: connecting to {}:{}", label, endpoint_.host, endpoint_.port);

    asio::io_context ioc;
    asio::co_spawn(ioc,
                   attempt(endpoint_, timeout_, ctx, label, logger_),
                   [&](std::exception_ptr e, VerificationOutcome outcome) {
                     if (e)
                       {
                         try
                           {
                             std::rethrow_exception(e);
                           }
                         catch (const std::exception &ex)
                           {
                             result.error = CaError::RequestError;
                             result.failure = TrustFailure::RequestFailed;
                             result.cause = ex.what();
                           }
                         return;
                       }
                     result = std::move(outcome);
                   });
    ioc.run();

    if (result.accepted)
      {
        logger_->info("{}: {}", label, result.message());
      }
    else
      {
        logger_->info("{}: {} [{}]", label, result.message(), result.error.message());
      }
    return result;
  }

} // namespace caregen
