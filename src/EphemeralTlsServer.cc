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

#include "caregen/EphemeralTlsServer.hh"

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "Logging.hh"
#include "caregen/Errors.hh"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace caregen
{
  class EphemeralTlsServer::Impl
  {
  public:
    Impl(LeafCertificate leaf, std::string body);
    ~Impl();

    Impl(const Impl &) = delete;
    Impl &operator=(const Impl &) = delete;
    Impl(Impl &&) noexcept = delete;
    Impl &operator=(Impl &&) noexcept = delete;

    outcome::std_result<std::uint16_t> start(const std::string &address, std::uint16_t port);
    void stop();

    bool is_running() const;
    std::uint16_t port() const;

  private:
    outcome::std_result<void> configure();
    void run(const std::string &address, std::uint16_t port, std::promise<outcome::std_result<std::uint16_t>> ready);

    asio::awaitable<void> accept_loop();
    asio::awaitable<void> session(tcp::socket socket);

  private:
    static constexpr std::chrono::seconds session_timeout{30};

    LeafCertificate leaf_;
    std::string body_;
    asio::io_context ioc_;
    ssl::context ctx_{ssl::context::tls_server};
    std::optional<tcp::acceptor> acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    std::shared_ptr<spdlog::logger> logger_;
  };

  EphemeralTlsServer::Impl::Impl(LeafCertificate leaf, std::string body)
    : leaf_(std::move(leaf))
    , body_(std::move(body))
    , logger_(Logging::create("caregen:tls_server"))
  {
  }

  EphemeralTlsServer::Impl::~Impl()
  {
    stop();
  }

  outcome::std_result<void> EphemeralTlsServer::Impl::configure()
  {
    if (!leaf_.certificate || !leaf_.private_key)
      {
        logger_->error("Cannot serve without a leaf certificate and key");
        return CaError::ServerError;
      }

    std::string certificate_pem = leaf_.certificate->to_pem();
    std::string key_pem = leaf_.private_key->to_pem();

    try
      {
        ctx_.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::single_dh_use);
        ctx_.use_certificate(asio::buffer(certificate_pem), ssl::context::pem);
        ctx_.use_private_key(asio::buffer(key_pem), ssl::context::pem);
      }
    catch (const boost::system::system_error &e)
      {
        logger_->error("Failed to configure TLS context: {}", e.code().message());
        return CaError::ServerError;
      }
    return outcome::success();
  }

  outcome::std_result<std::uint16_t> EphemeralTlsServer::Impl::start(const std::string &address, std::uint16_t port)
  {
    if (running_)
      {
        logger_->error("Server is already running on port {}", port_.load());
        return CaError::ServerError;
      }

    if (thread_.joinable())
      {
        thread_.join();
      }

    auto configured = configure();
    if (!configured)
      {
        return configured.error();
      }

    ioc_.restart();

    std::promise<outcome::std_result<std::uint16_t>> ready;
    auto bound = ready.get_future();
    thread_ = std::thread([this, address, port, ready = std::move(ready)]() mutable { run(address, port, std::move(ready)); });

    auto result = bound.get();
    if (!result)
      {
        thread_.join();
        return result.error();
      }

    running_ = true;
    logger_->info("Serving on https://{}:{}", address, result.value());
    return result.value();
  }

  void EphemeralTlsServer::Impl::run(const std::string &address,
                                     std::uint16_t port,
                                     std::promise<outcome::std_result<std::uint16_t>> ready)
  {
    try
      {
        tcp::endpoint endpoint(asio::ip::make_address(address), port);
        acceptor_.emplace(ioc_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(asio::socket_base::max_listen_connections);
        port_ = acceptor_->local_endpoint().port();
      }
    catch (const boost::system::system_error &e)
      {
        logger_->error("Failed to listen on {}:{}: {}", address, port, e.code().message());
        acceptor_.reset();
        ready.set_value(outcome::std_result<std::uint16_t>(CaError::ServerError));
        return;
      }

    asio::co_spawn(ioc_, accept_loop(), [this](std::exception_ptr e) {
      if (e)
        {
          try
            {
              std::rethrow_exception(e);
            }
          catch (const std::exception &ex)
            {
              logger_->error("Accept loop terminated: {}", ex.what());
            }
        }
    });

    ready.set_value(outcome::std_result<std::uint16_t>(port_.load()));
    ioc_.run();
    logger_->debug("Server thread on port {} exiting", port_.load());
  }

  asio::awaitable<void> EphemeralTlsServer::Impl::accept_loop()
  {
    for (;;)
      {
        try
          {
            auto socket = co_await acceptor_->async_accept(asio::use_awaitable);
            asio::co_spawn(ioc_, session(std::move(socket)), [this](std::exception_ptr e) {
              if (e)
                {
                  try
                    {
                      std::rethrow_exception(e);
                    }
                  catch (const std::exception &ex)
                    {
                      logger_->warn("Session terminated: {}", ex.what());
                    }
                }
            });
          }
        catch (const boost::system::system_error &e)
          {
            if (e.code() == asio::error::operation_aborted || !acceptor_ || !acceptor_->is_open())
              {
                co_return;
              }
            logger_->warn("Accept failed: {}", e.code().message());
          }
      }
  }

  asio::awaitable<void> EphemeralTlsServer::Impl::session(tcp::socket socket)
  {
    beast::ssl_stream<beast::tcp_stream> stream(std::move(socket), ctx_);
    beast::get_lowest_layer(stream).expires_after(session_timeout);

    try
      {
        co_await stream.async_handshake(ssl::stream_base::server, asio::use_awaitable);
      }
    catch (const boost::system::system_error &e)
      {
        logger_->debug("TLS handshake with client failed: {}", e.code().message());
        co_return;
      }

    try
      {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        co_await http::async_read(stream, buffer, request, asio::use_awaitable);
        logger_->debug("{} {}", std::string(request.method_string()), std::string(request.target()));

        http::response<http::string_body> response{http::status::ok, request.version()};
        response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        response.set(http::field::content_type, "text/plain");
        response.keep_alive(false);
        response.body() = body_;
        response.prepare_payload();
        co_await http::async_write(stream, response, asio::use_awaitable);

        co_await stream.async_shutdown(asio::use_awaitable);
      }
    catch (const boost::system::system_error &e)
      {
        logger_->debug("Session ended: {}", e.code().message());
      }
  }

  void EphemeralTlsServer::Impl::stop()
  {
    if (!thread_.joinable())
      {
        return;
      }

    ioc_.stop();
    thread_.join();
    acceptor_.reset();

    if (running_.exchange(false))
      {
        logger_->info("Server on port {} stopped", port_.load());
      }
  }

  bool EphemeralTlsServer::Impl::is_running() const
  {
    return running_;
  }

  std::uint16_t EphemeralTlsServer::Impl::port() const
  {
    return port_;
  }

  EphemeralTlsServer::EphemeralTlsServer(LeafCertificate leaf, std::string body)
    : impl_(std::make_unique<Impl>(std::move(leaf), std::move(body)))
  {
  }

  EphemeralTlsServer::~EphemeralTlsServer() = default;

  outcome::std_result<std::uint16_t> EphemeralTlsServer::start(const std::string &address, std::uint16_t port)
  {
    return impl_->start(address, port);
  }

  void EphemeralTlsServer::stop()
  {
    impl_->stop();
  }

  bool EphemeralTlsServer::is_running() const
  {
    return impl_->is_running();
  }

  std::uint16_t EphemeralTlsServer::port() const
  {
    return impl_->port();
  }

  Endpoint EphemeralTlsServer::endpoint(const std::string &host) const
  {
    return Endpoint{host, impl_->port()};
  }

} // namespace caregen
