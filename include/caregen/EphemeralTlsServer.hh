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

#ifndef CAREGEN_EPHEMERAL_TLS_SERVER_HH
#define CAREGEN_EPHEMERAL_TLS_SERVER_HH

#include <cstdint>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>

#include "caregen/Endpoint.hh"
#include "caregen/LeafIssuer.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  /**
   * @brief Local HTTPS server presenting a single leaf certificate
   *
   * Every request is answered with 200 and a fixed text/plain body. The
   * server runs on its own thread until stop() is called or the object is
   * destroyed.
   *
   * @par Example
   * @code
   * caregen::EphemeralTlsServer server(leaf);
   * auto port = server.start("127.0.0.1", 0);
   * if (port) {
   *     caregen::TrustVerifier verifier(server.endpoint());
   *     auto result = verifier.verify(ca, "regenerated");
   * }
   * @endcode
   */
  class EphemeralTlsServer
  {
  public:
    static constexpr const char *default_body = "Hello from regenerated CA server!";

    explicit EphemeralTlsServer(LeafCertificate leaf, std::string body = default_body);
    ~EphemeralTlsServer();

    EphemeralTlsServer(const EphemeralTlsServer &) = delete;
    EphemeralTlsServer &operator=(const EphemeralTlsServer &) = delete;
    EphemeralTlsServer(EphemeralTlsServer &&) noexcept = delete;
    EphemeralTlsServer &operator=(EphemeralTlsServer &&) noexcept = delete;

    /**
     * @brief Binds, listens and starts serving
     *
     * Returns once the listener is accepting connections.
     *
     * @param address Local address to bind
     * @param port Port to bind, 0 for an ephemeral port
     * @return The bound port, or CaError::ServerError
     */
    outcome::std_result<std::uint16_t> start(const std::string &address = "127.0.0.1", std::uint16_t port = 8443);

    void stop();

    bool is_running() const;
    std::uint16_t port() const;

    /// Endpoint for clients, using host as the name to connect to and verify
    Endpoint endpoint(const std::string &host = "localhost") const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
  };

} // namespace caregen

#endif // CAREGEN_EPHEMERAL_TLS_SERVER_HH
