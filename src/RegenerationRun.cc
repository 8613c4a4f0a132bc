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

#include "caregen/RegenerationRun.hh"

#include <fstream>

#include "Logging.hh"
#include "caregen/CaLoader.hh"
#include "caregen/EphemeralTlsServer.hh"
#include "caregen/Errors.hh"
#include "caregen/LeafIssuer.hh"

namespace caregen
{
  std::string to_string(RunState state)
  {
    switch (state)
      {
      case RunState::Idle:
        return "idle";
      case RunState::Loaded:
        return "loaded";
      case RunState::Regenerated:
        return "regenerated";
      case RunState::Issued:
        return "issued";
      case RunState::Serving:
        return "serving";
      case RunState::VerifiedOriginal:
        return "verified-original";
      case RunState::VerifiedRegenerated:
        return "verified-regenerated";
      case RunState::Reported:
        return "reported";
      }
    return "unknown";
  }

  bool RunReport::original_matches_expectation() const
  {
    switch (expectation)
      {
      case Expectation::Rejected:
        return !original_outcome.accepted;
      case Expectation::Accepted:
        return original_outcome.accepted;
      case Expectation::Either:
        return true;
      }
    return false;
  }

  bool RunReport::succeeded() const
  {
    return exit_code() == ExitSuccess;
  }

  int RunReport::exit_code() const
  {
    if (!regenerated_outcome.accepted)
      {
        return ExitRegeneratedRejected;
      }
    if (strict && !original_matches_expectation())
      {
        return ExitExpectationMismatch;
      }
    return ExitSuccess;
  }

  RegenerationRun::RegenerationRun(RunConfig config)
    : config_(std::move(config))
    , logger_(Logging::create("caregen:run"))
  {
  }

  RunState RegenerationRun::state() const
  {
    return state_;
  }

  const RunConfig &RegenerationRun::config() const
  {
    return config_;
  }

  void RegenerationRun::advance(RunState state)
  {
    logger_->debug("State {} -> {}", to_string(state_), to_string(state));
    state_ = state;
  }

  outcome::std_result<RunReport> RegenerationRun::run()
  {
    CaLoader loader;
    auto original = loader.load_from_files(config_.ca_cert_path, config_.ca_key_path);
    if (!original)
      {
        logger_->error("Failed to load CA from {} and {}: {}", config_.ca_cert_path, config_.ca_key_path, original.error().message());
        return original.error();
      }
    return run(original.value());
  }

  outcome::std_result<RunReport> RegenerationRun::run(const CertificateAuthority &original)
  {
    state_ = RunState::Idle;
    if (!original.certificate || !original.private_key)
      {
        logger_->error("Cannot run without a CA certificate and key");
        return CaError::ParseError;
      }
    advance(RunState::Loaded);
    logger_->info("Loaded CA {} (serial {})", original.certificate->subject(), original.certificate->serial_number());

    CaRegenerator regenerator(RegenerationOptions{config_.critical_basic_constraints});
    auto regenerated = regenerator.regenerate(original);
    if (!regenerated)
      {
        logger_->error("Failed to regenerate CA: {}", regenerated.error().message());
        return regenerated.error();
      }
    advance(RunState::Regenerated);

    const CertificateAuthority &authority = regenerated.value().authority;

    RunReport report;
    report.original = original.certificate;
    report.regenerated = authority.certificate;
    report.basic_constraints = regenerated.value().basic_constraints;
    report.output_path = config_.output_path;
    report.expectation = config_.expect_original;
    report.strict = config_.strict;

    report.saved = save(*authority.certificate);

    LeafIssuer issuer(LeafOptions{config_.host});
    auto leaf = issuer.issue(authority);
    if (!leaf)
      {
        logger_->error("Failed to issue server certificate: {}", leaf.error().message());
        return leaf.error();
      }
    advance(RunState::Issued);
    logger_->info("Issued server certificate for {} (serial {})", config_.host, leaf.value().certificate->serial_number());

    EphemeralTlsServer server(leaf.value());
    auto port = server.start(config_.bind_address, config_.port);
    if (!port)
      {
        logger_->error("Failed to start TLS server on {}:{}: {}", config_.bind_address, config_.port, port.error().message());
        return port.error();
      }
    advance(RunState::Serving);

    TrustVerifier verifier(server.endpoint(config_.host), config_.timeout);

    report.original_outcome = verifier.verify(original.certificate, "original CA");
    advance(RunState::VerifiedOriginal);

    report.regenerated_outcome = verifier.verify(authority.certificate, "regenerated CA");
    advance(RunState::VerifiedRegenerated);

    server.stop();

    if (!report.original_matches_expectation())
      {
        logger_->warn("Original CA was {}, expected {}",
                      report.original_outcome.accepted ? "accepted" : "rejected",
                      to_string(report.expectation));
      }

    if (report.regenerated_outcome.accepted)
      {
        logger_->info("Regenerated CA is trusted: {}", report.regenerated_outcome.body);
      }
    else
      {
        logger_->error("Regenerated CA was rejected: {}", report.regenerated_outcome.cause);
      }

    advance(RunState::Reported);
    return report;
  }

  bool RegenerationRun::save(const Certificate &certificate) const
  {
    std::ofstream file(config_.output_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open())
      {
        logger_->warn("Failed to open {} for writing", config_.output_path);
        return false;
      }

    file << certificate.to_pem();
    file.close();
    if (file.fail())
      {
        logger_->warn("Failed to write {}", config_.output_path);
        return false;
      }

    logger_->info("Saved regenerated CA to {}", config_.output_path);
    return true;
  }

} // namespace caregen
