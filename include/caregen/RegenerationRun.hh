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

#ifndef CAREGEN_REGENERATION_RUN_HH
#define CAREGEN_REGENERATION_RUN_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/logger.h>

#include "caregen/CaRegenerator.hh"
#include "caregen/CertificateAuthority.hh"
#include "caregen/RunConfig.hh"
#include "caregen/TrustVerifier.hh"

namespace outcome = boost::outcome_v2;

namespace caregen
{
  enum ExitStatus : int
  {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
    ExitRegeneratedRejected = 3,
    ExitExpectationMismatch = 4,
  };

  enum class RunState
  {
    Idle,
    Loaded,
    Regenerated,
    Issued,
    Serving,
    VerifiedOriginal,
    VerifiedRegenerated,
    Reported,
  };

  std::string to_string(RunState state);

  struct RunReport
  {
    std::shared_ptr<Certificate> original;
    std::shared_ptr<Certificate> regenerated;
    BasicConstraintsReport basic_constraints;

    std::string output_path;
    bool saved{false};

    VerificationOutcome original_outcome;
    VerificationOutcome regenerated_outcome;

    Expectation expectation{Expectation::Rejected};
    bool strict{false};

    bool original_matches_expectation() const;

    /// True when exit_code() is ExitSuccess
    bool succeeded() const;

    /**
     * @brief Process exit status for a completed run
     *
     * ExitRegeneratedRejected when the regenerated CA was not trusted,
     * ExitExpectationMismatch when strict and the original CA outcome
     * contradicts the expectation, ExitSuccess otherwise.
     */
    int exit_code() const;
  };

  /**
   * @brief Drives one regeneration from loading to the final report
   *
   * Load, regeneration, leaf issuance and server start failures end the run
   * with that error, leaving state() at the last completed stage. Failing to
   * save the regenerated certificate is recorded in the report only. Both
   * verifications always run.
   */
  class RegenerationRun
  {
  public:
    explicit RegenerationRun(RunConfig config);
    ~RegenerationRun() = default;

    RegenerationRun(const RegenerationRun &) = delete;
    RegenerationRun &operator=(const RegenerationRun &) = delete;
    RegenerationRun(RegenerationRun &&) noexcept = default;
    RegenerationRun &operator=(RegenerationRun &&) noexcept = default;

    /// Loads the CA from the configured files and runs the pipeline
    outcome::std_result<RunReport> run();

    /// Runs the pipeline for an already loaded CA
    outcome::std_result<RunReport> run(const CertificateAuthority &original);

    RunState state() const;
    const RunConfig &config() const;

  private:
    bool save(const Certificate &certificate) const;
    void advance(RunState state);

  private:
    RunConfig config_;
    RunState state_{RunState::Idle};
    std::shared_ptr<spdlog::logger> logger_;
  };

} // namespace caregen

#endif // CAREGEN_REGENERATION_RUN_HH
