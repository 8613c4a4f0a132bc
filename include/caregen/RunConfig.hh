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

#ifndef CAREGEN_RUN_CONFIG_HH
#define CAREGEN_RUN_CONFIG_HH

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace caregen
{
  enum class Expectation
  {
    Rejected,
    Accepted,
    Either,
  };

  std::string to_string(Expectation expectation);
  std::optional<Expectation> parse_expectation(std::string_view text);

  struct RunConfig
  {
    std::string ca_cert_path;
    std::string ca_key_path;
    std::string output_path{"new-ca.pem"};

    std::string host{"localhost"};         ///< Name the verifier connects to and checks
    std::string bind_address{"127.0.0.1"}; ///< Local address of the TLS server
    std::uint16_t port{8443};              ///< 0 selects an ephemeral port
    std::chrono::milliseconds timeout{10000};

    Expectation expect_original{Expectation::Rejected};
    bool critical_basic_constraints{true};
    bool strict{false};
    std::string log_level{"info"};
  };

  /**
   * @brief Fills a RunConfig from the command line
   *
   * Long options may be given with one or two dashes. Unknown options and
   * positional arguments are ignored.
   *
   * @return The configuration, or CaError::UsageError when a required option
   *         is missing or a value is invalid
   */
  outcome::std_result<RunConfig> parse_command_line(int argc, const char *const *argv);

  /// Option summary suitable for printing after a usage error
  std::string usage(std::string_view program);

} // namespace caregen

#endif // CAREGEN_RUN_CONFIG_HH
