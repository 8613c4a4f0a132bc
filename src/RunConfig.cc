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

#include "caregen/RunConfig.hh"

#include <sstream>
#include <vector>
#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include "Logging.hh"
#include "caregen/Errors.hh"

namespace po = boost::program_options;

namespace caregen
{
  namespace
  {
    po::options_description visible_options()
    {
      po::options_description options("Options");
      // clang-format off
      options.add_options()
        ("ca-cert", po::value<std::string>()->value_name("path"), "PEM certificate of the CA to regenerate (required)")
        ("ca-key", po::value<std::string>()->value_name("path"), "PEM private key of the CA, PKCS#1 or PKCS#8 (required)")
        ("out", po::value<std::string>()->value_name("path")->default_value("new-ca.pem"), "Where to write the regenerated CA certificate")
        ("host", po::value<std::string>()->value_name("name")->default_value("localhost"), "Host name to connect to and verify")
        ("bind", po::value<std::string>()->value_name("address")->default_value("127.0.0.1"), "Local address of the TLS server")
        ("port", po::value<unsigned>()->value_name("n")->default_value(8443), "TLS server port, 0 for an ephemeral port")
        ("timeout-ms", po::value<long>()->value_name("n")->default_value(10000), "Deadline for each verification")
        ("expect-original", po::value<std::string>()->value_name("reject|accept|either")->default_value("reject"), "Expected outcome when trusting the original CA")
        ("non-critical", po::bool_switch(), "Emit basic constraints non-critical")
        ("strict", po::bool_switch(), "Fail when the original CA outcome contradicts the expectation")
        ("log-level", po::value<std::string>()->value_name("level")->default_value("info"), "trace, debug, info, warn, error, critical or off");
      // clang-format on
      return options;
    }
  } // namespace

  std::string to_string(Expectation expectation)
  {
    switch (expectation)
      {
      case Expectation::Rejected:
        return "reject";
      case Expectation::Accepted:
        return "accept";
      case Expectation::Either:
        return "either";
      }
    return "unknown";
  }

  std::optional<Expectation> parse_expectation(std::string_view text)
  {
    if (text == "reject" || text == "rejected")
      {
        return Expectation::Rejected;
      }
    if (text == "accept" || text == "accepted")
      {
        return Expectation::Accepted;
      }
    if (text == "either")
      {
        return Expectation::Either;
      }
    return {};
  }

  std::string usage(std::string_view program)
  {
    std::ostringstream out;
    out << "Usage: " << program << " -ca-cert <path> -ca-key <path> [options]\n\n" << visible_options();
    return out.str();
  }

  outcome::std_result<RunConfig> parse_command_line(int argc, const char *const *argv)
  {
    auto logger = Logging::create("caregen:config");

    po::options_description hidden;
    hidden.add_options()("args", po::value<std::vector<std::string>>(), "");

    po::options_description all;
    all.add(visible_options()).add(hidden);

    po::positional_options_description positional;
    positional.add("args", -1);

    po::variables_map vm;
    try
      {
        auto parsed = po::command_line_parser(argc, argv)
                        .options(all)
                        .positional(positional)
                        .style(po::command_line_style::default_style | po::command_line_style::allow_long_disguise)
                        .allow_unregistered()
                        .run();
        po::store(parsed, vm);
        po::notify(vm);
      }
    catch (const po::error &e)
      {
        logger->error("Invalid command line: {}", e.what());
        return CaError::UsageError;
      }

    RunConfig config;

    if (vm.count("ca-cert") == 0 || vm.count("ca-key") == 0)
      {
        logger->error("Both -ca-cert and -ca-key are required");
        return CaError::UsageError;
      }
    config.ca_cert_path = vm["ca-cert"].as<std::string>();
    config.ca_key_path = vm["ca-key"].as<std::string>();
    config.output_path = vm["out"].as<std::string>();
    config.host = vm["host"].as<std::string>();
    config.bind_address = vm["bind"].as<std::string>();

    unsigned port = vm["port"].as<unsigned>();
    if (port > 65535)
      {
        logger->error("Port {} is out of range", port);
        return CaError::UsageError;
      }
    config.port = static_cast<std::uint16_t>(port);

    long timeout = vm["timeout-ms"].as<long>();
    if (timeout <= 0)
      {
        logger->error("Timeout must be positive, got {}", timeout);
        return CaError::UsageError;
      }
    config.timeout = std::chrono::milliseconds(timeout);

    auto expectation = parse_expectation(vm["expect-original"].as<std::string>());
    if (!expectation)
      {
        logger->error("Unknown expectation '{}', use reject, accept or either", vm["expect-original"].as<std::string>());
        return CaError::UsageError;
      }
    config.expect_original = *expectation;

    config.critical_basic_constraints = !vm["non-critical"].as<bool>();
    config.strict = vm["strict"].as<bool>();

    config.log_level = vm["log-level"].as<std::string>();
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off")
      {
        logger->error("Unknown log level '{}'", config.log_level);
        return CaError::UsageError;
      }

    if (vm.count("args") != 0)
      {
        for (const auto &arg: vm["args"].as<std::vector<std::string>>())
          {
            logger->debug("Ignoring argument '{}'", arg);
          }
      }

    return config;
  }

} // namespace caregen
