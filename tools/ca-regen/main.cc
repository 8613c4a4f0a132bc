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

#include <iostream>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "caregen/RegenerationRun.hh"
#include "caregen/RunConfig.hh"

namespace
{
  void init_logging()
  {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("ca-regen", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");
    spdlog::set_level(spdlog::level::info);
  }

  void apply_log_level(const std::string &level)
  {
    spdlog::set_level(spdlog::level::from_str(level));
#if SPDLOG_VERSION >= 10801
    spdlog::cfg::load_env_levels();
#endif
  }

  void print_verdict(const caregen::RunReport &report)
  {
    std::cout << "Basic constraints: " << (report.basic_constraints.critical ? "critical" : "NOT critical")
              << ", CA:" << (report.basic_constraints.is_ca ? "TRUE" : "FALSE") << "\n";
    std::cout << "Saved " << report.output_path << ": " << (report.saved ? "yes" : "no") << "\n";
    std::cout << "Trusting original CA:    " << report.original_outcome.message() << "\n";
    std::cout << "Trusting regenerated CA: " << report.regenerated_outcome.message() << "\n";
    if (!report.original_matches_expectation())
      {
        std::cout << "Original CA outcome contradicts expectation '" << caregen::to_string(report.expectation) << "'\n";
      }
    std::cout << (report.succeeded() ? "PASS" : "FAIL") << std::endl;
  }
} // namespace

int main(int argc, char **argv)
{
  init_logging();

  auto config = caregen::parse_command_line(argc, argv);
  if (!config)
    {
      std::cerr << caregen::usage(argc > 0 ? argv[0] : "ca-regen") << std::endl;
      return caregen::ExitUsage;
    }

  apply_log_level(config.value().log_level);

  caregen::RegenerationRun run(config.value());
  auto report = run.run();
  if (!report)
    {
      spdlog::error("Run failed in state {}: {}", caregen::to_string(run.state()), report.error().message());
      return caregen::ExitFailure;
    }

  print_verdict(report.value());
  return report.value().exit_code();
}
