#include "cli.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>

#ifndef LINK_RANK_DATA_DIR
#define LINK_RANK_DATA_DIR "data"
#endif

namespace link_rank {

RankingRequest AlgorithmOptions::ToRequest() const {
  RankingRequest request;
  request.damping_factor = damping_factor;
  request.max_iterations = max_iterations;
  request.convergence_threshold = convergence_threshold;
  request.track_history = history;
  return request;
}

void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink is always enabled
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("link_rank", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Starting link_rank on network '{}'", options.network_type);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path")
      ->default_val("link_rank.log");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  app->add_option("-c,--csv", options.csv_file,
                  "Edge list (source,target) registered as the 'custom' "
                  "network")
      ->check(CLI::ExistingFile);
  app->add_option("-n,--network", options.network_type, "Network type")
      ->default_val("citation");
}

void AddAlgorithmOptions(CLI::App *app, AlgorithmOptions &options) {
  AddCommonOptions(app, options);
  app->add_option("-i,--max-iterations", options.max_iterations,
                  "Maximum number of iterations")
      ->default_val(kDefaultMaxIterations)
      ->check(CLI::PositiveNumber);
  app->add_option("-t,--threshold", options.convergence_threshold,
                  "Convergence threshold (L1 change between iterations)")
      ->default_val(kDefaultConvergenceThreshold)
      ->check(CLI::PositiveNumber);
  app->add_flag("--history", options.history,
                "Print the scores of every iteration");
}

CliSubcommands CreateCli(CLI::App &app, CommonOptions &graph_opts,
                         AlgorithmOptions &algo_opts) {
  app.require_subcommand(1, 1);

  auto networks = app.add_subcommand("networks", "List available networks");
  auto info = app.add_subcommand("info", "Show network statistics");
  auto degrees =
      app.add_subcommand("degrees", "Show in/out degree of every node");
  auto dataset =
      app.add_subcommand("dataset", "Show dataset source and sample edges");
  auto pagerank = app.add_subcommand("pagerank", "Run PageRank");
  auto hits = app.add_subcommand("hits", "Run HITS");
  auto compare =
      app.add_subcommand("compare", "Run PageRank and HITS and compare them");

  for (auto *sub : {networks, info, degrees, dataset}) {
    AddCommonOptions(sub, graph_opts);
  }
  for (auto *sub : {pagerank, hits, compare}) {
    AddAlgorithmOptions(sub, algo_opts);
  }

  for (auto *sub : {pagerank, compare}) {
    sub->add_option("-d,--damping", algo_opts.damping_factor,
                    "Damping factor (probability of following a link)")
        ->default_val(kDefaultDampingFactor)
        ->check(CLI::Range(0.0, 1.0));
  }
  pagerank->add_flag("--matrix", algo_opts.use_matrix,
                     "Use the transition matrix formulation");

  return CliSubcommands{networks, info,     degrees, dataset,
                        pagerank, hits, compare};
}

std::string DefaultDataPath() {
  return std::string(LINK_RANK_DATA_DIR) + "/citation_network.csv";
}

} // namespace link_rank
