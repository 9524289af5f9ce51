#ifndef __LINK_RANK_CLI_HH__
#define __LINK_RANK_CLI_HH__
#include "CLI/App.hpp"
#include "ranking_comparator.hh"
#include "spdlog/common.h"
#include <cstddef>
#include <string>

namespace link_rank {

struct CommonOptions {
  bool verbose{false};
  std::string log_file;
  std::string csv_file;
  std::string network_type;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

struct AlgorithmOptions : CommonOptions {
  double damping_factor{kDefaultDampingFactor};
  size_t max_iterations{kDefaultMaxIterations};
  double convergence_threshold{kDefaultConvergenceThreshold};
  bool history{false};
  bool use_matrix{false};

  RankingRequest ToRequest() const;
};

struct CliSubcommands {
  CLI::App *networks;
  CLI::App *info;
  CLI::App *degrees;
  CLI::App *dataset;
  CLI::App *pagerank;
  CLI::App *hits;
  CLI::App *compare;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
void AddAlgorithmOptions(CLI::App *app, AlgorithmOptions &options);
CliSubcommands CreateCli(CLI::App &app, CommonOptions &graph_opts,
                         AlgorithmOptions &algo_opts);
void SetupLogging(const CommonOptions &options);

// Bundled citation network edge list
std::string DefaultDataPath();

} // namespace link_rank
#endif
