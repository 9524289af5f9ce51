#include "cli.hh"
#include "network_catalog.hh"
#include "ranking_controller.hh"
#include <CLI/CLI.hpp>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {
using namespace link_rank;

// Sample networks are loaded once here and only read afterwards
bool BuildCatalog(const CommonOptions &opts, NetworkCatalog &catalog) {
  if (!catalog.AddFromCsv("citation", "Academic Citation Network",
                          "Research papers citing each other",
                          DefaultDataPath())) {
    spdlog::error("Unable to load the citation network");
    return false;
  }
  if (!opts.csv_file.empty() &&
      !catalog.AddFromCsv("custom", "Custom Network", "User supplied edge list",
                          opts.csv_file)) {
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"link_rank - PageRank and HITS analysis of directed graphs"};
  CommonOptions graph_opts;
  AlgorithmOptions algo_opts;

  auto subcmds = CreateCli(app, graph_opts, algo_opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool is_algorithm = subcmds.pagerank->parsed() ||
                            subcmds.hits->parsed() ||
                            subcmds.compare->parsed();
  const CommonOptions &active_opts =
      is_algorithm ? static_cast<const CommonOptions &>(algo_opts)
                   : graph_opts;

  SetupLogging(active_opts);

  try {
    NetworkCatalog catalog;
    if (!BuildCatalog(active_opts, catalog)) {
      return 1;
    }

    RankingController controller(catalog, std::cout);
    const auto &type = active_opts.network_type;
    const auto request = algo_opts.ToRequest();

    bool success = false;
    if (subcmds.networks->parsed()) {
      success = controller.ListNetworks();
    } else if (subcmds.info->parsed()) {
      success = controller.ShowInfo(type);
    } else if (subcmds.degrees->parsed()) {
      success = controller.ShowDegrees(type);
    } else if (subcmds.dataset->parsed()) {
      success = controller.ShowDataset(type);
    } else if (subcmds.pagerank->parsed()) {
      success = controller.RunPageRank(type, request, algo_opts.use_matrix);
    } else if (subcmds.hits->parsed()) {
      success = controller.RunHits(type, request);
    } else if (subcmds.compare->parsed()) {
      success = controller.RunCompare(type, request);
    }

    if (!success) {
      std::cerr << "Command failed, see " << active_opts.log_file << std::endl;
      return 1;
    }
  } catch (const std::exception &e) {
    spdlog::error("Ranking failed: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  spdlog::info("Done");
  return 0;
}
