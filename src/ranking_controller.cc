#include "ranking_controller.hh"
#include "degree_stats.hh"
#include "graph_index.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <iomanip>

namespace link_rank {

namespace {
constexpr size_t kSampleEdges = 10;

void PrintScores(std::ostream &os, const std::vector<std::string> &labels,
                 const ScoreMap &scores) {
  for (const auto &label : labels) {
    os << "    " << std::left << std::setw(24) << label << std::right
       << std::fixed << std::setprecision(6) << scores.at(label) << "\n";
  }
}
} // namespace

RankingController::RankingController(const NetworkCatalog &catalog,
                                     std::ostream &out)
    : catalog_(catalog), out_(out) {}

std::shared_ptr<const Network>
RankingController::Resolve(const std::string &type) const {
  auto network = catalog_.Get(type);
  if (!network) {
    spdlog::error("Network not found: {}", type);
  }
  return network;
}

bool RankingController::ListNetworks() {
  out_ << "Available networks:\n";
  for (const auto &network : catalog_.List()) {
    out_ << "  " << network->type << ": " << network->name << "\n"
         << "    " << network->description << "\n"
         << "    " << network->nodes.size() << " nodes, "
         << network->edges.size() << " edges\n";
  }
  return true;
}

bool RankingController::ShowInfo(const std::string &type) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  GraphIndex index(*network);
  out_ << network->name << " [" << network->type << "]\n"
       << network->description << "\n"
       << GetNetworkStatistics(index) << "\n";
  return true;
}

bool RankingController::ShowDegrees(const std::string &type) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  GraphIndex index(*network);
  out_ << std::left << std::setw(24) << "Node" << std::right << std::setw(10)
       << "In" << std::setw(10) << "Out" << std::setw(10) << "Total\n";
  for (size_t i = 0; i < index.size(); ++i) {
    auto degree = GetNodeDegree(index, i);
    out_ << std::left << std::setw(24) << index.Label(i) << std::right
         << std::setw(10) << degree.in_degree << std::setw(10)
         << degree.out_degree << std::setw(10) << degree.total_degree << "\n";
  }
  return true;
}

bool RankingController::ShowDataset(const std::string &type) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  out_ << "Name:        " << network->name << "\n"
       << "Description: " << network->description << "\n"
       << "Type:        " << network->type << "\n"
       << "CSV file:    "
       << (network->csv_file.empty() ? "N/A" : network->csv_file) << "\n"
       << "Nodes:       " << network->nodes.size() << "\n"
       << "Edges:       " << network->edges.size() << "\n"
       << "Sample edges:\n";
  const size_t count = std::min(kSampleEdges, network->edges.size());
  for (size_t i = 0; i < count; ++i) {
    out_ << "  " << network->edges[i].first << " -> "
         << network->edges[i].second << "\n";
  }
  return true;
}

bool RankingController::RunPageRank(const std::string &type,
                                    const RankingRequest &request,
                                    bool use_matrix) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  GraphIndex index(*network);
  PageRank pagerank(ToPageRankConfig(request));
  auto result =
      use_matrix ? pagerank.CalculateMatrix(index) : pagerank.Calculate(index);

  out_ << result;
  if (result.history) {
    for (const auto &step : *result.history) {
      out_ << "Iteration " << step.iteration << ":\n";
      PrintScores(out_, index.Labels(), step.scores);
    }
  }
  return true;
}

bool RankingController::RunHits(const std::string &type,
                                const RankingRequest &request) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  GraphIndex index(*network);
  Hits hits(ToHitsConfig(request));
  auto result = hits.Calculate(index);

  out_ << result;
  if (result.history) {
    for (const auto &step : *result.history) {
      out_ << "Iteration " << step.iteration << ":\n  Authorities:\n";
      PrintScores(out_, index.Labels(), step.authority_scores);
      out_ << "  Hubs:\n";
      PrintScores(out_, index.Labels(), step.hub_scores);
    }
  }
  return true;
}

bool RankingController::RunCompare(const std::string &type,
                                   const RankingRequest &request) {
  auto network = Resolve(type);
  if (!network) {
    return false;
  }
  GraphIndex index(*network);
  RankingComparator comparator(request);
  out_ << comparator.Compare(index, network->type);
  return true;
}

} // namespace link_rank
