#include "ranking_comparator.hh"
#include "degree_stats.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/fmt/ranges.h"
#include "spdlog/spdlog.h"
#include <unordered_set>

namespace link_rank {

namespace {
std::vector<std::string> Intersect(const std::vector<RankedNode> &primary,
                                   const std::vector<RankedNode> &other) {
  std::unordered_set<std::string> labels;
  for (const auto &node : other) {
    labels.insert(node.label);
  }
  std::vector<std::string> overlap;
  for (const auto &node : primary) {
    if (labels.count(node.label)) {
      overlap.push_back(node.label);
    }
  }
  return overlap;
}

std::string OverlapInsight(const std::vector<std::string> &overlap,
                           const std::string &ranking) {
  if (overlap.empty()) {
    return fmt::format("No overlap between top PageRank nodes and top {}",
                       ranking);
  }
  return fmt::format(
      "{} node(s) appear in both top PageRank and top {}: {}", overlap.size(),
      ranking, fmt::join(overlap, ", "));
}

void AddDomainInsights(const std::string &network_type,
                       std::vector<std::string> &insights) {
  if (network_type == "citation") {
    insights.emplace_back("In citation networks, high PageRank typically "
                          "indicates influential papers");
    insights.emplace_back(
        "High authority scores indicate papers that are frequently cited");
    insights.emplace_back(
        "High hub scores indicate papers that cite many important papers");
  } else if (network_type == "social") {
    insights.emplace_back(
        "In social networks, high PageRank indicates influential users");
    insights.emplace_back("High authority scores indicate users who are "
                          "mentioned/retweeted often");
    insights.emplace_back("High hub scores indicate users who frequently "
                          "mention/retweet others");
  }
}
} // namespace

PageRankConfig ToPageRankConfig(const RankingRequest &request) {
  PageRankConfig config;
  config.damping_factor = request.damping_factor;
  config.max_iterations = request.max_iterations;
  config.convergence_threshold = request.convergence_threshold;
  config.track_history = request.track_history;
  return config;
}

HitsConfig ToHitsConfig(const RankingRequest &request) {
  HitsConfig config;
  config.max_iterations = request.max_iterations;
  config.convergence_threshold = request.convergence_threshold;
  config.track_history = request.track_history;
  return config;
}

RankingComparator::RankingComparator(const RankingRequest &request)
    : pagerank_(ToPageRankConfig(request)), hits_(ToHitsConfig(request)) {}

ComparisonResult RankingComparator::Compare(const GraphIndex &index,
                                            const std::string &network_type) const {
  ComparisonResult result;
  result.pagerank = pagerank_.Calculate(index);
  result.hits = hits_.Calculate(index);

  result.overlap_authorities =
      Intersect(result.pagerank.top_nodes, result.hits.top_authorities);
  result.overlap_hubs =
      Intersect(result.pagerank.top_nodes, result.hits.top_hubs);

  auto &insights = result.insights;
  insights.push_back(OverlapInsight(result.overlap_authorities, "Authorities"));
  insights.push_back(OverlapInsight(result.overlap_hubs, "Hubs"));

  // Top lists are empty for an empty graph
  if (!result.pagerank.top_nodes.empty()) {
    const auto &top = result.pagerank.top_nodes.front();
    auto degree = GetNodeDegree(index, *index.IndexOf(top.label));
    insights.push_back(fmt::format(
        "Top PageRank node {} (score {:.4f}) has in-degree {} and out-degree {}",
        top.label, top.score, degree.in_degree, degree.out_degree));
  }
  if (!result.hits.top_authorities.empty()) {
    const auto &top = result.hits.top_authorities.front();
    auto degree = GetNodeDegree(index, *index.IndexOf(top.label));
    insights.push_back(fmt::format(
        "Top authority {} (score {:.4f}) is cited by {} node(s) and cites {}",
        top.label, top.score, degree.in_degree, degree.out_degree));
  }
  if (!result.hits.top_hubs.empty()) {
    const auto &top = result.hits.top_hubs.front();
    auto degree = GetNodeDegree(index, *index.IndexOf(top.label));
    insights.push_back(fmt::format(
        "Top hub {} (score {:.4f}) links to {} node(s) and is linked from {}",
        top.label, top.score, degree.out_degree, degree.in_degree));
  }

  insights.push_back(fmt::format(
      "PageRank converged in {} iteration(s), HITS in {} iteration(s)",
      result.pagerank.iterations, result.hits.iterations));

  auto stats = GetNetworkStatistics(index);
  insights.push_back(
      fmt::format("Average in-degree {:.2f}, average out-degree {:.2f}",
                  stats.avg_in_degree, stats.avg_out_degree));

  AddDomainInsights(network_type, insights);

  spdlog::info("Comparison found {} authority and {} hub overlap(s)",
               result.overlap_authorities.size(), result.overlap_hubs.size());
  return result;
}

std::ostream &operator<<(std::ostream &os, const ComparisonResult &result) {
  os << result.pagerank << "\n" << result.hits << "\nOverlap with authorities: ";
  os << (result.overlap_authorities.empty()
             ? std::string("(none)")
             : fmt::format("{}", fmt::join(result.overlap_authorities, ", ")));
  os << "\nOverlap with hubs:        ";
  os << (result.overlap_hubs.empty()
             ? std::string("(none)")
             : fmt::format("{}", fmt::join(result.overlap_hubs, ", ")));
  os << "\nInsights:\n";
  for (const auto &insight : result.insights) {
    os << "  - " << insight << "\n";
  }
  return os;
}

} // namespace link_rank
