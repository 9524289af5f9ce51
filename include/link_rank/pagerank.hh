#ifndef __LINK_RANK_PAGERANK_HH__
#define __LINK_RANK_PAGERANK_HH__

#include "graph_index.hh"
#include "ranking.hh"
#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>

namespace link_rank {

constexpr double kDefaultDampingFactor = 0.85;

struct PageRankConfig {
  double damping_factor{kDefaultDampingFactor};
  size_t max_iterations{kDefaultMaxIterations};
  double convergence_threshold{kDefaultConvergenceThreshold};
  bool track_history{false};
};

// Raw (not yet rescaled) scores after one iteration
struct PageRankIteration {
  size_t iteration;
  ScoreMap scores;
};

struct PageRankResult {
  ScoreMap node_scores;
  std::vector<RankedNode> top_nodes;
  size_t iterations{0};
  double damping_factor{kDefaultDampingFactor};
  double convergence_threshold{kDefaultConvergenceThreshold};
  std::optional<std::vector<PageRankIteration>> history{std::nullopt};
  friend std::ostream &operator<<(std::ostream &os, const PageRankResult &);
};

/**
 * @brief Damped random-walk ranking
 *
 * @details Each iteration computes, from the previous vector only,
 *   new[i] = (1 - d) / n + d * sum_{j -> i} old[j] / outdegree(j)
 * where a node without out-links spreads old[j] / n to every node, so the
 * raw vector keeps summing to one. Iteration stops once the L1 change drops
 * below the threshold or the iteration cap is hit; the final vector is then
 * rescaled to sum to exactly one.
 *
 * Calculate() accumulates over adjacency lists. CalculateMatrix() builds the
 * column-stochastic transition matrix once and multiplies it every pass. Both
 * produce the same scores up to rounding.
 */
class PageRank {
public:
  // Throws std::invalid_argument for a damping factor outside (0, 1), zero
  // iterations or a non-positive threshold.
  explicit PageRank(PageRankConfig config = {});

  PageRankResult Calculate(const GraphIndex &index) const;
  PageRankResult CalculateMatrix(const GraphIndex &index) const;

  const PageRankConfig &config() const { return config_; }

private:
  PageRankResult EmptyResult() const;
  PageRankResult BuildResult(const GraphIndex &index,
                             std::vector<double> scores, size_t iterations,
                             std::vector<PageRankIteration> history) const;

  PageRankConfig config_;
};

} // namespace link_rank

#endif
