#ifndef __LINK_RANK_HITS_HH__
#define __LINK_RANK_HITS_HH__

#include "graph_index.hh"
#include "ranking.hh"
#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>

namespace link_rank {

struct HitsConfig {
  size_t max_iterations{kDefaultMaxIterations};
  double convergence_threshold{kDefaultConvergenceThreshold};
  bool track_history{false};
};

// Normalized scores after one iteration
struct HitsIteration {
  size_t iteration;
  ScoreMap authority_scores;
  ScoreMap hub_scores;
};

struct HitsResult {
  ScoreMap authority_scores;
  ScoreMap hub_scores;
  std::vector<RankedNode> top_authorities;
  std::vector<RankedNode> top_hubs;
  size_t iterations{0};
  double convergence_threshold{kDefaultConvergenceThreshold};
  std::optional<std::vector<HitsIteration>> history{std::nullopt};
  friend std::ostream &operator<<(std::ostream &os, const HitsResult &);
};

/**
 * @brief Hyperlink-Induced Topic Search
 *
 * @details Authority of a node is the sum of hub scores of the nodes linking
 * to it; hub score is the sum of authority scores of the nodes it links to.
 * Both updates read only the previous iteration's vectors. Each new vector is
 * L2-normalized on its own (an all-zero vector stays zero). Stops when both
 * L1 changes are below the threshold, or at the iteration cap.
 */
class Hits {
public:
  // Throws std::invalid_argument for zero iterations or a non-positive
  // threshold.
  explicit Hits(HitsConfig config = {});

  HitsResult Calculate(const GraphIndex &index) const;

  const HitsConfig &config() const { return config_; }

private:
  HitsConfig config_;
};

} // namespace link_rank

#endif
