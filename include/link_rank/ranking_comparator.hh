#ifndef __LINK_RANK_RANKING_COMPARATOR_HH__
#define __LINK_RANK_RANKING_COMPARATOR_HH__

#include "graph_index.hh"
#include "hits.hh"
#include "pagerank.hh"
#include <ostream>
#include <string>
#include <vector>

namespace link_rank {

// Parameters of one ranking request. HITS ignores the damping factor.
struct RankingRequest {
  double damping_factor{kDefaultDampingFactor};
  size_t max_iterations{kDefaultMaxIterations};
  double convergence_threshold{kDefaultConvergenceThreshold};
  bool track_history{false};
};

PageRankConfig ToPageRankConfig(const RankingRequest &request);
HitsConfig ToHitsConfig(const RankingRequest &request);

struct ComparisonResult {
  PageRankResult pagerank;
  HitsResult hits;
  // Nodes in both top lists, in PageRank order
  std::vector<std::string> overlap_authorities;
  std::vector<std::string> overlap_hubs;
  std::vector<std::string> insights;
  friend std::ostream &operator<<(std::ostream &os, const ComparisonResult &);
};

/**
 * @brief Runs PageRank and HITS on the same graph and relates the rankings
 *
 * @details Overlaps are plain set intersections of the top lists. Insights
 * are short human readable lines built from the overlaps, the leading node of
 * each ranking with its degrees, the iteration counts and the average
 * degrees of the graph.
 */
class RankingComparator {
public:
  explicit RankingComparator(const RankingRequest &request);

  // `network_type` selects the domain specific lines ("citation", "social").
  ComparisonResult Compare(const GraphIndex &index,
                           const std::string &network_type = "") const;

private:
  PageRank pagerank_;
  Hits hits_;
};

} // namespace link_rank

#endif
