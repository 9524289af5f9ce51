#ifndef __LINK_RANK_RANKING_HH__
#define __LINK_RANK_RANKING_HH__

#include "graph_index.hh"
#include <cstddef>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace link_rank {

constexpr size_t kDefaultTopK = 5;
constexpr double kDefaultConvergenceThreshold = 0.0001;
constexpr size_t kDefaultMaxIterations = 100;

using ScoreMap = std::unordered_map<std::string, double>;

struct RankedNode {
  std::string label;
  double score;

  bool operator==(const RankedNode &other) const {
    return label == other.label && score == other.score;
  }
};

// Label keyed copy of a dense score vector
ScoreMap ToScoreMap(const GraphIndex &index, const std::vector<double> &scores);

// Highest k scores, descending. Equal scores keep index order.
std::vector<RankedNode> TopK(const GraphIndex &index,
                             const std::vector<double> &scores,
                             size_t k = kDefaultTopK);

// Sum of |a[i] - b[i]|
double L1Distance(const std::vector<double> &a, const std::vector<double> &b);

// Divides by the Euclidean norm; an all-zero vector is left as is
void NormalizeL2(std::vector<double> &values);

std::ostream &operator<<(std::ostream &os, const std::vector<RankedNode> &top);

} // namespace link_rank

#endif
