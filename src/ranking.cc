#include "ranking.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <stdexcept>

namespace link_rank {

ScoreMap ToScoreMap(const GraphIndex &index,
                    const std::vector<double> &scores) {
  if (scores.size() != index.size()) {
    throw std::logic_error("Score vector does not match graph size");
  }
  ScoreMap map;
  map.reserve(scores.size());
  for (size_t i = 0; i < scores.size(); ++i) {
    map.emplace(index.Label(i), scores[i]);
  }
  return map;
}

std::vector<RankedNode> TopK(const GraphIndex &index,
                             const std::vector<double> &scores, size_t k) {
  if (scores.size() != index.size()) {
    throw std::logic_error("Score vector does not match graph size");
  }
  std::vector<size_t> order(scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return scores[a] > scores[b];
  });

  std::vector<RankedNode> top;
  top.reserve(std::min(k, order.size()));
  for (size_t i = 0; i < order.size() && i < k; ++i) {
    top.push_back(RankedNode{index.Label(order[i]), scores[order[i]]});
  }
  return top;
}

double L1Distance(const std::vector<double> &a, const std::vector<double> &b) {
  double diff = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    diff += std::abs(a[i] - b[i]);
  }
  return diff;
}

void NormalizeL2(std::vector<double> &values) {
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += v * v;
  }
  double norm = std::sqrt(sum_sq);
  if (norm == 0.0) {
    return;
  }
  for (auto &v : values) {
    v /= norm;
  }
}

std::ostream &operator<<(std::ostream &os, const std::vector<RankedNode> &top) {
  if (top.empty()) {
    return os << "  (none)\n";
  }
  size_t rank = 1;
  for (const auto &node : top) {
    os << "  " << std::setw(2) << rank++ << ". " << std::left << std::setw(24)
       << node.label << std::right << std::fixed << std::setprecision(6)
       << node.score << "\n";
  }
  return os;
}

} // namespace link_rank
