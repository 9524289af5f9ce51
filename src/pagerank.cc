#include "pagerank.hh"
#include "spdlog/spdlog.h"
#include <numeric>
#include <stdexcept>

namespace link_rank {

PageRank::PageRank(PageRankConfig config) : config_(config) {
  if (!(config_.damping_factor > 0.0 && config_.damping_factor < 1.0)) {
    throw std::invalid_argument("Damping factor must be in (0, 1)");
  }
  if (config_.max_iterations == 0) {
    throw std::invalid_argument("Maximum iterations must be positive");
  }
  if (!(config_.convergence_threshold > 0.0)) {
    throw std::invalid_argument("Convergence threshold must be positive");
  }
}

PageRankResult PageRank::EmptyResult() const {
  PageRankResult result;
  result.damping_factor = config_.damping_factor;
  result.convergence_threshold = config_.convergence_threshold;
  if (config_.track_history) {
    result.history.emplace();
  }
  return result;
}

PageRankResult
PageRank::BuildResult(const GraphIndex &index, std::vector<double> scores,
                      size_t iterations,
                      std::vector<PageRankIteration> history) const {
  // Rescale once, after the loop
  double total = std::accumulate(scores.begin(), scores.end(), 0.0);
  if (total > 0.0) {
    for (auto &score : scores) {
      score /= total;
    }
  }

  PageRankResult result = EmptyResult();
  result.node_scores = ToScoreMap(index, scores);
  result.top_nodes = TopK(index, scores);
  result.iterations = iterations;
  if (config_.track_history) {
    result.history = std::move(history);
  }
  return result;
}

PageRankResult PageRank::Calculate(const GraphIndex &index) const {
  const size_t n = index.size();
  if (n == 0) {
    spdlog::info("PageRank on empty graph");
    return EmptyResult();
  }

  const double nd = static_cast<double>(n);
  const double d = config_.damping_factor;
  const double teleport = (1.0 - d) / nd;

  std::vector<double> rank(n, 1.0 / nd);
  std::vector<double> next(n, 0.0);
  std::vector<PageRankIteration> history;

  spdlog::info("Running PageRank on {} nodes, {} edges (d = {})", n,
               index.edge_count(), d);

  size_t iterations = 0;
  double diff = 0.0;
  for (size_t iter = 0; iter < config_.max_iterations; ++iter) {
    // Mass held by nodes without out-links leaks to every node
    double dangling = 0.0;
    for (size_t j = 0; j < n; ++j) {
      if (index.OutDegree(j) == 0) {
        dangling += rank[j];
      }
    }
    const double base = teleport + d * dangling / nd;

    for (size_t i = 0; i < n; ++i) {
      double sum = 0.0;
      for (size_t j : index.InLinks(i)) {
        sum += rank[j] / static_cast<double>(index.OutDegree(j));
      }
      next[i] = base + d * sum;
    }

    diff = L1Distance(next, rank);
    rank.swap(next);
    iterations = iter + 1;

    if (config_.track_history) {
      history.push_back(PageRankIteration{iterations, ToScoreMap(index, rank)});
    }
    spdlog::debug("PageRank iteration {}: delta {:.3e}", iterations, diff);

    if (diff < config_.convergence_threshold) {
      break;
    }
  }

  if (diff >= config_.convergence_threshold) {
    spdlog::warn("PageRank hit iteration limit ({}) without converging",
                 config_.max_iterations);
  } else {
    spdlog::info("PageRank converged after {} iterations", iterations);
  }
  return BuildResult(index, std::move(rank), iterations, std::move(history));
}

PageRankResult PageRank::CalculateMatrix(const GraphIndex &index) const {
  const size_t n = index.size();
  if (n == 0) {
    spdlog::info("PageRank on empty graph");
    return EmptyResult();
  }

  const double nd = static_cast<double>(n);
  const double d = config_.damping_factor;
  const double teleport = (1.0 - d) / nd;

  // Row-major n x n, transition[i * n + j] = P(j -> i)
  std::vector<double> transition(n * n, 0.0);
  for (size_t j = 0; j < n; ++j) {
    const auto &outlinks = index.OutLinks(j);
    if (outlinks.empty()) {
      for (size_t i = 0; i < n; ++i) {
        transition[i * n + j] = 1.0 / nd;
      }
      continue;
    }
    const double weight = 1.0 / static_cast<double>(outlinks.size());
    for (size_t i : outlinks) {
      transition[i * n + j] += weight;
    }
  }

  std::vector<double> rank(n, 1.0 / nd);
  std::vector<double> next(n, 0.0);
  std::vector<PageRankIteration> history;

  spdlog::info("Running matrix PageRank on {} nodes, {} edges (d = {})", n,
               index.edge_count(), d);

  size_t iterations = 0;
  double diff = 0.0;
  for (size_t iter = 0; iter < config_.max_iterations; ++iter) {
    for (size_t i = 0; i < n; ++i) {
      const double *row = &transition[i * n];
      double sum = 0.0;
      for (size_t j = 0; j < n; ++j) {
        sum += row[j] * rank[j];
      }
      next[i] = d * sum + teleport;
    }

    diff = L1Distance(next, rank);
    rank.swap(next);
    iterations = iter + 1;

    if (config_.track_history) {
      history.push_back(PageRankIteration{iterations, ToScoreMap(index, rank)});
    }
    spdlog::debug("PageRank iteration {}: delta {:.3e}", iterations, diff);

    if (diff < config_.convergence_threshold) {
      break;
    }
  }

  if (diff >= config_.convergence_threshold) {
    spdlog::warn("PageRank hit iteration limit ({}) without converging",
                 config_.max_iterations);
  } else {
    spdlog::info("PageRank converged after {} iterations", iterations);
  }
  return BuildResult(index, std::move(rank), iterations, std::move(history));
}

std::ostream &operator<<(std::ostream &os, const PageRankResult &result) {
  os << "PageRank Results:\n"
     << "  Damping factor:        " << result.damping_factor << "\n"
     << "  Convergence threshold: " << result.convergence_threshold << "\n"
     << "  Iterations:            " << result.iterations << "\n"
     << "Top nodes:\n"
     << result.top_nodes;
  return os;
}

} // namespace link_rank
