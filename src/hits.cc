#include "hits.hh"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace link_rank {

Hits::Hits(HitsConfig config) : config_(config) {
  if (config_.max_iterations == 0) {
    throw std::invalid_argument("Maximum iterations must be positive");
  }
  if (!(config_.convergence_threshold > 0.0)) {
    throw std::invalid_argument("Convergence threshold must be positive");
  }
}

HitsResult Hits::Calculate(const GraphIndex &index) const {
  HitsResult result;
  result.convergence_threshold = config_.convergence_threshold;
  if (config_.track_history) {
    result.history.emplace();
  }

  const size_t n = index.size();
  if (n == 0) {
    spdlog::info("HITS on empty graph");
    return result;
  }

  spdlog::info("Running HITS on {} nodes, {} edges", n, index.edge_count());

  // Double buffered: *_next is written from the frozen authority/hub only
  std::vector<double> authority(n, 1.0);
  std::vector<double> hub(n, 1.0);
  std::vector<double> authority_next(n);
  std::vector<double> hub_next(n);

  size_t iterations = 0;
  bool converged = false;
  for (size_t iter = 0; iter < config_.max_iterations; ++iter) {
    for (size_t i = 0; i < n; ++i) {
      double sum = 0.0;
      for (size_t j : index.InLinks(i)) {
        sum += hub[j];
      }
      authority_next[i] = sum;
    }
    for (size_t i = 0; i < n; ++i) {
      double sum = 0.0;
      for (size_t j : index.OutLinks(i)) {
        sum += authority[j];
      }
      hub_next[i] = sum;
    }

    NormalizeL2(authority_next);
    NormalizeL2(hub_next);

    double authority_diff = L1Distance(authority_next, authority);
    double hub_diff = L1Distance(hub_next, hub);

    authority.swap(authority_next);
    hub.swap(hub_next);
    iterations = iter + 1;

    if (config_.track_history) {
      result.history->push_back(HitsIteration{iterations,
                                              ToScoreMap(index, authority),
                                              ToScoreMap(index, hub)});
    }
    spdlog::debug("HITS iteration {}: authority delta {:.3e}, hub delta {:.3e}",
                  iterations, authority_diff, hub_diff);

    if (authority_diff < config_.convergence_threshold &&
        hub_diff < config_.convergence_threshold) {
      converged = true;
      break;
    }
  }

  if (converged) {
    spdlog::info("HITS converged after {} iterations", iterations);
  } else {
    spdlog::warn("HITS hit iteration limit ({}) without converging",
                 config_.max_iterations);
  }

  result.authority_scores = ToScoreMap(index, authority);
  result.hub_scores = ToScoreMap(index, hub);
  result.top_authorities = TopK(index, authority);
  result.top_hubs = TopK(index, hub);
  result.iterations = iterations;
  return result;
}

std::ostream &operator<<(std::ostream &os, const HitsResult &result) {
  os << "HITS Results:\n"
     << "  Convergence threshold: " << result.convergence_threshold << "\n"
     << "  Iterations:            " << result.iterations << "\n"
     << "Top authorities:\n"
     << result.top_authorities << "Top hubs:\n"
     << result.top_hubs;
  return os;
}

} // namespace link_rank
