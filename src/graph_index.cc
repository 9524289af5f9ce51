#include "graph_index.hh"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace link_rank {

GraphIndex::GraphIndex(const std::vector<std::string> &nodes,
                       const std::vector<Edge> &edges)
    : labels_(nodes), outlinks_(nodes.size()), inlinks_(nodes.size()) {
  index_.reserve(nodes.size());
  for (size_t i = 0; i < labels_.size(); ++i) {
    if (!index_.emplace(labels_[i], i).second) {
      throw std::invalid_argument("Duplicate node label: " + labels_[i]);
    }
  }

  for (const auto &[source, target] : edges) {
    auto src = index_.find(source);
    auto dst = index_.find(target);
    if (src == index_.end() || dst == index_.end()) {
      spdlog::debug("Dropping edge {} -> {} with unknown endpoint", source,
                    target);
      ++dropped_edge_count_;
      continue;
    }
    outlinks_[src->second].push_back(dst->second);
    inlinks_[dst->second].push_back(src->second);
    ++edge_count_;
  }

  if (dropped_edge_count_ > 0) {
    spdlog::info("Dropped {} edge(s) referencing unknown nodes",
                 dropped_edge_count_);
  }
}

GraphIndex::GraphIndex(const Network &network)
    : GraphIndex(network.nodes, network.edges) {}

std::optional<size_t> GraphIndex::IndexOf(const std::string &label) const {
  if (auto it = index_.find(label); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

} // namespace link_rank
