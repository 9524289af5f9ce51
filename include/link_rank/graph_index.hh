#ifndef __LINK_RANK_GRAPH_INDEX_HH__
#define __LINK_RANK_GRAPH_INDEX_HH__

#include "graph.hh"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace link_rank {

/**
 * @brief Dense index space over a labelled directed graph
 *
 * @details Labels are numbered 0..n-1 in the order they are given. Forward
 * and reverse adjacency lists keep duplicates, so parallel edges and
 * self-loops count once per occurrence. Edges with an endpoint that is not a
 * known label are dropped.
 */
class GraphIndex {
public:
  GraphIndex(const std::vector<std::string> &nodes,
             const std::vector<Edge> &edges);
  explicit GraphIndex(const Network &network);

  size_t size() const { return labels_.size(); }
  bool empty() const { return labels_.empty(); }

  // Number of edges kept / dropped for unknown endpoints
  size_t edge_count() const { return edge_count_; }
  size_t dropped_edge_count() const { return dropped_edge_count_; }

  const std::string &Label(size_t idx) const { return labels_.at(idx); }
  const std::vector<std::string> &Labels() const { return labels_; }
  std::optional<size_t> IndexOf(const std::string &label) const;

  const std::vector<size_t> &OutLinks(size_t idx) const {
    return outlinks_.at(idx);
  }
  const std::vector<size_t> &InLinks(size_t idx) const {
    return inlinks_.at(idx);
  }
  size_t OutDegree(size_t idx) const { return outlinks_.at(idx).size(); }
  size_t InDegree(size_t idx) const { return inlinks_.at(idx).size(); }

private:
  std::vector<std::string> labels_;
  std::unordered_map<std::string, size_t> index_;
  std::vector<std::vector<size_t>> outlinks_;
  std::vector<std::vector<size_t>> inlinks_;
  size_t edge_count_{0};
  size_t dropped_edge_count_{0};
};

} // namespace link_rank

#endif
