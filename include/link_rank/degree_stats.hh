#ifndef __LINK_RANK_DEGREE_STATS_HH__
#define __LINK_RANK_DEGREE_STATS_HH__

#include "graph_index.hh"
#include <cstddef>
#include <ostream>
#include <string>
#include <unordered_map>

namespace link_rank {

struct NodeDegree {
  size_t in_degree{0};
  size_t out_degree{0};
  size_t total_degree{0};
};

using NodeDegreeMap = std::unordered_map<std::string, NodeDegree>;

// Graph level statistics. Edges with unknown endpoints are not counted.
struct NetworkStatistics {
  size_t num_nodes{0};
  size_t num_edges{0};
  double density{0.0};
  double avg_degree{0.0};
  double avg_in_degree{0.0};
  double avg_out_degree{0.0};
  friend std::ostream &operator<<(std::ostream &os, const NetworkStatistics &);
};

NodeDegree GetNodeDegree(const GraphIndex &index, size_t idx);
NodeDegreeMap GetNodeDegrees(const GraphIndex &index);
NetworkStatistics GetNetworkStatistics(const GraphIndex &index);

} // namespace link_rank

#endif
