#include "degree_stats.hh"

namespace link_rank {

NodeDegree GetNodeDegree(const GraphIndex &index, size_t idx) {
  NodeDegree degree;
  degree.in_degree = index.InDegree(idx);
  degree.out_degree = index.OutDegree(idx);
  degree.total_degree = degree.in_degree + degree.out_degree;
  return degree;
}

NodeDegreeMap GetNodeDegrees(const GraphIndex &index) {
  NodeDegreeMap degrees;
  degrees.reserve(index.size());
  for (size_t i = 0; i < index.size(); ++i) {
    degrees.emplace(index.Label(i), GetNodeDegree(index, i));
  }
  return degrees;
}

NetworkStatistics GetNetworkStatistics(const GraphIndex &index) {
  NetworkStatistics stats;
  stats.num_nodes = index.size();
  stats.num_edges = index.edge_count();

  const auto nodes = static_cast<double>(stats.num_nodes);
  const auto edges = static_cast<double>(stats.num_edges);
  if (stats.num_nodes > 1) {
    stats.density = edges / (nodes * (nodes - 1.0));
  }
  if (stats.num_nodes > 0) {
    // Every edge adds one to an in-degree and one to an out-degree
    stats.avg_degree = 2.0 * edges / nodes;
    stats.avg_in_degree = edges / nodes;
    stats.avg_out_degree = edges / nodes;
  }
  return stats;
}

std::ostream &operator<<(std::ostream &os, const NetworkStatistics &stats) {
  os << "Network Statistics:\n"
     << "  Nodes:              " << stats.num_nodes << "\n"
     << "  Edges:              " << stats.num_edges << "\n"
     << "  Density:            " << stats.density << "\n"
     << "  Average degree:     " << stats.avg_degree << "\n"
     << "  Average in-degree:  " << stats.avg_in_degree << "\n"
     << "  Average out-degree: " << stats.avg_out_degree;
  return os;
}

} // namespace link_rank
