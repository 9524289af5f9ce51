#ifndef __LINK_RANK_GRAPH_HH__
#define __LINK_RANK_GRAPH_HH__

#include <string>
#include <utility>
#include <vector>

namespace link_rank {

// Directed edge as (source label, target label)
using Edge = std::pair<std::string, std::string>;

// A named network as handed to the ranking engines. Labels are expected to be
// unique; edges may reference labels that are not in `nodes`.
struct Network {
  std::string name;
  std::string description;
  std::string type; // e.g. "citation", "social"
  std::string csv_file;
  std::vector<std::string> nodes;
  std::vector<Edge> edges;
};

} // namespace link_rank

#endif
