#ifndef __LINK_RANK_NETWORK_CATALOG_HH__
#define __LINK_RANK_NETWORK_CATALOG_HH__

#include "graph.hh"
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace link_rank {

// Reads a `source,target` edge list. The header row is required; columns may
// appear in any order and extra columns are ignored. Values are whitespace
// trimmed. Nodes are the sorted set of all endpoints.
// Returns: nullopt if the header is missing or lacks a required column.
std::optional<Network> ParseEdgeList(std::istream &in);

// Same as ParseEdgeList, reading from `csv_path` and recording it in the
// returned network. Returns nullopt if the file can't be opened.
std::optional<Network> LoadNetworkFromCsv(const std::string &csv_path);

/**
 * @brief Named sample networks, loaded once and read-only afterwards
 *
 * @details Networks are stored as shared immutable objects so that callers
 * can hold on to them for the duration of a ranking call without copying.
 */
class NetworkCatalog {
public:
  // Returns false if a network of the same type is already registered.
  bool Add(Network network);

  // Loads `csv_path` and registers it under `type`. The description gets the
  // node and edge counts appended.
  bool AddFromCsv(const std::string &type, const std::string &name,
                  const std::string &description, const std::string &csv_path);

  // Returns: nullptr if no network of that type exists
  std::shared_ptr<const Network> Get(const std::string &type) const;

  // All networks ordered by type
  std::vector<std::shared_ptr<const Network>> List() const;

  size_t size() const { return networks_.size(); }

private:
  std::map<std::string, std::shared_ptr<const Network>> networks_;
};

} // namespace link_rank

#endif
