#ifndef __LINK_RANK_RANKING_CONTROLLER_HH__
#define __LINK_RANK_RANKING_CONTROLLER_HH__

#include "network_catalog.hh"
#include "ranking_comparator.hh"
#include <memory>
#include <ostream>
#include <string>

namespace link_rank {

/**
 * @brief Resolves a network from the catalog and writes reports for it
 *
 * @details Every handler returns false when the requested network type is
 * not in the catalog. Reports go to the stream given at construction.
 */
class RankingController {
public:
  RankingController(const NetworkCatalog &catalog, std::ostream &out);

  // Non-copyable
  RankingController(const RankingController &) = delete;
  RankingController &operator=(const RankingController &) = delete;

  bool ListNetworks();
  bool ShowInfo(const std::string &type);
  bool ShowDegrees(const std::string &type);
  bool ShowDataset(const std::string &type);

  bool RunPageRank(const std::string &type, const RankingRequest &request,
                   bool use_matrix);
  bool RunHits(const std::string &type, const RankingRequest &request);
  bool RunCompare(const std::string &type, const RankingRequest &request);

private:
  std::shared_ptr<const Network> Resolve(const std::string &type) const;

  const NetworkCatalog &catalog_;
  std::ostream &out_;
};

} // namespace link_rank

#endif
