// tests/ranking_controller_test.cc
#include "link_rank/ranking_controller.hh"

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace link_rank {
namespace {

class RankingControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    Network network;
    network.name = "Tiny Social Graph";
    network.description = "Three users mentioning each other";
    network.type = "social";
    network.nodes = {"ann", "bob", "cid"};
    network.edges = {{"ann", "bob"}, {"bob", "cid"}, {"cid", "ann"},
                     {"ann", "cid"}, {"ann", "nobody"}};
    ASSERT_TRUE(catalog_.Add(network));
  }

  NetworkCatalog catalog_;
  std::ostringstream out_;
  RankingController controller_{catalog_, out_};
};

TEST_F(RankingControllerTest, UnknownNetworkFails) {
  RankingRequest request;
  EXPECT_FALSE(controller_.ShowInfo("citation"));
  EXPECT_FALSE(controller_.ShowDegrees("citation"));
  EXPECT_FALSE(controller_.ShowDataset("citation"));
  EXPECT_FALSE(controller_.RunPageRank("citation", request, false));
  EXPECT_FALSE(controller_.RunHits("citation", request));
  EXPECT_FALSE(controller_.RunCompare("citation", request));
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(RankingControllerTest, ListsNetworks) {
  EXPECT_TRUE(controller_.ListNetworks());
  EXPECT_NE(out_.str().find("social: Tiny Social Graph"), std::string::npos);
  EXPECT_NE(out_.str().find("3 nodes, 5 edges"), std::string::npos);
}

TEST_F(RankingControllerTest, ShowsInfoWithStatistics) {
  EXPECT_TRUE(controller_.ShowInfo("social"));
  EXPECT_NE(out_.str().find("Network Statistics:"), std::string::npos);
}

TEST_F(RankingControllerTest, ShowsDegreesInNodeOrder) {
  EXPECT_TRUE(controller_.ShowDegrees("social"));
  const auto report = out_.str();
  auto ann = report.find("ann");
  auto bob = report.find("bob");
  auto cid = report.find("cid");
  ASSERT_NE(ann, std::string::npos);
  EXPECT_LT(ann, bob);
  EXPECT_LT(bob, cid);
}

TEST_F(RankingControllerTest, ShowsDatasetSample) {
  EXPECT_TRUE(controller_.ShowDataset("social"));
  const auto report = out_.str();
  EXPECT_NE(report.find("CSV file:    N/A"), std::string::npos);
  EXPECT_NE(report.find("ann -> nobody"), std::string::npos);
}

TEST_F(RankingControllerTest, PrintsPageRankHistory) {
  RankingRequest request;
  request.track_history = true;
  EXPECT_TRUE(controller_.RunPageRank("social", request, true));
  const auto report = out_.str();
  EXPECT_NE(report.find("PageRank Results:"), std::string::npos);
  EXPECT_NE(report.find("Iteration 1:"), std::string::npos);
}

TEST_F(RankingControllerTest, PrintsHitsHistory) {
  RankingRequest request;
  request.track_history = true;
  EXPECT_TRUE(controller_.RunHits("social", request));
  const auto report = out_.str();
  EXPECT_NE(report.find("HITS Results:"), std::string::npos);
  EXPECT_NE(report.find("Authorities:"), std::string::npos);
  EXPECT_NE(report.find("Hubs:"), std::string::npos);
}

TEST_F(RankingControllerTest, ComparesWithDomainInsights) {
  RankingRequest request;
  EXPECT_TRUE(controller_.RunCompare("social", request));
  EXPECT_NE(out_.str().find("influential users"), std::string::npos);
}

TEST_F(RankingControllerTest, InvalidRequestThrows) {
  RankingRequest request;
  request.damping_factor = 1.5;
  EXPECT_THROW(controller_.RunPageRank("social", request, false),
               std::invalid_argument);
}

} // namespace
} // namespace link_rank
