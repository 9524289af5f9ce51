// tests/network_catalog_test.cc
#include "link_rank/network_catalog.hh"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace link_rank {
namespace {

const std::string kCitationCsv =
    std::string(LINK_RANK_DATA_DIR) + "/citation_network.csv";

TEST(EdgeListTest, ParsesAndTrimsRows) {
  std::istringstream in("source,target\n"
                        "  paper2 , paper1\n"
                        "paper3,paper1\r\n"
                        "\n"
                        "paper3 ,paper2\n");
  auto network = ParseEdgeList(in);
  ASSERT_TRUE(network.has_value());

  EXPECT_EQ(network->nodes,
            (std::vector<std::string>{"paper1", "paper2", "paper3"}));
  ASSERT_EQ(network->edges.size(), 3u);
  EXPECT_EQ(network->edges[0], (Edge{"paper2", "paper1"}));
  EXPECT_EQ(network->edges[1], (Edge{"paper3", "paper1"}));
  EXPECT_EQ(network->edges[2], (Edge{"paper3", "paper2"}));
}

TEST(EdgeListTest, HonoursColumnOrder) {
  std::istringstream in("weight,target,source\n"
                        "1,B,A\n"
                        "\"2\",\"C\",\"B\"\n");
  auto network = ParseEdgeList(in);
  ASSERT_TRUE(network.has_value());
  ASSERT_EQ(network->edges.size(), 2u);
  EXPECT_EQ(network->edges[0], (Edge{"A", "B"}));
  EXPECT_EQ(network->edges[1], (Edge{"B", "C"}));
}

TEST(EdgeListTest, KeepsDuplicateEdges) {
  std::istringstream in("source,target\nA,B\nA,B\nB,B\n");
  auto network = ParseEdgeList(in);
  ASSERT_TRUE(network.has_value());
  EXPECT_EQ(network->edges.size(), 3u);
  EXPECT_EQ(network->nodes.size(), 2u);
}

TEST(EdgeListTest, SkipsShortRows) {
  std::istringstream in("source,target\nA,B\nlonely\nB,C\n");
  auto network = ParseEdgeList(in);
  ASSERT_TRUE(network.has_value());
  EXPECT_EQ(network->edges.size(), 2u);
}

TEST(EdgeListTest, RequiresHeader) {
  std::istringstream missing_column("from,to\nA,B\n");
  EXPECT_FALSE(ParseEdgeList(missing_column).has_value());

  std::istringstream empty("");
  EXPECT_FALSE(ParseEdgeList(empty).has_value());
}

TEST(EdgeListTest, HeaderOnlyGivesEmptyNetwork) {
  std::istringstream in("source,target\n");
  auto network = ParseEdgeList(in);
  ASSERT_TRUE(network.has_value());
  EXPECT_TRUE(network->nodes.empty());
  EXPECT_TRUE(network->edges.empty());
}

TEST(EdgeListTest, LoadsBundledCitationNetwork) {
  auto network = LoadNetworkFromCsv(kCitationCsv);
  ASSERT_TRUE(network.has_value());
  EXPECT_EQ(network->csv_file, kCitationCsv);
  EXPECT_FALSE(network->nodes.empty());
  EXPECT_FALSE(network->edges.empty());
}

TEST(EdgeListTest, MissingFileFails) {
  EXPECT_FALSE(LoadNetworkFromCsv("/nonexistent/edges.csv").has_value());
}

TEST(NetworkCatalogTest, RegistersAndResolvesNetworks) {
  NetworkCatalog catalog;
  ASSERT_TRUE(catalog.AddFromCsv("citation", "Academic Citation Network",
                                 "Research papers citing each other",
                                 kCitationCsv));

  auto network = catalog.Get("citation");
  ASSERT_NE(network, nullptr);
  EXPECT_EQ(network->name, "Academic Citation Network");
  EXPECT_EQ(network->type, "citation");
  const auto counts = "(" + std::to_string(network->nodes.size()) +
                      " nodes, " + std::to_string(network->edges.size()) +
                      " edges)";
  EXPECT_NE(network->description.find(counts), std::string::npos);

  EXPECT_EQ(catalog.Get("social"), nullptr);
}

TEST(NetworkCatalogTest, RejectsDuplicateTypes) {
  NetworkCatalog catalog;
  Network first;
  first.type = "custom";
  Network second;
  second.type = "custom";
  EXPECT_TRUE(catalog.Add(first));
  EXPECT_FALSE(catalog.Add(second));
  EXPECT_EQ(catalog.size(), 1u);
}

TEST(NetworkCatalogTest, ListsByType) {
  NetworkCatalog catalog;
  Network social;
  social.type = "social";
  Network citation;
  citation.type = "citation";
  catalog.Add(social);
  catalog.Add(citation);

  auto networks = catalog.List();
  ASSERT_EQ(networks.size(), 2u);
  EXPECT_EQ(networks[0]->type, "citation");
  EXPECT_EQ(networks[1]->type, "social");
}

TEST(NetworkCatalogTest, FailedLoadRegistersNothing) {
  NetworkCatalog catalog;
  EXPECT_FALSE(catalog.AddFromCsv("custom", "Custom", "", "/nonexistent.csv"));
  EXPECT_EQ(catalog.size(), 0u);
}

} // namespace
} // namespace link_rank
