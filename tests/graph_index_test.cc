// tests/graph_index_test.cc
#include "link_rank/graph_index.hh"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace link_rank {
namespace {

TEST(GraphIndexTest, AssignsIndicesInInsertionOrder) {
  GraphIndex index({"zeta", "alpha", "mid"}, {});
  ASSERT_EQ(index.size(), 3u);
  EXPECT_EQ(index.IndexOf("zeta"), 0u);
  EXPECT_EQ(index.IndexOf("alpha"), 1u);
  EXPECT_EQ(index.IndexOf("mid"), 2u);
  EXPECT_EQ(index.Label(1), "alpha");
  EXPECT_FALSE(index.IndexOf("missing").has_value());
}

TEST(GraphIndexTest, BuildsForwardAndReverseAdjacency) {
  GraphIndex index({"A", "B", "C"}, {{"A", "B"}, {"A", "C"}, {"B", "C"}});

  EXPECT_EQ(index.OutLinks(0), (std::vector<size_t>{1, 2}));
  EXPECT_EQ(index.OutLinks(1), (std::vector<size_t>{2}));
  EXPECT_TRUE(index.OutLinks(2).empty());

  EXPECT_TRUE(index.InLinks(0).empty());
  EXPECT_EQ(index.InLinks(1), (std::vector<size_t>{0}));
  EXPECT_EQ(index.InLinks(2), (std::vector<size_t>{0, 1}));
  EXPECT_EQ(index.edge_count(), 3u);
}

TEST(GraphIndexTest, DropsEdgesWithUnknownEndpoints) {
  GraphIndex index({"A", "B"},
                   {{"A", "B"}, {"A", "X"}, {"Y", "B"}, {"X", "Y"}});
  EXPECT_EQ(index.edge_count(), 1u);
  EXPECT_EQ(index.dropped_edge_count(), 3u);
  EXPECT_EQ(index.OutDegree(0), 1u);
  EXPECT_EQ(index.InDegree(1), 1u);
}

TEST(GraphIndexTest, KeepsParallelEdgesAndSelfLoops) {
  GraphIndex index({"A", "B"}, {{"A", "B"}, {"A", "B"}, {"B", "B"}});
  EXPECT_EQ(index.OutLinks(0), (std::vector<size_t>{1, 1}));
  EXPECT_EQ(index.InLinks(1), (std::vector<size_t>{0, 0, 1}));
  EXPECT_EQ(index.OutDegree(1), 1u);
  EXPECT_EQ(index.InDegree(1), 3u);
  EXPECT_EQ(index.edge_count(), 3u);
}

TEST(GraphIndexTest, EmptyGraph) {
  GraphIndex index({}, {{"A", "B"}});
  EXPECT_TRUE(index.empty());
  EXPECT_EQ(index.edge_count(), 0u);
  EXPECT_EQ(index.dropped_edge_count(), 1u);
}

TEST(GraphIndexTest, RejectsDuplicateLabels) {
  EXPECT_THROW(GraphIndex({"A", "B", "A"}, {}), std::invalid_argument);
}

TEST(GraphIndexTest, BuildsFromNetwork) {
  Network network;
  network.nodes = {"p1", "p2"};
  network.edges = {{"p2", "p1"}};
  GraphIndex index(network);
  EXPECT_EQ(index.size(), 2u);
  EXPECT_EQ(index.InDegree(0), 1u);
}

} // namespace
} // namespace link_rank
