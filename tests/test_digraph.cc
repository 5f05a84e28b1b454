#include <gtest/gtest.h>
#include <digraph/digraph.h>
#include <digraph/exceptions.h>

using bninf::DirectedGraph;
using bninf::VertexNameList;

class DirectedGraphTest : public ::testing::Test {
protected:
    DirectedGraph graph;
};

TEST_F(DirectedGraphTest, AddVertexIsIdempotent) {
    graph.AddVertex("a");
    graph.AddVertex("b");
    graph.AddVertex("a");

    ASSERT_EQ(graph.Size(), 2u);
    EXPECT_EQ(graph.GetVertices()[0].name, "a");
    EXPECT_EQ(graph.GetVertices()[1].name, "b");
    EXPECT_EQ(graph.GetIndex("b"), 1u);
}

TEST_F(DirectedGraphTest, AddEdgeCreatesEndpoints) {
    const bninf::Edge &kEdge = graph.AddEdge("p", "c");

    EXPECT_EQ(kEdge.p, "p");
    EXPECT_EQ(kEdge.c, "c");
    EXPECT_DOUBLE_EQ(kEdge.weight, 1);
    EXPECT_TRUE(graph.HasVertex("p"));
    EXPECT_TRUE(graph.HasVertex("c"));
    EXPECT_EQ(graph.Size(), 2u);
}

TEST_F(DirectedGraphTest, ChildIsNeighborOfParentOnly) {
    graph.AddEdge("p", "c");

    EXPECT_EQ(graph.GetChildren("p").count("c"), 1u);
    EXPECT_TRUE(graph.GetChildren("c").empty());
    EXPECT_TRUE(graph.HasEdge("p", "c"));
    EXPECT_FALSE(graph.HasEdge("c", "p"));
}

TEST_F(DirectedGraphTest, SecondEdgeWithOtherWeightIsIgnored) {
    graph.AddEdge("p", "c", 2.5);
    const bninf::Edge &kEdge = graph.AddEdge("p", "c", 7);

    EXPECT_DOUBLE_EQ(kEdge.weight, 2.5);
    EXPECT_EQ(graph.NrEdges(), 1u);
    EXPECT_DOUBLE_EQ(graph.GetEdge("p", "c").weight, 2.5);
}

TEST_F(DirectedGraphTest, ParentsFollowVertexOrder) {
    graph.AddVertex("cloudy");
    graph.AddEdge("cloudy", "sprinkler");
    graph.AddEdge("cloudy", "rain");
    graph.AddEdge("rain", "grass_wet");
    graph.AddEdge("sprinkler", "grass_wet");

    EXPECT_EQ(graph.GetParents("grass_wet"), VertexNameList({"sprinkler", "rain"}));
    EXPECT_EQ(graph.GetParents("rain"), VertexNameList({"cloudy"}));
    EXPECT_TRUE(graph.GetParents("cloudy").empty());
}

TEST_F(DirectedGraphTest, EdgesKeepInsertionOrder) {
    graph.AddEdge("b", "c");
    graph.AddEdge("a", "c");

    ASSERT_EQ(graph.GetEdges().size(), 2u);
    EXPECT_EQ(graph.GetEdges()[0], bninf::Edge("b", "c"));
    EXPECT_EQ(graph.GetEdges()[1], bninf::Edge("a", "c"));
    EXPECT_TRUE(graph.GetEdges()[1] < graph.GetEdges()[0]);
}

TEST_F(DirectedGraphTest, UnknownVertexThrows) {
    graph.AddVertex("a");

    EXPECT_THROW(graph.GetVertex("missing"), bninf::NotFoundException);
    EXPECT_THROW(graph.GetParents("missing"), bninf::NotFoundException);
    EXPECT_THROW(graph.GetIndex("missing"), bninf::GraphException);
    EXPECT_THROW(graph.GetEdge("a", "missing"), bninf::NotFoundException);
}

TEST_F(DirectedGraphTest, NotFoundMessageNamesVertex) {
    try {
        graph.GetVertex("ghost");
        FAIL() << "expected NotFoundException";
    } catch (bninf::NotFoundException &exception) {
        EXPECT_NE(std::string(exception.what()).find("ghost"), std::string::npos);
    }
}
