#include "gtest/gtest.h"
#include "../../src/datastructures/GraphADJ.h"
#include "../../src/datastructures/GraphCSR.h"
#include "../../src/lp_solver/ORToolsBackend.h"
#include "../../src/matching/MaxWeightMatching.h"
#include <stdexcept>


TEST(LPSolver_TriangleGraph, DefaultWeightsMatchOnePair) {
    GraphADJ g(3);
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    g.addEdge(0, 2);

    auto backend = makeMipBackend();
    MatchingResult result = maximumWeightMatching(g, *backend);

    EXPECT_TRUE(result.isOptimal());
    EXPECT_NEAR(result.cost, 1.0, 1e-6);
    EXPECT_EQ(result.numMatchedPairs(), 1);
    EXPECT_TRUE(result.isValid());
}

TEST(LPSolver_TriangleGraph, RelaxationBackendIsRejected) {
    GraphADJ g(3);
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    g.addEdge(0, 2);

    ORToolsBackend glop("GLOP");
    EXPECT_THROW(maximumWeightMatching(g, glop), std::invalid_argument);
}

TEST(LPSolver_PathGraph, HeavyMiddleEdge) {
    GraphADJ g(4);
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    g.addEdge(2, 3);

    WeightMatrix w(4);
    w.set(0, 1, 1.0);
    w.set(1, 2, 5.0);
    w.set(2, 3, 1.0);

    ORToolsBackend glop("GLOP");
    MatchingResult result = maximumWeightMatching(g, glop, w);

    EXPECT_TRUE(result.isOptimal());
    EXPECT_NEAR(result.cost, 5.0, 1e-6);
    EXPECT_EQ(result.mate, (std::vector<int>{-1, 2, 1, -1}));
}

TEST(LPSolver_BipartiteGraph, TwoByTwo) {
    GraphADJ g(4);
    g.addEdge(0, 2);
    g.addEdge(0, 3);
    g.addEdge(1, 2);
    g.addEdge(1, 3);

    WeightMatrix w(4);
    w.set(0, 2, 2.0);
    w.set(0, 3, 1.0);
    w.set(1, 2, 1.0);
    w.set(1, 3, 3.0);

    ORToolsBackend glop("GLOP");
    MatchingResult result = maximumWeightMatching(g, glop, w);

    EXPECT_TRUE(result.isOptimal());
    EXPECT_NEAR(result.cost, 5.0, 1e-6);
    EXPECT_EQ(result.mate, (std::vector<int>{2, 3, 0, 1}));
    EXPECT_NEAR(result.matchedWeight(w), result.cost, 1e-6);
}

TEST(LPSolver_BipartiteGraph, MipBackendAgreesWithRelaxation) {
    GraphADJ g(4);
    g.addEdge(0, 2);
    g.addEdge(0, 3);
    g.addEdge(1, 2);
    g.addEdge(1, 3);

    WeightMatrix w_lp(4);
    w_lp.set(0, 2, 2.0);
    w_lp.set(0, 3, 1.0);
    w_lp.set(1, 2, 1.0);
    w_lp.set(1, 3, 3.0);
    WeightMatrix w_mip = w_lp;

    ORToolsBackend glop("GLOP");
    auto mip = makeMipBackend();
    MatchingResult lp_result = maximumWeightMatching(g, glop, w_lp);
    MatchingResult mip_result = maximumWeightMatching(g, *mip, w_mip);

    EXPECT_NEAR(lp_result.cost, mip_result.cost, 1e-6);
    EXPECT_EQ(lp_result.mate, mip_result.mate);
}

TEST(LPSolver_BipartiteGraph, ThreeByThreeRelaxationIsIntegral) {
    // unique optimum on the diagonal: 7 + 8 + 9
    const double weights[3][3] = {{7, 2, 3}, {1, 8, 4}, {5, 3, 9}};
    GraphADJ g(6);
    WeightMatrix w(6);
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            g.addEdge(i, 3 + j);
            w.set(i, 3 + j, weights[i][j]);
        }
    }

    ORToolsBackend glop("GLOP");
    MatchingResult result = maximumWeightMatching(g, glop, w); // strict: throws on fractional values

    EXPECT_NEAR(result.cost, 24.0, 1e-6);
    EXPECT_EQ(result.mate, (std::vector<int>{3, 4, 5, 0, 1, 2}));
}

TEST(LPSolver_EmptyGraph, NothingIsMatched) {
    GraphADJ g(5);

    ORToolsBackend glop("GLOP");
    MatchingResult result = maximumWeightMatching(g, glop);

    EXPECT_TRUE(result.isOptimal());
    EXPECT_NEAR(result.cost, 0.0, 1e-9);
    EXPECT_EQ(result.mate, (std::vector<int>(5, UNMATCHED_VERTEX)));
}

TEST(LPSolver_OddCycle, FiveCycleCardinality) {
    GraphADJ g(5);
    for (int v = 0; v < 5; v++) {
        g.addEdge(v, (v + 1) % 5);
    }

    auto backend = makeBackend(BackendType::AUTO, g);
    MatchingResult result = maximumWeightMatching(g, *backend);

    EXPECT_TRUE(backend->isMip());
    EXPECT_NEAR(result.cost, 2.0, 1e-6);
    EXPECT_EQ(result.numMatchedPairs(), 2);
    EXPECT_TRUE(result.isValid());
}

TEST(LPSolver_Petersen, HasPerfectMatching) {
    GraphCSR g(10);
    for (int i = 0; i < 5; i++) {
        g.addEdge(i, (i + 1) % 5);         // outer cycle
        g.addEdge(5 + i, 5 + (i + 2) % 5); // inner pentagram
        g.addEdge(i, 5 + i);               // spokes
    }
    g.finalize();
    ASSERT_EQ(g.getNumEdges(), 15);
    ASSERT_FALSE(g.isBipartite());

    auto backend = makeMipBackend();
    MatchingResult result = maximumWeightMatching(g, *backend);

    EXPECT_NEAR(result.cost, 5.0, 1e-6);
    EXPECT_EQ(result.numMatchedPairs(), 5);
    for (int v : result.mate) {
        EXPECT_NE(v, UNMATCHED_VERTEX);
    }
}

TEST(LPSolver_WeightedTriangle, AsymmetricInputAndStrayEntries) {
    GraphADJ g(4);
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    g.addEdge(0, 2);
    g.addEdge(2, 3);

    WeightMatrix w(4);
    w.set(1, 0, 4.0);  // lower entry only
    w.set(1, 2, 3.0);
    w.set(0, 2, 1.0);
    w.set(2, 3, 2.0);
    w.set(1, 3, 100.0); // not an edge

    auto backend = makeMipBackend();
    MatchingResult result = maximumWeightMatching(g, *backend, w);

    // {0,1} + {2,3} = 6
    EXPECT_NEAR(result.cost, 6.0, 1e-6);
    EXPECT_EQ(result.mate, (std::vector<int>{1, 0, 3, 2}));
    EXPECT_NEAR(result.matchedWeight(w), result.cost, 1e-6);
}

TEST(LPSolver_StarGraph, NegativeWeightsAreNotSelected) {
    GraphADJ g(4);
    g.addEdge(0, 1);
    g.addEdge(0, 2);
    g.addEdge(0, 3);

    WeightMatrix w(4);
    w.set(0, 1, -2.0);
    w.set(0, 2, 3.0);
    w.set(0, 3, 1.0);

    ORToolsBackend glop("GLOP");
    MatchingResult result = maximumWeightMatching(g, glop, w);

    EXPECT_NEAR(result.cost, 3.0, 1e-6);
    EXPECT_EQ(result.mate, (std::vector<int>{2, -1, 0, -1}));
}

TEST(LPSolver_Backend, ReusedAcrossSolves) {
    GraphADJ path(3);
    path.addEdge(0, 1);
    path.addEdge(1, 2);

    GraphADJ single(2);
    single.addEdge(0, 1);

    ORToolsBackend glop("GLOP");
    MatchingResult first = maximumWeightMatching(path, glop);
    MatchingResult second = maximumWeightMatching(single, glop);

    EXPECT_NEAR(first.cost, 1.0, 1e-6);
    EXPECT_EQ(glop.numVariables(), 1);
    EXPECT_EQ(second.mate, (std::vector<int>{1, 0}));
}

TEST(LPSolver_Backend, UnknownSolverIdThrows) {
    EXPECT_THROW(ORToolsBackend("NO_SUCH_SOLVER"), std::runtime_error);
}
