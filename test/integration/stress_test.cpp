#include <gtest/gtest.h>
#include <algorithm>
#include <iostream>
#include <vector>
#include "../randomgraphs/random_graph_generator.h"
#include "../../src/lp_solver/ORToolsBackend.h"
#include "../../src/matching/MaxWeightMatching.h"
#include "../../src/utils/timer.h"


namespace {

// exhaustive search over all matchings, only for tiny graphs
double bruteForceMatching(const IGraph& g, const WeightMatrix& w, std::vector<bool>& used, int v) {
    const int n = g.getNumNodes();
    while (v < n && used[v]) v++;
    if (v >= n) return 0.0;

    // leave v unmatched
    double best = bruteForceMatching(g, w, used, v + 1);

    used[v] = true;
    for (int u : g.neighbors(v)) {
        if (used[u]) continue;
        used[u] = true;
        best = std::max(best, w.get(std::min(u, v), std::max(u, v)) + bruteForceMatching(g, w, used, v + 1));
        used[u] = false;
    }
    used[v] = false;
    return best;
}

double bruteForceMatching(const IGraph& g, const WeightMatrix& w) {
    std::vector<bool> used(g.getNumNodes(), false);
    return bruteForceMatching(g, w, used, 0);
}

}


TEST(StressTest, RandomGraphsAgainstBruteForce) {
    unsigned seed = 17;
    for (int n = 3; n <= 8; n++) {
        const int max_edges = n * (n - 1) / 2;
        for (int m : {n - 1, n, (n + max_edges) / 2, max_edges}) {
            GraphADJ g = RandomGraphGenerator::generate(n, std::min(m, max_edges), seed++);
            WeightMatrix w = RandomGraphGenerator::randomWeights(g, 1, 10, seed++);
            const double expected = bruteForceMatching(g, w);

            auto backend = makeBackend(BackendType::AUTO, g);
            MatchingResult result = maximumWeightMatching(g, *backend, w);

            ASSERT_TRUE(result.isOptimal()) << "n=" << n << " m=" << m;
            EXPECT_TRUE(result.isValid()) << "n=" << n << " m=" << m;
            EXPECT_NEAR(result.cost, expected, 1e-6) << "n=" << n << " m=" << m;
            EXPECT_NEAR(result.matchedWeight(w), result.cost, 1e-6) << "n=" << n << " m=" << m;
        }
    }
}

TEST(StressTest, RandomBipartiteRelaxationIsIntegral) {
    unsigned seed = 101;
    for (int trial = 0; trial < 10; trial++) {
        GraphADJ g = RandomGraphGenerator::generateBipartite(4, 5, 12, seed++);
        WeightMatrix w = RandomGraphGenerator::randomWeights(g, 1, 20, seed++);
        const double expected = bruteForceMatching(g, w);
        ASSERT_TRUE(g.isBipartite());

        ORToolsBackend glop("GLOP");
        // strict extraction throws on any fractional edge value
        MatchingResult result = maximumWeightMatching(g, glop, w);

        EXPECT_TRUE(result.isOptimal());
        EXPECT_TRUE(result.isValid());
        EXPECT_NEAR(result.cost, expected, 1e-6) << "trial " << trial;
    }
}

TEST(StressTest, CardinalityOnRandomGraphs) {
    unsigned seed = 7;
    for (int trial = 0; trial < 5; trial++) {
        GraphADJ g = RandomGraphGenerator::generate(8, 12, seed++);
        WeightMatrix unit = defaultWeights(g);
        const double expected = bruteForceMatching(g, unit);

        auto backend = makeBackend(BackendType::AUTO, g);
        MatchingResult result = maximumWeightMatching(g, *backend);

        EXPECT_NEAR(result.cost, expected, 1e-6);
        EXPECT_EQ(result.numMatchedPairs(), static_cast<int>(expected + 0.5));
    }
}

TEST(StressTest, LargeBipartiteGraphRunningTime) {
    constexpr int side = 60;
    constexpr int num_edges = 1200;
    GraphADJ g = RandomGraphGenerator::generateBipartite(side, side, num_edges, 2024);
    WeightMatrix w = RandomGraphGenerator::randomWeights(g, 1, 100, 2025);

    ORToolsBackend glop("GLOP");
    auto t0 = timeNow();
    MatchingResult result = maximumWeightMatching(g, glop, w);
    double solve_time = duration(timeNow() - t0);

    EXPECT_TRUE(result.isOptimal());
    EXPECT_TRUE(result.isValid());
    EXPECT_NEAR(result.matchedWeight(w), result.cost, 1e-4);
    std::cout << "Bipartite " << side << "x" << side << " with " << num_edges
              << " edges solved in " << solve_time << " ms\n";
}
