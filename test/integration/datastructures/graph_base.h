#ifndef MAXWEIGHTMATCHING_GRAPH_BASE_H
#define MAXWEIGHTMATCHING_GRAPH_BASE_H

#pragma once
#include <gtest/gtest.h>
#include "../../../src/datastructures/GraphADJ.h"
#include "../../../src/datastructures/GraphCSR.h"


template <typename GraphType>
class IGraphTest : public ::testing::Test {
public:
    GraphType G;

    void buildSimpleTriangle() {
        // Graph with 3 nodes: 0-1-2-0
        G = GraphType(3);
        G.addEdge(0, 1);
        G.addEdge(1, 2);
        G.addEdge(2, 0);

        // CSR must finalize
        G.finalize();
    }

    void buildEvenCycle(int n) {
        G = GraphType(n);
        for (int v = 0; v < n; ++v) {
            G.addEdge(v, (v + 1) % n);
        }
        G.finalize();
    }
};

TYPED_TEST_SUITE_P(IGraphTest);



#endif //MAXWEIGHTMATCHING_GRAPH_BASE_H
