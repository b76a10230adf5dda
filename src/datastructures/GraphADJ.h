#ifndef MAXWEIGHTMATCHING_GRAPH_ADJ_H
#define MAXWEIGHTMATCHING_GRAPH_ADJ_H

#include <vector>
#include <unordered_map>
#include <utility>
#include "IGraph.h"
#include "../utils/hash.h"


/*
 * Adjacency list graph. Edge ids are handed out in insertion order,
 * which makes the edge list stable while edges are still being added.
 */
class GraphADJ : public IGraph {
    std::vector<std::vector<int>> m_adj;

    // this for also being able to use the edge based accessor
    std::vector<Edge> m_edgeList;                 // e -> (u, v), u < v
    std::unordered_map<std::pair<int, int>, int, PairHash> m_uvToEdge;

public:
    GraphADJ() = default;

    explicit GraphADJ(int num_nodes)
        : IGraph(num_nodes),
          m_adj(num_nodes)
    {}

    GraphADJ(const GraphADJ&)            = default;
    GraphADJ(GraphADJ&&) noexcept        = default;
    GraphADJ& operator=(const GraphADJ&) = default;
    GraphADJ& operator=(GraphADJ&&) noexcept = default;
    ~GraphADJ() override              = default;

    // derived methods
    IGraph::NeighborRange neighbors(int u) const override;
    void addEdge(int u , int v) override;

    // Edge based indexing
    int getEdgeId(int u, int v) const override;
    Edge edgeEndpoints(int e) const override;

    void InitializeMemberByParser(int maxNodeIdSeen) override;

    void finalize() override {
        // do nothing
        return;
    }
};



#endif //MAXWEIGHTMATCHING_GRAPH_ADJ_H
