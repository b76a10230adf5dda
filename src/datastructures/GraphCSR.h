#ifndef MAXWEIGHTMATCHING_GRAPH_CSR_H
#define MAXWEIGHTMATCHING_GRAPH_CSR_H
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>
#include "IGraph.h"



/*
 * The idea is to have a graph class that uses CSR format internally
 * to store the adjacency for faster access.
 * Each undirected edge {u, v} is stored as the two arcs (u,v) and (v,u);
 * arc_edge maps every arc back to the id of its undirected edge.
 */
class GraphCSR : public IGraph {
public:

    std::vector<int> to;         // size 2m, neighbor v for each arc
    std::vector<int> from;       // size 2m, source u for each arc
    std::vector<int> head;
    std::vector<int> arc_edge;   // size 2m, undirected edge id of each arc
    std::vector<Edge> edge_list; // size m, sorted by (u, v)
    bool is_processed = false;

    // Temporary storage before finalize()
    std::vector<Edge> tmp_edges;


    GraphCSR() = default;

    explicit GraphCSR(int num_nodes)
        : IGraph(num_nodes),
          head(num_nodes + 1, 0)
    {}

    GraphCSR(const GraphCSR&)            = default;
    GraphCSR(GraphCSR&&) noexcept        = default;
    GraphCSR& operator=(const GraphCSR&) = default;
    GraphCSR& operator=(GraphCSR&&) noexcept = default;
    ~GraphCSR() override                  = default;


    /*
     * The finalize method is used to preprocess the edges into index sorted vectors.
     * This method should be called after all edges have been added using addEdge().
     * If unsure whether finalize has been called, it is safe to call it again as it will
     * do nothing if the graph is already processed.
     */
    void finalize() override;

    void addEdge(int u, int v) override {

        if (u<0 || u>=n || v<0 || v>=n)
            throw std::out_of_range("GraphCSR::addEdge: node index");
        if (u == v)
            throw std::invalid_argument("GraphCSR::addEdge: no self-loops allowed (u == v)");

        tmp_edges.push_back(canonicalEdge(u, v));
        m++;

        is_processed = false;
    }


    // returns edge id for {u,v}, or -1 if not exists
    int getEdgeId(int u, int v) const override{
        if (!is_processed)
            throw std::runtime_error("GraphCSR::getEdgeId: graph not finalized");
        if (u < 0 || u >= n)
            return INVALID_EDGE_ID;

        int start = head[u];
        int end   = head[u+1];

        for (int a = start; a < end; a++) {
            if (to[a] == v) return arc_edge[a];
        }
        return INVALID_EDGE_ID;
    }

    Edge edgeEndpoints(int e) const override {
        if (!is_processed) {
            throw std::runtime_error("edgeEndpoints: graph not finalized");
        }
        if (e < 0 || e >= m) {
            throw std::out_of_range("edgeEndpoints: edge id out of range");
        }
        return edge_list[e];
    }

    IGraph::NeighborRange neighbors(int u) const override {
        if (!is_processed)
            throw std::runtime_error("GraphCSR::neighbors: graph not finalized");
        if (u < 0 || u >= n)
            throw std::out_of_range("GraphCSR::neighbors: node index");
        return NeighborRange{
            to.data() + head[u],
            to.data() + head[u + 1]
        };
    }

    void InitializeMemberByParser(int maxNodeIdSeen) override{
        IGraph::n = maxNodeIdSeen + 1;
        IGraph::m = 0;
        IGraph::vertices.resize(this->n);
        std::iota(IGraph::vertices.begin(), IGraph::vertices.end(), 0);
        head.assign(n + 1, 0);
        tmp_edges.clear();
        is_processed = false;
    }

};

#endif //MAXWEIGHTMATCHING_GRAPH_CSR_H
