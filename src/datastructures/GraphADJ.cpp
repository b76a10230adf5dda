#include "GraphADJ.h"
#include <stdexcept>
#include <algorithm>



IGraph::NeighborRange GraphADJ::neighbors(int u) const {
    if (u < 0 || u >= static_cast<int>(m_adj.size())) {
        throw std::out_of_range("Node index out of range");
    }
    const auto& row = m_adj[u];
    return NeighborRange{
        row.data(),
        row.data() + row.size()
    };
}



void GraphADJ::addEdge(int u , int v) {
    if(u < 0 || v < 0 || u >= static_cast<int>(m_adj.size()) || v >= static_cast<int>(m_adj.size())) {
        throw std::out_of_range("Node index out of range");
    }
    if(u == v) {
        throw std::invalid_argument("No self-loops allowed (u == v)");
    }

    auto it = std::find(m_adj[u].begin(), m_adj[u].end(), v);
    if(it != m_adj[u].end()) {
        return;
    }

    m_adj[u].push_back(v);
    m_adj[v].push_back(u);

    // a single logical edge ID for the undirected edge
    int e = static_cast<int>(m_edgeList.size());
    m_edgeList.push_back(canonicalEdge(u, v));

    m_uvToEdge[{u, v}] = e;
    m_uvToEdge[{v, u}] = e;
    m++;
}

int GraphADJ::getEdgeId(int u, int v) const {
    auto it = m_uvToEdge.find({u, v});
    if (it == m_uvToEdge.end()) {
        return INVALID_EDGE_ID;
    }
    return it->second;
}


Edge GraphADJ::edgeEndpoints(int e) const {
    if (e < 0 || e >= static_cast<int>(m_edgeList.size())) {
        throw std::out_of_range("edgeEndpoints: edge id out of range");
    }
    return m_edgeList[e];
}


void GraphADJ::InitializeMemberByParser(int maxNodeIdSeen) {
    IGraph::n = maxNodeIdSeen + 1;
    IGraph::m = 0;
    m_adj.clear();
    m_adj.resize(n);
    m_edgeList.clear();
    m_uvToEdge.clear();
    IGraph::vertices.resize(n);
    std::iota(IGraph::vertices.begin(), IGraph::vertices.end(), 0); // fill vertices with 0, 1, ..., maxNodeIdSeen
}
