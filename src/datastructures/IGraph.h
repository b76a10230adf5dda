#ifndef MAXWEIGHTMATCHING_IGRAPH_H
#define MAXWEIGHTMATCHING_IGRAPH_H
#include <cstddef>
#include <vector>
#include <numeric>
#include <queue>
#include <utility>


#define INVALID_EDGE_ID -1

using Edge = std::pair<int, int>; // (u, v) with u < v


// Optionally, define a custom comparator to enforce u < v ordering
struct EdgeCompare {
    bool operator()(const Edge& a, const Edge& b) const {
        return (a.first == b.first) ? (a.second < b.second) : (a.first < b.first);
    }
};

inline Edge canonicalEdge(int u, int v) {
    return (u < v) ? Edge{u, v} : Edge{v, u};
}


/*
 * Undirected simple graph on the vertices 0..n-1.
 * Every undirected edge has a single id in 0..m-1, and edgeEndpoints(e)
 * always returns the canonical orientation (u, v) with u < v.
 */
class IGraph {
public:
    int n = 0, m = 0; // Number of nodes and (undirected) edges
    std::vector<int> vertices; // List of vertices

    IGraph() = default;

    explicit IGraph(int n) : n(n), m(0) {
        vertices.resize(n);
        std::iota(vertices.begin(), vertices.end(), 0);
    }

    IGraph(const IGraph&) = default;
    IGraph(IGraph&&) noexcept = default;
    IGraph& operator=(const IGraph&) = default;
    IGraph& operator=(IGraph&&) noexcept = default;

    virtual ~IGraph() = default;

    virtual void finalize() = 0;

    struct NeighborRange {
        const int* b;
        const int* e;

        const int* begin() const { return b; }
        const int* end()   const { return e; }

        int size() const { return static_cast<int>(e - b); }
        int operator[](size_t i) const {
            return b[i];
        }
    };

    virtual NeighborRange neighbors(int node) const = 0;

    // order-insensitive, INVALID_EDGE_ID if {u, v} is not an edge
    virtual int getEdgeId(int u, int v) const = 0;
    virtual Edge edgeEndpoints(int e) const = 0;

    virtual void addEdge(int u, int v) = 0;

    bool hasEdge(int u, int v) const {
        if (u < 0 || v < 0 || u >= n || v >= n || u == v) return false;
        return getEdgeId(u, v) != INVALID_EDGE_ID;
    }

    std::vector<Edge> edges() const {
        std::vector<Edge> edge_list;
        edge_list.reserve(m);
        for (int e = 0; e < m; ++e) {
            edge_list.push_back(edgeEndpoints(e));
        }
        return edge_list;
    }

    /*
     * BFS 2-colouring over every connected component.
     * A graph without edges is bipartite.
     */
    bool isBipartite() const {
        std::vector<int> color(n, -1);
        std::queue<int> queue;

        for (int s = 0; s < n; ++s) {
            if (color[s] != -1) continue;
            color[s] = 0;
            queue.push(s);

            while (!queue.empty()) {
                int u = queue.front();
                queue.pop();
                for (int v : neighbors(u)) {
                    if (color[v] == -1) {
                        color[v] = 1 - color[u];
                        queue.push(v);
                    } else if (color[v] == color[u]) {
                        return false;
                    }
                }
            }
        }
        return true;
    }


    virtual int getNumNodes() const {
        return n;
    }

    virtual int getNumEdges() const {
        return m;
    }

    virtual const std::vector<int>& getVertices() const {
        return vertices;
    }

    // Note that this function does change the members from the base class
    virtual void InitializeMemberByParser(int maxNodeIdSeen) = 0;

};


#endif //MAXWEIGHTMATCHING_IGRAPH_H
