#include <vector>

#include "GraphCSR.h"


void GraphCSR::finalize() {
    if (is_processed) {
        return;
    }

    // 1) sort the undirected edges by (u,v), this fixes the edge ids
    edge_list.insert(edge_list.end(), tmp_edges.begin(), tmp_edges.end());
    std::sort(edge_list.begin(), edge_list.end(), EdgeCompare());
    m = static_cast<int>(edge_list.size());

    // 2) expand every undirected edge into both arcs
    std::vector<std::pair<Edge, int>> arcs;
    arcs.reserve(2 * m);
    for (int e = 0; e < m; e++) {
        arcs.push_back({edge_list[e], e});
        arcs.push_back({{edge_list[e].second, edge_list[e].first}, e});
    }
    std::stable_sort(arcs.begin(), arcs.end(),
        [](const std::pair<Edge, int>& a, const std::pair<Edge, int>& b) {
            return EdgeCompare()(a.first, b.first);
        });

    // 3) fill CSR arrays in sorted order
    const int num_arcs = static_cast<int>(arcs.size());
    to.resize(num_arcs);
    from.resize(num_arcs);
    arc_edge.resize(num_arcs);
    head.assign(n+1, 0);

    for (int a = 0; a < num_arcs; a++) {
        from[a]     = arcs[a].first.first;
        to[a]       = arcs[a].first.second;
        arc_edge[a] = arcs[a].second;
    }

    // 4) build head[]
    int curr = 0;
    for (int u = 0; u < n; u++) {
        while (curr < num_arcs && from[curr] == u) curr++;
        head[u+1] = curr;
    }

    // 5) clear temporary storage
    tmp_edges.clear();

    // 6) check for consistency, edges added after an earlier finalize may repeat old ones
    for (int e = 1; e < m; e++) {
        if (edge_list[e] == edge_list[e-1]) {
            throw std::runtime_error("GraphCSR::finalize: duplicate edges detected");
        }
    }

    is_processed = true;
}
