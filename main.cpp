#include <iostream>
#include "src/datastructures/GraphADJ.h"
#include "src/datastructures/lgf_reader.h"
#include "src/parse_parameter.h"
#include "src/utils/timer.h"





int main(int argc, char **argv) {

    std::string err;
    auto cfg = parse_parameter(argc, argv, &err);
    if (!cfg) { std::cerr << err; return -1; }

    try {
        GraphADJ G;
        WeightMatrix weights = readLGFFile(G, cfg->filename);
        std::cout << "Graph loaded: " << G.getNumNodes() << " nodes, "
                  << G.getNumEdges() << " edges"
                  << (G.isBipartite() ? " (bipartite)" : "") << ".\n";

        auto backend = makeBackend(cfg->backend, G);
        std::cout << "\n=== Running backend: " << backend->name() << " ===\n";

        MaxWeightMatchingLP matching(cfg->matchingConfig());

        // --- solve ---
        auto t0 = timeNow();
        MatchingResult result = matching.solve(G, *backend, weights);
        double solve_time = duration(timeNow() - t0);

        result.print(std::cout);
        std::cout << "Total running time: " << solve_time << " ms\n";

        return result.isOptimal() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return -1;
    }
}
