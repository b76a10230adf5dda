#include "MaxWeightMatching.h"
#include "../lp_solver/MatchingFormulation.h"


MatchingResult MaxWeightMatchingLP::solve(const IGraph& g, LinearSolverBackend& backend, WeightMatrix& w) {
    w.normalize(g);

    MatchingFormulation formulation(w);
    formulation.setDebug(config.debug);
    formulation.Run(g, backend);

    return extractMatching(formulation.formulation(), backend, g.getNumNodes(), config.extractor);
}

MatchingResult MaxWeightMatchingLP::solve(const IGraph& g, LinearSolverBackend& backend) {
    WeightMatrix w = defaultWeights(g);
    return solve(g, backend, w);
}


MatchingResult maximumWeightMatching(const IGraph& g, LinearSolverBackend& backend,
                                     const MatchingConfig& config) {
    MaxWeightMatchingLP matching(config);
    return matching.solve(g, backend);
}

MatchingResult maximumWeightMatching(const IGraph& g, LinearSolverBackend& backend,
                                     WeightMatrix& w, const MatchingConfig& config) {
    MaxWeightMatchingLP matching(config);
    return matching.solve(g, backend, w);
}
