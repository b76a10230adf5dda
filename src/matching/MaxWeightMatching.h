#ifndef MAXWEIGHTMATCHING_MAX_WEIGHT_MATCHING_H
#define MAXWEIGHTMATCHING_MAX_WEIGHT_MATCHING_H

#include "MatchingResult.h"
#include "SolutionExtractor.h"
#include "WeightMatrix.h"
#include "../datastructures/IGraph.h"
#include "../lp_solver/LinearSolverBackend.h"


struct MatchingConfig {
    ExtractorConfig extractor;
    bool debug = false;
};


/*
 * Maximum weight matching through the LP / ILP formulation:
 * normalize the weights, build the model on the backend, solve, read back the mates.
 * Bipartite graphs are solved as an LP, every other graph needs a MIP backend.
 */
class MaxWeightMatchingLP {
public:
    MaxWeightMatchingLP() = default;
    explicit MaxWeightMatchingLP(const MatchingConfig& config) : config(config) {}

    // w is normalized in place against g
    MatchingResult solve(const IGraph& g, LinearSolverBackend& backend, WeightMatrix& w);
    // unit weights, i.e. maximum cardinality matching
    MatchingResult solve(const IGraph& g, LinearSolverBackend& backend);

private:
    MatchingConfig config;
};


MatchingResult maximumWeightMatching(const IGraph& g, LinearSolverBackend& backend,
                                     const MatchingConfig& config = {});

MatchingResult maximumWeightMatching(const IGraph& g, LinearSolverBackend& backend,
                                     WeightMatrix& w, const MatchingConfig& config = {});

#endif //MAXWEIGHTMATCHING_MAX_WEIGHT_MATCHING_H
