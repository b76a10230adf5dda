#ifndef MAXWEIGHTMATCHING_SOLUTION_EXTRACTOR_H
#define MAXWEIGHTMATCHING_SOLUTION_EXTRACTOR_H

#include "MatchingResult.h"
#include "../lp_solver/MatchingFormulation.h"
#include "../lp_solver/LinearSolverBackend.h"


struct ExtractorConfig {
    // x_e >= 1 - tolerance selects edge e, x_e <= tolerance leaves it out
    double tolerance = 1e-5;
    // a value strictly between the two bands throws if set, otherwise the edge is left out with a warning
    bool strict_integrality = true;
};


/*
 * Reads the edge variables of a solved formulation back into a mate array.
 * Without a solution (infeasible, aborted, ...) the result carries the status,
 * cost 0 and no matched vertex.
 */
MatchingResult extractMatching(const Formulation& formulation,
                               const LinearSolverBackend& backend,
                               int n,
                               const ExtractorConfig& config = {});

#endif //MAXWEIGHTMATCHING_SOLUTION_EXTRACTOR_H
