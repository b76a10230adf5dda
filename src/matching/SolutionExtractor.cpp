#include "SolutionExtractor.h"
#include <iostream>
#include <stdexcept>
#include <string>


MatchingResult extractMatching(const Formulation& formulation,
                               const LinearSolverBackend& backend,
                               int n,
                               const ExtractorConfig& config) {
    if (!(config.tolerance > 0.0 && config.tolerance < 0.5)) {
        throw std::invalid_argument("extractMatching: tolerance must lie in (0, 0.5), got "
            + std::to_string(config.tolerance));
    }
    if (formulation.edges.size() != formulation.variables.size()) {
        throw std::invalid_argument("extractMatching: formulation has "
            + std::to_string(formulation.edges.size()) + " edges but "
            + std::to_string(formulation.variables.size()) + " variables");
    }

    for (const auto& [u, v] : formulation.edges) {
        if (u < 0 || v < 0 || u >= n || v >= n) {
            throw std::invalid_argument("extractMatching: edge (" + std::to_string(u) + ", "
                + std::to_string(v) + ") has an endpoint outside of 0.." + std::to_string(n - 1));
        }
    }

    MatchingResult result;
    result.status = backend.status();
    result.mate.assign(n, UNMATCHED_VERTEX);

    if (!hasSolution(result.status)) {
        return result;
    }

    result.cost = backend.objectiveValue();

    for (size_t e = 0; e < formulation.edges.size(); e++) {
        const auto& [u, v] = formulation.edges[e];
        double value = backend.value(formulation.variables[e]);

        if (value > config.tolerance && value < 1.0 - config.tolerance) {
            if (config.strict_integrality) {
                throw std::runtime_error("extractMatching: fractional value " + std::to_string(value)
                    + " for edge (" + std::to_string(u) + ", " + std::to_string(v) + ") in a "
                    + (formulation.integral ? "integer" : "relaxed") + " formulation");
            }
            std::cerr << "WARNING: fractional value " << value << " for edge (" << u << ", " << v
                      << "), treated as unselected.\n";
            continue;
        }
        if (value < 1.0 - config.tolerance) continue;

        if (result.mate[u] != UNMATCHED_VERTEX || result.mate[v] != UNMATCHED_VERTEX) {
            throw std::runtime_error("extractMatching: edge (" + std::to_string(u) + ", "
                + std::to_string(v) + ") shares a vertex with another selected edge");
        }
        result.mate[u] = v;
        result.mate[v] = u;
    }

    return result;
}
