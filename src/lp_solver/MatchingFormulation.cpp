#include "MatchingFormulation.h"
#include <stdexcept>
#include <string>


void MatchingFormulation::CreateVariables(const IGraph& graph) {
    if (weights.size() != n) {
        throw std::invalid_argument("MatchingFormulation: weight matrix dimension "
            + std::to_string(weights.size()) + " does not match the number of vertices "
            + std::to_string(n));
    }

    integral = !graph.isBipartite();
    if (integral && !solver->isMip()) {
        throw std::invalid_argument("MatchingFormulation: graph is not bipartite, "
            + solver->name() + " cannot enforce integrality. Use a MIP solver.");
    }

    x.clear();
    x.reserve(edges.size());
    for (const auto& [u, v] : edges) {
        x.push_back(solver->addVariable(0.0, 1.0, integral,
            "x_" + std::to_string(u) + "_" + std::to_string(v)));
    }
}

void MatchingFormulation::CreateConstraints(const IGraph& graph) {
    // \forall v: sum_{j in N(v), j > v} x_(v,j) + sum_{j in N(v), j < v} x_(j,v) <= 1
    degree_rows.clear();
    degree_rows.reserve(n);
    for (int v = 0; v < n; v++) {
        int row = solver->addConstraint(-solver->infinity(), 1.0, "deg_" + std::to_string(v));
        degree_rows.push_back(row);

        for (int j : graph.neighbors(v)) {
            int e = (j > v) ? graph.getEdgeId(v, j) : graph.getEdgeId(j, v);
            if (e == INVALID_EDGE_ID) {
                throw std::runtime_error("MatchingFormulation: neighbor " + std::to_string(j)
                    + " of " + std::to_string(v) + " has no edge id");
            }
            solver->setConstraintCoefficient(row, x[e], 1.0);
        }
    }
}

void MatchingFormulation::SetObjective() {
    // === Objective: maximize the weight of the selected edges ===
    for (int e = 0; e < static_cast<int>(edges.size()); e++) {
        double w = weights.get(edges[e].first, edges[e].second);
        if (w != 0.0) {
            solver->setObjectiveCoefficient(x[e], w);
        }
    }
    solver->setMaximization();
}

void MatchingFormulation::PrintSolution(const IGraph& graph) {
    std::cout << "\n=== Edge variables (" << (integral ? "integer" : "continuous") << ") ===\n";
    if (!hasSolution(solver->status())) {
        std::cout << "no solution, status " << toString(solver->status()) << "\n";
        return;
    }
    std::cout << "objective = " << solver->objectiveValue() << "\n";
    for (int e = 0; e < static_cast<int>(edges.size()); e++) {
        double value = solver->value(x[e]);
        if (value > 1e-9) { // print only non-zero edges
            std::cout << "  x_" << edges[e].first << "_" << edges[e].second
                      << " = " << value
                      << "  (w = " << weights.get(edges[e].first, edges[e].second) << ")\n";
        }
    }
}

Formulation MatchingFormulation::formulation() const {
    return Formulation{edges, x, degree_rows, integral};
}
