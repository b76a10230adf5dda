#ifndef MAXWEIGHTMATCHING_MATCHING_FORMULATION_H
#define MAXWEIGHTMATCHING_MATCHING_FORMULATION_H

#include <vector>
#include "LP_Base.h"
#include "../matching/WeightMatrix.h"


/*
 * Handle to a built matching model: variables[e] is the backend handle of x_e
 * for edges[e], degree_constraints[v] the handle of the degree row of v.
 */
struct Formulation {
    std::vector<Edge> edges;
    std::vector<int> variables;
    std::vector<int> degree_constraints;
    bool integral = false;
};


/*
 * max  sum_e w(u,v) * x_e
 * s.t. sum_{e incident to v} x_e <= 1   for every vertex v
 *      0 <= x_e <= 1
 *
 * x_e is continuous if the graph is bipartite (the matching polytope is integral there)
 * and integer otherwise, which needs a MIP backend.
 */
class MatchingFormulation : public LP {
private:
    const WeightMatrix& weights;
    std::vector<int> x;
    std::vector<int> degree_rows;
    bool integral = false;

public:
    explicit MatchingFormulation(const WeightMatrix& w) : weights(w) {}

    void CreateVariables(const IGraph& graph) override;
    void CreateConstraints(const IGraph& graph) override;
    void SetObjective() override;
    void PrintSolution(const IGraph& graph) override;

    bool isIntegral() const { return integral; }
    Formulation formulation() const;
};

#endif //MAXWEIGHTMATCHING_MATCHING_FORMULATION_H
