#ifndef MAXWEIGHTMATCHING_LP_BASE_H
#define MAXWEIGHTMATCHING_LP_BASE_H

#include <iostream>
#include <vector>
#include "LinearSolverBackend.h"
#include "../datastructures/IGraph.h"


/*
 * Skeleton shared by the LP models over a graph: init() collects the edge list
 * in edge id order, the subclasses create variables, constraints and the objective
 * on the backend handed in.
 */
class LP {
public:

    const IGraph* g = nullptr;
    LinearSolverBackend* solver = nullptr;
    bool debug = false;
    int n = 0, m = 0;
    std::vector<Edge> edges;

    LP() = default;
    virtual ~LP() = default;

    virtual void CreateVariables(const IGraph& graph) = 0;
    virtual void CreateConstraints(const IGraph& graph) = 0;
    virtual void SetObjective() = 0;
    virtual void PrintSolution(const IGraph& graph) = 0;


    void init(const IGraph& graph, LinearSolverBackend& backend) {
        edges.clear();
        n = graph.getNumNodes();
        m = graph.getNumEdges();
        g = &graph;
        solver = &backend;
        solver->reset();

        edges.reserve(m);
        for (int e = 0; e < m; e++) {
            edges.push_back(graph.edgeEndpoints(e));
        }
    }

    void Build(const IGraph& graph, LinearSolverBackend& backend) {
        init(graph, backend);
        CreateVariables(graph);
        CreateConstraints(graph);
        SetObjective();
    }

    SolveStatus Run(const IGraph& graph, LinearSolverBackend& backend) {
        Build(graph, backend);
        // === Solve the LP ===
        SolveStatus status = solver->solve();
        if (!hasSolution(status)) {
            std::cerr << "WARNING: " << solver->name() << " finished with status "
                      << toString(status) << ", no solution available.\n";
        } else if (status != SolveStatus::OPTIMAL) {
            std::cerr << "WARNING: " << solver->name() << " returned a feasible but not proven optimal solution.\n";
        }
        if (debug) {
            this->PrintSolution(graph);
        }
        return status;
    }

    void setDebug(bool debug) {this->debug = debug;}

};

#endif //MAXWEIGHTMATCHING_LP_BASE_H
