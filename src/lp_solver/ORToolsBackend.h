#ifndef MAXWEIGHTMATCHING_ORTOOLS_BACKEND_H
#define MAXWEIGHTMATCHING_ORTOOLS_BACKEND_H

#include <memory>
#include <string>
#include <vector>
#include "ortools/linear_solver/linear_solver.h"
#include "LinearSolverBackend.h"
#include "../datastructures/IGraph.h"


/*
 * LinearSolverBackend on top of the OR-tools MPSolver wrapper.
 * solver_id is any id accepted by MPSolver::CreateSolver ("GLOP", "SCIP", "CBC", ...).
 */
class ORToolsBackend : public LinearSolverBackend {
public:
    explicit ORToolsBackend(const std::string& solver_id);
    ORToolsBackend(std::unique_ptr<operations_research::MPSolver> solver, const std::string& solver_id);

    std::string name() const override { return m_solver_id; }
    bool isMip() const override;
    double infinity() const override;

    void reset() override;

    int addVariable(double lb, double ub, bool integer, const std::string& name) override;
    int addConstraint(double lb, double ub, const std::string& name) override;
    void setConstraintCoefficient(int constraint, int variable, double coefficient) override;
    void setObjectiveCoefficient(int variable, double coefficient) override;
    void setMaximization() override;

    int numVariables() const override { return static_cast<int>(m_variables.size()); }
    int numConstraints() const override { return static_cast<int>(m_constraints.size()); }

    SolveStatus solve() override;
    SolveStatus status() const override { return m_status; }
    double value(int variable) const override;
    double objectiveValue() const override;

private:
    std::string m_solver_id;
    std::unique_ptr<operations_research::MPSolver> m_solver;
    std::vector<operations_research::MPVariable*> m_variables;
    std::vector<operations_research::MPConstraint*> m_constraints;
    SolveStatus m_status = SolveStatus::NOT_SOLVED;

    operations_research::MPVariable* variableAt(int variable) const;
};


enum class BackendType {
    AUTO,   // GLOP for bipartite graphs, a MIP solver otherwise
    GLOP,
    SCIP,
    CBC
};

// SCIP if it was compiled into OR-tools, CBC otherwise
std::unique_ptr<LinearSolverBackend> makeMipBackend();

std::unique_ptr<LinearSolverBackend> makeBackend(BackendType type, const IGraph& g);

#endif //MAXWEIGHTMATCHING_ORTOOLS_BACKEND_H
