#include "ORToolsBackend.h"
#include <stdexcept>

using namespace operations_research;


namespace {

SolveStatus fromResultStatus(MPSolver::ResultStatus status) {
    switch (status) {
        case MPSolver::OPTIMAL:       return SolveStatus::OPTIMAL;
        case MPSolver::FEASIBLE:      return SolveStatus::FEASIBLE;
        case MPSolver::INFEASIBLE:    return SolveStatus::INFEASIBLE;
        case MPSolver::UNBOUNDED:     return SolveStatus::UNBOUNDED;
        case MPSolver::ABNORMAL:      return SolveStatus::ABNORMAL;
        case MPSolver::MODEL_INVALID: return SolveStatus::MODEL_INVALID;
        case MPSolver::NOT_SOLVED:    return SolveStatus::NOT_SOLVED;
    }
    return SolveStatus::ABNORMAL;
}

}


ORToolsBackend::ORToolsBackend(const std::string& solver_id)
    : m_solver_id(solver_id),
      m_solver(MPSolver::CreateSolver(solver_id))
{
    if (!m_solver) {
        throw std::runtime_error(solver_id + " solver unavailable.");
    }
}

ORToolsBackend::ORToolsBackend(std::unique_ptr<MPSolver> solver, const std::string& solver_id)
    : m_solver_id(solver_id),
      m_solver(std::move(solver))
{
    if (!m_solver) {
        throw std::runtime_error(solver_id + " solver unavailable.");
    }
}

bool ORToolsBackend::isMip() const {
    return m_solver->IsMIP();
}

double ORToolsBackend::infinity() const {
    return MPSolver::infinity();
}

void ORToolsBackend::reset() {
    m_solver->Clear();
    m_variables.clear();
    m_constraints.clear();
    m_status = SolveStatus::NOT_SOLVED;
}

int ORToolsBackend::addVariable(double lb, double ub, bool integer, const std::string& name) {
    m_variables.push_back(m_solver->MakeVar(lb, ub, integer, name));
    return static_cast<int>(m_variables.size()) - 1;
}

int ORToolsBackend::addConstraint(double lb, double ub, const std::string& name) {
    m_constraints.push_back(m_solver->MakeRowConstraint(lb, ub, name));
    return static_cast<int>(m_constraints.size()) - 1;
}

void ORToolsBackend::setConstraintCoefficient(int constraint, int variable, double coefficient) {
    if (constraint < 0 || constraint >= static_cast<int>(m_constraints.size())) {
        throw std::out_of_range("ORToolsBackend: constraint handle out of range");
    }
    m_constraints[constraint]->SetCoefficient(variableAt(variable), coefficient);
}

void ORToolsBackend::setObjectiveCoefficient(int variable, double coefficient) {
    m_solver->MutableObjective()->SetCoefficient(variableAt(variable), coefficient);
}

void ORToolsBackend::setMaximization() {
    m_solver->MutableObjective()->SetMaximization();
}

SolveStatus ORToolsBackend::solve() {
    m_status = fromResultStatus(m_solver->Solve());
    return m_status;
}

double ORToolsBackend::value(int variable) const {
    if (!hasSolution(m_status)) {
        throw std::runtime_error("ORToolsBackend: no solution available (status "
            + toString(m_status) + ")");
    }
    return variableAt(variable)->solution_value();
}

double ORToolsBackend::objectiveValue() const {
    if (!hasSolution(m_status)) {
        throw std::runtime_error("ORToolsBackend: no solution available (status "
            + toString(m_status) + ")");
    }
    return m_solver->Objective().Value();
}

MPVariable* ORToolsBackend::variableAt(int variable) const {
    if (variable < 0 || variable >= static_cast<int>(m_variables.size())) {
        throw std::out_of_range("ORToolsBackend: variable handle out of range");
    }
    return m_variables[variable];
}


std::unique_ptr<LinearSolverBackend> makeMipBackend() {
    for (const std::string id : {"SCIP", "CBC"}) {
        std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(id));
        if (solver) {
            return std::make_unique<ORToolsBackend>(std::move(solver), id);
        }
    }
    throw std::runtime_error("No MIP solver (SCIP, CBC) available.");
}

std::unique_ptr<LinearSolverBackend> makeBackend(BackendType type, const IGraph& g) {
    switch (type) {
        case BackendType::AUTO:
            if (g.isBipartite()) {
                return std::make_unique<ORToolsBackend>("GLOP");
            }
            return makeMipBackend();

        case BackendType::GLOP:
            return std::make_unique<ORToolsBackend>("GLOP");

        case BackendType::SCIP:
            return std::make_unique<ORToolsBackend>("SCIP");

        case BackendType::CBC:
            return std::make_unique<ORToolsBackend>("CBC");

        default:
            throw std::runtime_error("Unknown backend type.");
    }
}
