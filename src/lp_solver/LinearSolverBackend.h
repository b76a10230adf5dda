#ifndef MAXWEIGHTMATCHING_LINEAR_SOLVER_BACKEND_H
#define MAXWEIGHTMATCHING_LINEAR_SOLVER_BACKEND_H

#include <string>


enum class SolveStatus {
    OPTIMAL,
    FEASIBLE,
    INFEASIBLE,
    UNBOUNDED,
    ABNORMAL,
    MODEL_INVALID,
    NOT_SOLVED
};

inline std::string toString(SolveStatus status) {
    switch (status) {
        case SolveStatus::OPTIMAL:       return "OPTIMAL";
        case SolveStatus::FEASIBLE:      return "FEASIBLE";
        case SolveStatus::INFEASIBLE:    return "INFEASIBLE";
        case SolveStatus::UNBOUNDED:     return "UNBOUNDED";
        case SolveStatus::ABNORMAL:      return "ABNORMAL";
        case SolveStatus::MODEL_INVALID: return "MODEL_INVALID";
        case SolveStatus::NOT_SOLVED:    return "NOT_SOLVED";
    }
    return "UNKNOWN";
}

// true if variable values can be read back
inline bool hasSolution(SolveStatus status) {
    return status == SolveStatus::OPTIMAL || status == SolveStatus::FEASIBLE;
}


/*
 * The capability the formulation needs from an optimization solver.
 * Variables and constraints are addressed by the dense handles returned
 * from addVariable / addConstraint, starting at 0 after reset().
 */
class LinearSolverBackend {
public:
    virtual ~LinearSolverBackend() = default;

    virtual std::string name() const = 0;
    // false for pure LP solvers, integrality cannot be enforced then
    virtual bool isMip() const = 0;
    virtual double infinity() const = 0;

    // drops all variables, constraints and the objective
    virtual void reset() = 0;

    virtual int addVariable(double lb, double ub, bool integer, const std::string& name) = 0;
    virtual int addConstraint(double lb, double ub, const std::string& name) = 0;
    virtual void setConstraintCoefficient(int constraint, int variable, double coefficient) = 0;
    virtual void setObjectiveCoefficient(int variable, double coefficient) = 0;
    virtual void setMaximization() = 0;

    virtual int numVariables() const = 0;
    virtual int numConstraints() const = 0;

    virtual SolveStatus solve() = 0;
    virtual SolveStatus status() const = 0;
    virtual double value(int variable) const = 0;
    virtual double objectiveValue() const = 0;
};

#endif //MAXWEIGHTMATCHING_LINEAR_SOLVER_BACKEND_H
