#ifndef MAXWEIGHTMATCHING_MATCHING_RESULT_H
#define MAXWEIGHTMATCHING_MATCHING_RESULT_H

#include <iostream>
#include <vector>
#include "../lp_solver/LinearSolverBackend.h"
#include "WeightMatrix.h"


#define UNMATCHED_VERTEX -1


struct MatchingResult {
    SolveStatus status = SolveStatus::NOT_SOLVED;
    double cost = 0.0;
    std::vector<int> mate; // mate[v] is the partner of v, or UNMATCHED_VERTEX

    bool isOptimal() const { return status == SolveStatus::OPTIMAL; }

    int numMatchedPairs() const;

    // mate[mate[v]] == v for every matched v, no self matches
    bool isValid() const;

    // sum over matched vertices of w(v, mate[v]), halved since every pair is seen twice
    double matchedWeight(const WeightMatrix& w) const;

    void print(std::ostream& os = std::cout) const;
};

#endif //MAXWEIGHTMATCHING_MATCHING_RESULT_H
