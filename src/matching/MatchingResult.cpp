#include "MatchingResult.h"


int MatchingResult::numMatchedPairs() const {
    int matched = 0;
    for (int v : mate) {
        if (v != UNMATCHED_VERTEX) matched++;
    }
    return matched / 2;
}

bool MatchingResult::isValid() const {
    const int n = static_cast<int>(mate.size());
    for (int v = 0; v < n; v++) {
        int u = mate[v];
        if (u == UNMATCHED_VERTEX) continue;
        if (u < 0 || u >= n || u == v) return false;
        if (mate[u] != v) return false;
    }
    return true;
}

double MatchingResult::matchedWeight(const WeightMatrix& w) const {
    double total = 0.0;
    for (int v = 0; v < static_cast<int>(mate.size()); v++) {
        if (mate[v] != UNMATCHED_VERTEX) {
            total += w.get(v, mate[v]);
        }
    }
    return total / 2.0;
}

void MatchingResult::print(std::ostream& os) const {
    os << "Status: " << toString(status) << "\n";
    os << "Cost: " << cost << "\n";
    os << "Matched pairs: " << numMatchedPairs() << "\n";
    for (int v = 0; v < static_cast<int>(mate.size()); v++) {
        if (mate[v] != UNMATCHED_VERTEX && v < mate[v]) {
            os << "  " << v << " - " << mate[v] << "\n";
        }
    }
}
