#include "WeightMatrix.h"
#include <stdexcept>
#include <string>
#include <vector>


WeightMatrix::WeightMatrix(int n) : n(n) {
    if (n < 0) {
        throw std::invalid_argument("WeightMatrix: negative dimension");
    }
}

WeightMatrix WeightMatrix::fromDense(const Eigen::MatrixXd& dense) {
    if (dense.rows() != dense.cols()) {
        throw std::invalid_argument("WeightMatrix::fromDense: matrix is not square ("
            + std::to_string(dense.rows()) + "x" + std::to_string(dense.cols()) + ")");
    }
    WeightMatrix w(static_cast<int>(dense.rows()));
    for (int i = 0; i < w.n; ++i) {
        for (int j = 0; j < w.n; ++j) {
            if (dense(i, j) != 0.0) {
                w.m_entries[{i, j}] = dense(i, j);
            }
        }
    }
    return w;
}

WeightMatrix WeightMatrix::fromSparse(const Eigen::SparseMatrix<double>& sparse) {
    if (sparse.rows() != sparse.cols()) {
        throw std::invalid_argument("WeightMatrix::fromSparse: matrix is not square ("
            + std::to_string(sparse.rows()) + "x" + std::to_string(sparse.cols()) + ")");
    }
    WeightMatrix w(static_cast<int>(sparse.rows()));
    for (int k = 0; k < sparse.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(sparse, k); it; ++it) {
            if (it.value() != 0.0) {
                w.m_entries[{static_cast<int>(it.row()), static_cast<int>(it.col())}] = it.value();
            }
        }
    }
    return w;
}

Eigen::MatrixXd WeightMatrix::toDense() const {
    Eigen::MatrixXd dense = Eigen::MatrixXd::Zero(n, n);
    for (const auto& [ij, weight] : m_entries) {
        dense(ij.first, ij.second) = weight;
    }
    return dense;
}

Eigen::SparseMatrix<double> WeightMatrix::toSparse() const {
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(m_entries.size());
    for (const auto& [ij, weight] : m_entries) {
        triplets.emplace_back(ij.first, ij.second, weight);
    }
    Eigen::SparseMatrix<double> sparse(n, n);
    sparse.setFromTriplets(triplets.begin(), triplets.end());
    return sparse;
}

void WeightMatrix::checkIndex(int i, int j) const {
    if (i < 0 || j < 0 || i >= n || j >= n) {
        throw std::out_of_range("WeightMatrix: index (" + std::to_string(i) + ", "
            + std::to_string(j) + ") out of range for dimension " + std::to_string(n));
    }
}

double WeightMatrix::get(int i, int j) const {
    checkIndex(i, j);
    auto it = m_entries.find({i, j});
    return (it == m_entries.end()) ? 0.0 : it->second;
}

void WeightMatrix::set(int i, int j, double weight) {
    checkIndex(i, j);
    if (weight == 0.0) {
        m_entries.erase({i, j});
    } else {
        m_entries[{i, j}] = weight;
    }
}

void WeightMatrix::normalize(const IGraph& g) {
    if (n != g.getNumNodes()) {
        throw std::invalid_argument("WeightMatrix::normalize: dimension " + std::to_string(n)
            + " does not match the number of vertices " + std::to_string(g.getNumNodes()));
    }

    // snapshot the keys, the loops below modify the map
    std::vector<std::pair<int, int>> keys;
    keys.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        keys.push_back(entry.first);
    }

    // 1) a larger positive lower entry w(i,j), i > j, overrides w(j,i)
    for (const auto& [i, j] : keys) {
        if (i <= j) continue;
        double lower = get(i, j);
        if (lower > 0.0 && get(j, i) < lower) {
            set(j, i, lower);
        }
    }

    // 2) drop everything that is not an edge
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (!g.hasEdge(it->first.first, it->first.second)) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }

    // 3) mirror the canonical entry
    for (int e = 0; e < g.getNumEdges(); ++e) {
        auto [u, v] = g.edgeEndpoints(e);
        set(v, u, get(u, v));
    }
}


WeightMatrix defaultWeights(const IGraph& g) {
    WeightMatrix w(g.getNumNodes());
    for (int e = 0; e < g.getNumEdges(); ++e) {
        auto [u, v] = g.edgeEndpoints(e);
        w.set(u, v, 1.0);
    }
    return w;
}
