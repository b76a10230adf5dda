#ifndef MAXWEIGHTMATCHING_WEIGHT_MATRIX_H
#define MAXWEIGHTMATCHING_WEIGHT_MATRIX_H

#include <unordered_map>
#include <utility>
#include <cstddef>
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include "../utils/hash.h"
#include "../datastructures/IGraph.h"


/*
 * n x n edge weight matrix, stored sparsely by vertex pair.
 * Entries that are not stored read as zero, storing a zero erases the entry.
 */
class WeightMatrix {
public:
    using EntryMap = std::unordered_map<std::pair<int, int>, double, PairHash>;

    WeightMatrix() = default;
    explicit WeightMatrix(int n);

    static WeightMatrix fromDense(const Eigen::MatrixXd& dense);
    static WeightMatrix fromSparse(const Eigen::SparseMatrix<double>& sparse);

    Eigen::MatrixXd toDense() const;
    Eigen::SparseMatrix<double> toSparse() const;

    int size() const { return n; }
    size_t nonZeros() const { return m_entries.size(); }

    double get(int i, int j) const;
    void set(int i, int j, double weight);

    /*
     * Sanitizes the matrix against the edge set of g, in place:
     *  - for i > j, a positive w(i,j) larger than w(j,i) is copied to w(j,i),
     *    so the canonical entry (smaller index first) is never decreased,
     *  - every pair that is not an edge of g (including the diagonal) is zeroed,
     *  - for every edge u < v, w(v,u) is set to w(u,v).
     * Throws std::invalid_argument if the dimension differs from g's vertex count.
     */
    void normalize(const IGraph& g);

private:
    int n = 0;
    EntryMap m_entries;

    void checkIndex(int i, int j) const;
};


// Unit weight on every edge (u, v), u < v. Solving with it gives a maximum cardinality matching.
WeightMatrix defaultWeights(const IGraph& g);


#endif //MAXWEIGHTMATCHING_WEIGHT_MATRIX_H
