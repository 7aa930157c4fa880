/**
 * local_stats.hpp
 *
 * Partial statistics computed from the data of a single partition.  Each
 * result can be summed element-wise with the results of other partitions.
 */
#ifndef LOCAL_STATS_HPP
#define LOCAL_STATS_HPP

#include <armadillo>

class LabelSpace;

// Distinct labels of one partition, sorted ascending.
arma::Col<arma::sword> LocalLabelSet(const arma::Row<arma::sword>& labels);

// A 2x1 matrix holding the number of correct predictions and the number of
// points in the partition.
arma::umat LocalCorrectCount(const arma::Row<arma::sword>& yTrue,
                             const arma::Row<arma::sword>& yPred);

// An nclasses x 2 table; row c holds the true positive and false positive
// counts of predictions of class c.
arma::umat LocalTruePositives(const arma::Row<arma::sword>& yTrue,
                              const arma::Row<arma::sword>& yPred,
                              const LabelSpace& labelSpace);

// An nclasses x nclasses matrix where cell (t, p) accumulates the weight of
// points with true class t and predicted class p.  If `weights` is NULL every
// point has weight 1.  Points with a label outside the label space are
// dropped.
arma::mat LocalConfusionMatrix(const arma::Row<arma::sword>& yTrue,
                               const arma::Row<arma::sword>& yPred,
                               const LabelSpace& labelSpace,
                               const arma::rowvec* weights = NULL);

// Include implementation.
#include "local_stats_impl.hpp"

#endif
