/**
 * global_reducer.hpp
 *
 * Merging of per-partition statistics into a global statistic, and the
 * metrics derived from the global statistic.
 */
#ifndef GLOBAL_REDUCER_HPP
#define GLOBAL_REDUCER_HPP

#include <armadillo>
#include <string>
#include <vector>

enum class PrecisionAverage
{
  BINARY,
  MACRO,
  MICRO
};

enum class ConfusionNormalization
{
  NONE,
  TRUE_LABELS, // divide each row by its sum
  PREDICTED_LABELS, // divide each column by its sum
  ALL // divide by the grand total
};

// Parse "binary", "macro" or "micro".
PrecisionAverage ParsePrecisionAverage(const std::string& name);
std::string ToString(const PrecisionAverage average);

// Parse "none", "true", "pred" or "all".
ConfusionNormalization ParseConfusionNormalization(const std::string& name);
std::string ToString(const ConfusionNormalization normalize);

/**
 * Sum all partial statistics element-wise into an n_rows x n_cols matrix.
 * Every partial must have exactly that shape.
 */
template<typename eT>
arma::Mat<eT> SumPartials(const std::vector<arma::Mat<eT>>& partials,
                          const size_t n_rows,
                          const size_t n_cols);

// Fraction of correct predictions from a summed 2x1 (correct, total) count.
double AccuracyFromCounts(const arma::umat& counts);

// Throw a MetricError if precision with the given averaging mode is undefined
// for `nclasses` classes.
void CheckPrecisionClasses(const size_t nclasses,
                           const PrecisionAverage average);

// Precision from a summed nclasses x 2 true positive / false positive table.
// A class that was never predicted has precision 0.
double PrecisionFromCounts(const arma::umat& tpfp,
                           const PrecisionAverage average);

// Normalize a summed confusion matrix.  Cells whose divisor is zero become 0.
arma::mat NormalizeConfusionMatrix(const arma::mat& cm,
                                   const ConfusionNormalization normalize);

// Include implementation.
#include "global_reducer_impl.hpp"

#endif
