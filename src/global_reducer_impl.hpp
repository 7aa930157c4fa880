/**
 * global_reducer_impl.hpp
 *
 * Implementation of global reduction and metric derivation.
 */
#ifndef GLOBAL_REDUCER_IMPL_HPP
#define GLOBAL_REDUCER_IMPL_HPP

#include "global_reducer.hpp"
#include "metric_error.hpp"
#include <sstream>
#include <stdexcept>

inline PrecisionAverage ParsePrecisionAverage(const std::string& name)
{
  if (name == "binary")
    return PrecisionAverage::BINARY;
  else if (name == "macro")
    return PrecisionAverage::MACRO;
  else if (name == "micro")
    return PrecisionAverage::MICRO;

  std::ostringstream oss;
  oss << "unknown precision averaging mode '" << name << "'; must be "
      << "'binary', 'macro' or 'micro'";
  throw std::invalid_argument(oss.str());
}

inline std::string ToString(const PrecisionAverage average)
{
  switch (average)
  {
    case PrecisionAverage::BINARY: return "binary";
    case PrecisionAverage::MACRO: return "macro";
    case PrecisionAverage::MICRO: return "micro";
  }

  return "unknown";
}

inline ConfusionNormalization ParseConfusionNormalization(
    const std::string& name)
{
  if (name == "none")
    return ConfusionNormalization::NONE;
  else if (name == "true")
    return ConfusionNormalization::TRUE_LABELS;
  else if (name == "pred")
    return ConfusionNormalization::PREDICTED_LABELS;
  else if (name == "all")
    return ConfusionNormalization::ALL;

  std::ostringstream oss;
  oss << "unknown confusion matrix normalization '" << name << "'; must be "
      << "'none', 'true', 'pred' or 'all'";
  throw std::invalid_argument(oss.str());
}

inline std::string ToString(const ConfusionNormalization normalize)
{
  switch (normalize)
  {
    case ConfusionNormalization::NONE: return "none";
    case ConfusionNormalization::TRUE_LABELS: return "true";
    case ConfusionNormalization::PREDICTED_LABELS: return "pred";
    case ConfusionNormalization::ALL: return "all";
  }

  return "unknown";
}

template<typename eT>
arma::Mat<eT> SumPartials(const std::vector<arma::Mat<eT>>& partials,
                          const size_t n_rows,
                          const size_t n_cols)
{
  arma::Mat<eT> result(n_rows, n_cols, arma::fill::zeros);
  for (size_t p = 0; p < partials.size(); ++p)
  {
    if (partials[p].n_rows != n_rows || partials[p].n_cols != n_cols)
    {
      std::ostringstream oss;
      oss << "SumPartials(): partial statistic " << p << " has shape "
          << partials[p].n_rows << "x" << partials[p].n_cols << "; expected "
          << n_rows << "x" << n_cols;
      throw std::invalid_argument(oss.str());
    }

    result += partials[p];
  }

  return result;
}

inline double AccuracyFromCounts(const arma::umat& counts)
{
  if (counts(1, 0) == 0)
  {
    throw MetricError(MetricErrorKind::EMPTY_INPUT, "cannot compute accuracy "
        "of zero points");
  }

  return ((double) counts(0, 0)) / ((double) counts(1, 0));
}

inline void CheckPrecisionClasses(const size_t nclasses,
                                  const PrecisionAverage average)
{
  if (average == PrecisionAverage::BINARY && nclasses > 2)
  {
    std::ostringstream oss;
    oss << "binary precision undefined for more than two classes (found "
        << nclasses << " classes)";
    throw MetricError(MetricErrorKind::INVALID_AVERAGING_MODE, oss.str());
  }

  if (nclasses < 2)
  {
    throw MetricError(MetricErrorKind::DEGENERATE_LABEL_SPACE, "single-class "
        "precision is undefined");
  }
}

inline double PrecisionFromCounts(const arma::umat& tpfp,
                                  const PrecisionAverage average)
{
  CheckPrecisionClasses(tpfp.n_rows, average);

  const arma::vec tp = arma::conv_to<arma::vec>::from(tpfp.col(0));
  const arma::vec predicted = arma::conv_to<arma::vec>::from(tpfp.col(0) +
      tpfp.col(1));

  if (average == PrecisionAverage::MICRO)
  {
    const double totalPredicted = arma::accu(predicted);
    return (totalPredicted == 0.0) ? 0.0 : arma::accu(tp) / totalPredicted;
  }

  arma::vec precision(tpfp.n_rows, arma::fill::zeros);
  for (size_t c = 0; c < tpfp.n_rows; ++c)
  {
    if (predicted[c] > 0.0)
      precision[c] = tp[c] / predicted[c];
  }

  // The positive class is the second (largest) label.
  if (average == PrecisionAverage::BINARY)
    return precision[tpfp.n_rows - 1];

  return arma::mean(precision);
}

inline arma::mat NormalizeConfusionMatrix(
    const arma::mat& cm,
    const ConfusionNormalization normalize)
{
  arma::mat result(cm);
  if (normalize == ConfusionNormalization::TRUE_LABELS)
  {
    const arma::vec rowSums = arma::sum(cm, 1);
    for (size_t r = 0; r < cm.n_rows; ++r)
    {
      if (rowSums[r] == 0.0)
        result.row(r).zeros();
      else
        result.row(r) /= rowSums[r];
    }
  }
  else if (normalize == ConfusionNormalization::PREDICTED_LABELS)
  {
    const arma::rowvec colSums = arma::sum(cm, 0);
    for (size_t c = 0; c < cm.n_cols; ++c)
    {
      if (colSums[c] == 0.0)
        result.col(c).zeros();
      else
        result.col(c) /= colSums[c];
    }
  }
  else if (normalize == ConfusionNormalization::ALL)
  {
    const double total = arma::accu(cm);
    if (total == 0.0)
      result.zeros();
    else
      result /= total;
  }

  result.replace(arma::datum::nan, 0.0);
  return result;
}

#endif
