/**
 * local_stats_impl.hpp
 *
 * Implementation of per-partition statistics.
 */
#ifndef LOCAL_STATS_IMPL_HPP
#define LOCAL_STATS_IMPL_HPP

#include "local_stats.hpp"
#include "label_space.hpp"
#include <sstream>
#include <stdexcept>

namespace local_stats_detail {

inline void CheckAligned(const char* caller,
                         const arma::Row<arma::sword>& yTrue,
                         const arma::Row<arma::sword>& yPred)
{
  if (yTrue.n_elem != yPred.n_elem)
  {
    std::ostringstream oss;
    oss << caller << ": partition has " << yTrue.n_elem << " true labels but "
        << yPred.n_elem << " predictions";
    throw std::invalid_argument(oss.str());
  }
}

} // namespace local_stats_detail

inline arma::Col<arma::sword> LocalLabelSet(
    const arma::Row<arma::sword>& labels)
{
  if (labels.n_elem == 0)
    return arma::Col<arma::sword>();

  return arma::unique(labels).t();
}

inline arma::umat LocalCorrectCount(const arma::Row<arma::sword>& yTrue,
                                    const arma::Row<arma::sword>& yPred)
{
  local_stats_detail::CheckAligned("LocalCorrectCount()", yTrue, yPred);

  arma::umat result(2, 1);
  result(0, 0) = arma::accu(yTrue == yPred);
  result(1, 0) = yTrue.n_elem;
  return result;
}

inline arma::umat LocalTruePositives(const arma::Row<arma::sword>& yTrue,
                                     const arma::Row<arma::sword>& yPred,
                                     const LabelSpace& labelSpace)
{
  local_stats_detail::CheckAligned("LocalTruePositives()", yTrue, yPred);

  const size_t nclasses = labelSpace.NumClasses();
  const arma::uvec trueClasses = labelSpace.Indices(yTrue);
  const arma::uvec predClasses = labelSpace.Indices(yPred);

  arma::umat result(nclasses, 2, arma::fill::zeros);
  for (size_t c = 0; c < nclasses; ++c)
  {
    const arma::uvec predicted = arma::find(predClasses == c);

    // No predictions of this class in the partition: the row stays zero.
    if (predicted.n_elem == 0)
      continue;

    const arma::uword tp = arma::accu(trueClasses.elem(predicted) == c);
    result(c, 0) = tp;
    result(c, 1) = predicted.n_elem - tp;
  }

  return result;
}

inline arma::mat LocalConfusionMatrix(const arma::Row<arma::sword>& yTrue,
                                      const arma::Row<arma::sword>& yPred,
                                      const LabelSpace& labelSpace,
                                      const arma::rowvec* weights)
{
  local_stats_detail::CheckAligned("LocalConfusionMatrix()", yTrue, yPred);
  if (weights != NULL && weights->n_elem != yTrue.n_elem)
  {
    std::ostringstream oss;
    oss << "LocalConfusionMatrix(): partition has " << yTrue.n_elem
        << " labels but " << weights->n_elem << " weights";
    throw std::invalid_argument(oss.str());
  }

  const size_t nclasses = labelSpace.NumClasses();
  arma::mat cm(nclasses, nclasses, arma::fill::zeros);
  for (size_t i = 0; i < yTrue.n_elem; ++i)
  {
    const size_t t = labelSpace.Index(yTrue[i]);
    const size_t p = labelSpace.Index(yPred[i]);
    if (t == nclasses || p == nclasses)
      continue; // stray label

    cm(t, p) += (weights == NULL) ? 1.0 : (*weights)[i];
  }

  cm.replace(arma::datum::nan, 0.0);
  return cm;
}

#endif
