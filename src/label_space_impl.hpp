/**
 * label_space_impl.hpp
 *
 * Implementation of LabelSpace and label space resolution.
 */
#ifndef LABEL_SPACE_IMPL_HPP
#define LABEL_SPACE_IMPL_HPP

#include "label_space.hpp"
#include "local_stats.hpp"
#include "metric_error.hpp"
#include <algorithm>

inline LabelSpace::LabelSpace() : contiguous(true)
{
  // Nothing to do.
}

inline LabelSpace::LabelSpace(const arma::Col<arma::sword>& labelsIn) :
    contiguous(true)
{
  if (labelsIn.n_elem > 0)
    labels = arma::unique(labelsIn);

  for (size_t i = 0; i < labels.n_elem; ++i)
  {
    if (labels[i] != (arma::sword) i)
    {
      contiguous = false;
      break;
    }
  }
}

inline size_t LabelSpace::Index(const arma::sword label) const
{
  if (contiguous)
  {
    return (label >= 0 && (size_t) label < labels.n_elem) ? (size_t) label :
        labels.n_elem;
  }

  const arma::sword* begin = labels.memptr();
  const arma::sword* end = labels.memptr() + labels.n_elem;
  const arma::sword* it = std::lower_bound(begin, end, label);
  return (it != end && *it == label) ? (size_t) (it - begin) : labels.n_elem;
}

inline arma::uvec LabelSpace::Indices(
    const arma::Row<arma::sword>& sequence) const
{
  arma::uvec result(sequence.n_elem);
  for (size_t i = 0; i < sequence.n_elem; ++i)
    result[i] = Index(sequence[i]);

  return result;
}

template<typename DispatcherType>
LabelSpace ResolveLabelSpace(DispatcherType& dispatcher,
                             const LabelSequence& yTrue)
{
  if (yTrue.TotalSize() == 0)
  {
    throw MetricError(MetricErrorKind::EMPTY_INPUT, "cannot resolve the label "
        "space of a sequence with no points");
  }

  const std::vector<arma::Mat<arma::sword>> localSets =
      dispatcher.template Dispatch<arma::sword>(yTrue.Partitions(),
      [&yTrue](const PartitionHandle& partition)
      {
        return arma::Mat<arma::sword>(LocalLabelSet(
            yTrue.Local(partition.index)));
      });

  // Concatenate all local sets; the LabelSpace constructor sorts and removes
  // duplicates, so the order of the partials does not matter.
  size_t total = 0;
  for (size_t p = 0; p < localSets.size(); ++p)
    total += localSets[p].n_elem;

  arma::Col<arma::sword> all(total);
  size_t pos = 0;
  for (size_t p = 0; p < localSets.size(); ++p)
  {
    if (localSets[p].n_elem == 0)
      continue;

    all.subvec(pos, pos + localSets[p].n_elem - 1) =
        arma::vectorise(localSets[p]);
    pos += localSets[p].n_elem;
  }

  return LabelSpace(all);
}

#endif
