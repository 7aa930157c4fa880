/**
 * label_space.hpp
 *
 * The ordered set of class labels valid for one evaluation run, and the
 * scatter/gather round that discovers it.
 */
#ifndef LABEL_SPACE_HPP
#define LABEL_SPACE_HPP

#include <armadillo>
#include "partitioned_sequence.hpp"

class LabelSpace
{
 public:
  LabelSpace();

  // The labels do not need to be sorted or unique.
  explicit LabelSpace(const arma::Col<arma::sword>& labels);

  size_t NumClasses() const { return labels.n_elem; }
  const arma::Col<arma::sword>& Labels() const { return labels; }

  // True when the labels are exactly 0, 1, ..., NumClasses() - 1.
  bool IsContiguous() const { return contiguous; }

  // Return the class index of the given label, or NumClasses() if the label
  // is not part of the space.
  size_t Index(const arma::sword label) const;

  // Map every label in the sequence to its class index.
  arma::uvec Indices(const arma::Row<arma::sword>& sequence) const;

 private:
  arma::Col<arma::sword> labels;
  bool contiguous;
};

/**
 * Run one scatter/gather round over `yTrue`: every partition computes its own
 * set of distinct labels, and the sets are merged into one sorted LabelSpace.
 * Throws MetricError if the sequence is empty or any partition fails.
 */
template<typename DispatcherType>
LabelSpace ResolveLabelSpace(DispatcherType& dispatcher,
                             const LabelSequence& yTrue);

// Include implementation.
#include "label_space_impl.hpp"

#endif
