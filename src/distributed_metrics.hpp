/**
 * distributed_metrics.hpp
 *
 * Classification metrics over partitioned true and predicted label sequences.
 * Each metric is computed in scatter/gather rounds: every partition computes a
 * partial statistic where it lives, and the partials are summed into the
 * global result.
 */
#ifndef DISTRIBUTED_METRICS_HPP
#define DISTRIBUTED_METRICS_HPP

#include <armadillo>
#include "partitioned_sequence.hpp"
#include "label_space.hpp"
#include "global_reducer.hpp"

struct MetricsReport
{
  LabelSpace labelSpace;
  double accuracy;
  PrecisionAverage average;
  double precision;
  ConfusionNormalization normalize;
  arma::mat confusion;
};

/**
 * The dispatcher decides where each partition's unit of work runs; see
 * LocalDispatcher and MPIDispatcher.  The dispatcher must outlive this
 * object.
 */
template<typename DispatcherType>
class DistributedMetrics
{
 public:
  DistributedMetrics(DispatcherType& dispatcher, const bool verbose = false);

  // Find the sorted set of distinct labels in yTrue.
  LabelSpace ResolveLabelSpace(const LabelSequence& yTrue);

  // Fraction of points where yPred equals yTrue.
  double Accuracy(const LabelSequence& yTrue, const LabelSequence& yPred);

  double Precision(const LabelSequence& yTrue,
                   const LabelSequence& yPred,
                   const PrecisionAverage average = PrecisionAverage::BINARY);

  // Compute precision with a label space that has already been resolved.
  double Precision(const LabelSequence& yTrue,
                   const LabelSequence& yPred,
                   const LabelSpace& labelSpace,
                   const PrecisionAverage average = PrecisionAverage::BINARY);

  // Rows of the result are true classes and columns are predicted classes,
  // in the order of the label space.  `weights`, if given, must be aligned
  // with yTrue.
  arma::mat ConfusionMatrix(
      const LabelSequence& yTrue,
      const LabelSequence& yPred,
      const ConfusionNormalization normalize = ConfusionNormalization::NONE,
      const WeightSequence* weights = NULL);

  arma::mat ConfusionMatrix(
      const LabelSequence& yTrue,
      const LabelSequence& yPred,
      const LabelSpace& labelSpace,
      const ConfusionNormalization normalize = ConfusionNormalization::NONE,
      const WeightSequence* weights = NULL);

  // Resolve the label space once, then compute accuracy, precision and the
  // confusion matrix with it.
  MetricsReport Evaluate(
      const LabelSequence& yTrue,
      const LabelSequence& yPred,
      const PrecisionAverage average = PrecisionAverage::MACRO,
      const ConfusionNormalization normalize = ConfusionNormalization::NONE,
      const WeightSequence* weights = NULL);

  bool verbose;

 private:
  // Throw a PARTITION_MISMATCH MetricError unless the sequences have the same
  // number of points and partitions.
  template<typename eT>
  void CheckAligned(const char* caller,
                    const LabelSequence& yTrue,
                    const PartitionedSequence<eT>& other) const;

  // Throw an EMPTY_INPUT MetricError if there are no points or the label
  // space has no classes.
  void CheckNonEmpty(const char* caller,
                     const LabelSequence& yTrue,
                     const LabelSpace& labelSpace) const;

  DispatcherType& dispatcher;
};

// Include implementation.
#include "distributed_metrics_impl.hpp"

#endif
