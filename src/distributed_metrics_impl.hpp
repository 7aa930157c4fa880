/**
 * distributed_metrics_impl.hpp
 *
 * Implementation of DistributedMetrics.
 */
#ifndef DISTRIBUTED_METRICS_IMPL_HPP
#define DISTRIBUTED_METRICS_IMPL_HPP

#include "distributed_metrics.hpp"
#include "local_stats.hpp"
#include "metric_error.hpp"
#include <iostream>
#include <sstream>

template<typename DispatcherType>
DistributedMetrics<DispatcherType>::DistributedMetrics(
    DispatcherType& dispatcher,
    const bool verbose) :
    verbose(verbose),
    dispatcher(dispatcher)
{
  // Nothing else to do.
}

template<typename DispatcherType>
template<typename eT>
void DistributedMetrics<DispatcherType>::CheckAligned(
    const char* caller,
    const LabelSequence& yTrue,
    const PartitionedSequence<eT>& other) const
{
  if (yTrue.TotalSize() != other.TotalSize() ||
      yTrue.NumPartitions() != other.NumPartitions())
  {
    std::ostringstream oss;
    oss << caller << ": true labels have " << yTrue.TotalSize() << " points "
        << "in " << yTrue.NumPartitions() << " partitions, but the aligned "
        << "sequence has " << other.TotalSize() << " points in "
        << other.NumPartitions() << " partitions";
    throw MetricError(MetricErrorKind::PARTITION_MISMATCH, oss.str());
  }
}

template<typename DispatcherType>
void DistributedMetrics<DispatcherType>::CheckNonEmpty(
    const char* caller,
    const LabelSequence& yTrue,
    const LabelSpace& labelSpace) const
{
  if (yTrue.TotalSize() == 0)
  {
    std::ostringstream oss;
    oss << caller << ": the sequences have no points";
    throw MetricError(MetricErrorKind::EMPTY_INPUT, oss.str());
  }

  if (labelSpace.NumClasses() == 0)
  {
    std::ostringstream oss;
    oss << caller << ": the label space has no classes";
    throw MetricError(MetricErrorKind::EMPTY_INPUT, oss.str());
  }
}

template<typename DispatcherType>
LabelSpace DistributedMetrics<DispatcherType>::ResolveLabelSpace(
    const LabelSequence& yTrue)
{
  arma::wall_clock c;
  c.tic();
  const LabelSpace labelSpace = ::ResolveLabelSpace(dispatcher, yTrue);
  if (verbose)
  {
    std::cout << "Resolving the label space over " << yTrue.NumPartitions()
        << " partitions took " << c.toc() << "s; found "
        << labelSpace.NumClasses() << " classes." << std::endl;
  }

  return labelSpace;
}

template<typename DispatcherType>
double DistributedMetrics<DispatcherType>::Accuracy(
    const LabelSequence& yTrue,
    const LabelSequence& yPred)
{
  CheckAligned("Accuracy()", yTrue, yPred);
  if (yTrue.TotalSize() == 0)
  {
    throw MetricError(MetricErrorKind::EMPTY_INPUT, "cannot compute accuracy "
        "of zero points");
  }

  arma::wall_clock c;
  c.tic();
  const std::vector<arma::umat> partials =
      dispatcher.template Dispatch<arma::uword>(yTrue.Partitions(),
      [&yTrue, &yPred](const PartitionHandle& partition)
      {
        return LocalCorrectCount(yTrue.Local(partition.index),
                                 yPred.Local(partition.index));
      });

  const double accuracy = AccuracyFromCounts(SumPartials(partials, 2, 1));
  if (verbose)
  {
    std::cout << "Accuracy over " << yTrue.TotalSize() << " points took "
        << c.toc() << "s: " << accuracy << "." << std::endl;
  }

  return accuracy;
}

template<typename DispatcherType>
double DistributedMetrics<DispatcherType>::Precision(
    const LabelSequence& yTrue,
    const LabelSequence& yPred,
    const PrecisionAverage average)
{
  CheckAligned("Precision()", yTrue, yPred);
  return Precision(yTrue, yPred, ResolveLabelSpace(yTrue), average);
}

template<typename DispatcherType>
double DistributedMetrics<DispatcherType>::Precision(
    const LabelSequence& yTrue,
    const LabelSequence& yPred,
    const LabelSpace& labelSpace,
    const PrecisionAverage average)
{
  CheckAligned("Precision()", yTrue, yPred);
  CheckNonEmpty("Precision()", yTrue, labelSpace);
  CheckPrecisionClasses(labelSpace.NumClasses(), average);

  arma::wall_clock c;
  c.tic();
  const std::vector<arma::umat> partials =
      dispatcher.template Dispatch<arma::uword>(yTrue.Partitions(),
      [&yTrue, &yPred, &labelSpace](const PartitionHandle& partition)
      {
        return LocalTruePositives(yTrue.Local(partition.index),
                                  yPred.Local(partition.index),
                                  labelSpace);
      });

  const double precision = PrecisionFromCounts(
      SumPartials(partials, labelSpace.NumClasses(), 2), average);
  if (verbose)
  {
    std::cout << "Precision (" << ToString(average) << ") over "
        << labelSpace.NumClasses() << " classes took " << c.toc() << "s: "
        << precision << "." << std::endl;
  }

  return precision;
}

template<typename DispatcherType>
arma::mat DistributedMetrics<DispatcherType>::ConfusionMatrix(
    const LabelSequence& yTrue,
    const LabelSequence& yPred,
    const ConfusionNormalization normalize,
    const WeightSequence* weights)
{
  CheckAligned("ConfusionMatrix()", yTrue, yPred);
  if (weights != NULL)
    CheckAligned("ConfusionMatrix()", yTrue, *weights);

  return ConfusionMatrix(yTrue, yPred, ResolveLabelSpace(yTrue), normalize,
      weights);
}

template<typename DispatcherType>
arma::mat DistributedMetrics<DispatcherType>::ConfusionMatrix(
    const LabelSequence& yTrue,
    const LabelSequence& yPred,
    const LabelSpace& labelSpace,
    const ConfusionNormalization normalize,
    const WeightSequence* weights)
{
  CheckAligned("ConfusionMatrix()", yTrue, yPred);
  if (weights != NULL)
    CheckAligned("ConfusionMatrix()", yTrue, *weights);
  CheckNonEmpty("ConfusionMatrix()", yTrue, labelSpace);

  arma::wall_clock c;
  c.tic();
  const std::vector<arma::mat> partials =
      dispatcher.template Dispatch<double>(yTrue.Partitions(),
      [&yTrue, &yPred, &labelSpace, weights](const PartitionHandle& partition)
          -> arma::mat
      {
        const arma::rowvec* localWeights = NULL;
        if (weights != NULL)
          localWeights = &weights->Local(partition.index);

        return LocalConfusionMatrix(yTrue.Local(partition.index),
            yPred.Local(partition.index), labelSpace, localWeights);
      });

  const size_t nclasses = labelSpace.NumClasses();
  const arma::mat cm = NormalizeConfusionMatrix(
      SumPartials(partials, nclasses, nclasses), normalize);
  if (verbose)
  {
    std::cout << "Confusion matrix (" << nclasses << "x" << nclasses
        << ", normalization " << ToString(normalize) << ") took " << c.toc()
        << "s." << std::endl;
  }

  return cm;
}

template<typename DispatcherType>
MetricsReport DistributedMetrics<DispatcherType>::Evaluate(
    const LabelSequence& yTrue,
    const LabelSequence& yPred,
    const PrecisionAverage average,
    const ConfusionNormalization normalize,
    const WeightSequence* weights)
{
  CheckAligned("Evaluate()", yTrue, yPred);
  if (weights != NULL)
    CheckAligned("Evaluate()", yTrue, *weights);

  MetricsReport report;
  report.labelSpace = ResolveLabelSpace(yTrue);
  report.accuracy = Accuracy(yTrue, yPred);
  report.average = average;
  report.precision = Precision(yTrue, yPred, report.labelSpace, average);
  report.normalize = normalize;
  report.confusion = ConfusionMatrix(yTrue, yPred, report.labelSpace,
      normalize, weights);

  return report;
}

#endif
