/**
 * metric_error.hpp
 *
 * Exception type for failures of a distributed metric computation.
 */
#ifndef METRIC_ERROR_HPP
#define METRIC_ERROR_HPP

#include <stdexcept>
#include <string>

enum class MetricErrorKind
{
  INVALID_AVERAGING_MODE,
  DEGENERATE_LABEL_SPACE,
  PARTITION_MISMATCH,
  WORKER_COMPUTATION_FAILED,
  EMPTY_INPUT
};

inline const char* MetricErrorKindName(const MetricErrorKind kind)
{
  switch (kind)
  {
    case MetricErrorKind::INVALID_AVERAGING_MODE:
      return "InvalidAveragingMode";
    case MetricErrorKind::DEGENERATE_LABEL_SPACE:
      return "DegenerateLabelSpace";
    case MetricErrorKind::PARTITION_MISMATCH:
      return "PartitionMismatch";
    case MetricErrorKind::WORKER_COMPUTATION_FAILED:
      return "WorkerComputationFailed";
    case MetricErrorKind::EMPTY_INPUT:
      return "EmptyInput";
  }

  return "Unknown";
}

/**
 * All metric errors are fatal: the operation that raised one has returned
 * nothing, and no partial result is available.
 */
class MetricError : public std::runtime_error
{
 public:
  MetricError(const MetricErrorKind kind, const std::string& message) :
      std::runtime_error(std::string(MetricErrorKindName(kind)) + ": " +
          message),
      kind(kind)
  {
    // Nothing else to do.
  }

  MetricErrorKind Kind() const { return kind; }

 private:
  MetricErrorKind kind;
};

#endif
