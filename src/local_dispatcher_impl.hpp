/**
 * local_dispatcher_impl.hpp
 *
 * Implementation of LocalDispatcher.
 */
#ifndef LOCAL_DISPATCHER_IMPL_HPP
#define LOCAL_DISPATCHER_IMPL_HPP

#include "local_dispatcher.hpp"
#include "metric_error.hpp"
#include <atomic>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <omp.h>

inline LocalDispatcher::LocalDispatcher(const size_t workers,
                                        const bool verbose) :
    verbose(verbose),
    workers(workers)
{
  if (workers == 0)
  {
    throw std::invalid_argument("LocalDispatcher::LocalDispatcher(): need at "
        "least one worker");
  }
}

template<typename eT, typename FunctionType>
std::vector<arma::Mat<eT>> LocalDispatcher::Dispatch(
    const std::vector<PartitionHandle>& partitions,
    FunctionType f)
{
  for (size_t p = 0; p < partitions.size(); ++p)
  {
    if (partitions[p].worker >= workers)
    {
      std::ostringstream oss;
      oss << "LocalDispatcher::Dispatch(): partition " << partitions[p].index
          << " is owned by worker " << partitions[p].worker << ", but there "
          << "are only " << workers << " workers";
      throw std::invalid_argument(oss.str());
    }
  }

  std::vector<arma::Mat<eT>> results(partitions.size());
  std::vector<std::string> errors(partitions.size());
  std::atomic<bool> failed(false);
  const bool verboseOutput = verbose;

  // Each thread only touches the slots of the partitions it owns, so no
  // synchronization is needed besides the failure flag.  If OpenMP gives us
  // fewer threads than workers, the missing workers' partitions are spread
  // over the threads we got.
  #pragma omp parallel num_threads((int) workers)
  {
    const size_t thread = (size_t) omp_get_thread_num();
    const size_t teamSize = (size_t) omp_get_num_threads();
    for (size_t p = 0; p < partitions.size(); ++p)
    {
      if (partitions[p].worker % teamSize != thread)
        continue;
      if (failed.load())
        break;

      arma::wall_clock c;
      c.tic();
      try
      {
        results[p] = f(partitions[p]);
      }
      catch (const std::exception& e)
      {
        errors[p] = (e.what()[0] == '\0') ? "unknown error" : e.what();
        failed.store(true);
        break;
      }
      catch (...)
      {
        errors[p] = "unknown error";
        failed.store(true);
        break;
      }

      if (verboseOutput)
      {
        const double unitTime = c.toc();
        #pragma omp critical
        {
          std::cout << "Worker " << partitions[p].worker << " took "
              << unitTime << "s on partition " << partitions[p].index << " ("
              << partitions[p].size << " points)." << std::endl;
        }
      }
    }
  }

  if (!failed.load())
    return results;

  std::ostringstream oss;
  oss << "computation failed on partition(s)";
  for (size_t p = 0; p < partitions.size(); ++p)
  {
    if (!errors[p].empty())
    {
      oss << " " << partitions[p].index << " (worker " << partitions[p].worker
          << ": " << errors[p] << ")";
    }
  }
  throw MetricError(MetricErrorKind::WORKER_COMPUTATION_FAILED, oss.str());
}

#endif
