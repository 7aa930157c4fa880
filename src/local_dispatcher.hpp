/**
 * local_dispatcher.hpp
 *
 * Scatter/gather over partitions that are all resident in this process.  Each
 * worker is an OpenMP thread, and a partition is only ever computed by the
 * thread whose number matches the partition's owning worker.
 */
#ifndef LOCAL_DISPATCHER_HPP
#define LOCAL_DISPATCHER_HPP

#include <armadillo>
#include <vector>
#include "partitioned_sequence.hpp"

class LocalDispatcher
{
 public:
  LocalDispatcher(const size_t workers = 1, const bool verbose = false);

  // Run `f(handle)` once for every partition, on the worker owning it, and
  // return the results indexed by partition.  `f` must return something
  // convertible to arma::Mat<eT>.  If any call throws, the calls that have not
  // started yet are skipped and a MetricError of kind
  // WORKER_COMPUTATION_FAILED is thrown once every thread has finished.
  template<typename eT, typename FunctionType>
  std::vector<arma::Mat<eT>> Dispatch(
      const std::vector<PartitionHandle>& partitions,
      FunctionType f);

  size_t Workers() const { return workers; }

  bool verbose;

 private:
  size_t workers;
};

// Include implementation.
#include "local_dispatcher_impl.hpp"

#endif
