/**
 * mpi_dispatcher.hpp
 *
 * MPI-based scatter/gather over partitions.  Every rank is a worker that holds
 * only its own partitions; partial statistics are exchanged so that every
 * rank ends the round with the same, complete set of partials.
 */
#ifndef MPI_DISPATCHER_HPP
#define MPI_DISPATCHER_HPP

#include <armadillo>
#include <mpi.h>
#include <cstdint>
#include <vector>
#include "../partitioned_sequence.hpp"

// Map an element type to its MPI datatype.
template<typename eT> struct MPIType;
template<> struct MPIType<double>
{ static MPI_Datatype Get() { return MPI_DOUBLE; } };
template<> struct MPIType<int>
{ static MPI_Datatype Get() { return MPI_INT; } };
template<> struct MPIType<long>
{ static MPI_Datatype Get() { return MPI_LONG; } };
template<> struct MPIType<long long>
{ static MPI_Datatype Get() { return MPI_LONG_LONG; } };
template<> struct MPIType<unsigned int>
{ static MPI_Datatype Get() { return MPI_UNSIGNED; } };
template<> struct MPIType<unsigned long>
{ static MPI_Datatype Get() { return MPI_UNSIGNED_LONG; } };
template<> struct MPIType<unsigned long long>
{ static MPI_Datatype Get() { return MPI_UNSIGNED_LONG_LONG; } };

// Given the all-gathered headers (index, failure flag, rows, columns per
// partition, grouped by owning rank) and the number of partitions each rank
// owns, fill the per-rank payload element counts and displacements for
// MPI_Allgatherv and return the total.  Throws std::invalid_argument if the
// total does not fit in an int.  Every rank sees the same headers, so every
// rank throws or none does.
inline int PayloadLayout(const std::vector<uint64_t>& headers,
                         const std::vector<int>& ownedCounts,
                         std::vector<int>& counts,
                         std::vector<int>& displs);

class MPIDispatcher
{
 public:
  MPIDispatcher(MPI_Comm comm = MPI_COMM_WORLD, const bool verbose = false);

  // Build a partitioned sequence where this rank's `localChunk` is partition
  // number `rank`, owned by this rank.  This is a collective call.
  template<typename eT>
  PartitionedSequence<eT> Distribute(const arma::Row<eT>& localChunk) const;

  // Run `f(handle)` for every partition owned by this rank, then exchange the
  // results.  Every rank must call this with the same partitions.  The
  // returned vector is indexed by partition and identical on every rank.  If
  // any call on any rank throws, every rank throws a MetricError of kind
  // WORKER_COMPUTATION_FAILED.  A call that throws something other than a
  // std::exception is reported as "unknown error".
  template<typename eT, typename FunctionType>
  std::vector<arma::Mat<eT>> Dispatch(
      const std::vector<PartitionHandle>& partitions,
      FunctionType f);

  size_t Workers() const { return worldSize; }
  size_t Rank() const { return worldRank; }

  bool verbose;

 private:
  MPI_Comm comm;
  size_t worldSize;
  size_t worldRank;
};

// Include implementation.
#include "mpi_dispatcher_impl.hpp"

#endif
