/**
 * mpi_dispatcher_impl.hpp
 *
 * Implementation of MPIDispatcher.
 */
#ifndef MPI_DISPATCHER_IMPL_HPP
#define MPI_DISPATCHER_IMPL_HPP

#include "mpi_dispatcher.hpp"
#include "../metric_error.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

inline MPIDispatcher::MPIDispatcher(MPI_Comm comm, const bool verbose) :
    verbose(verbose),
    comm(comm)
{
  // Get world information from MPI.
  int sizeIn, rankIn;
  MPI_Comm_size(comm, &sizeIn);
  MPI_Comm_rank(comm, &rankIn);
  worldSize = (size_t) sizeIn;
  worldRank = (size_t) rankIn;
}

inline int PayloadLayout(const std::vector<uint64_t>& headers,
                         const std::vector<int>& ownedCounts,
                         std::vector<int>& counts,
                         std::vector<int>& displs)
{
  // MPI counts and displacements are ints.
  const uint64_t maxCount = (uint64_t) std::numeric_limits<int>::max();
  counts.assign(ownedCounts.size(), 0);
  displs.assign(ownedCounts.size(), 0);
  uint64_t total = 0;
  size_t h = 0;
  for (size_t r = 0; r < ownedCounts.size(); ++r)
  {
    displs[r] = (int) total;
    for (int i = 0; i < ownedCounts[r]; ++i, h += 4)
    {
      const uint64_t rows = headers[h + 2];
      const uint64_t cols = headers[h + 3];
      if ((cols != 0 && rows > maxCount / cols) ||
          total + rows * cols > maxCount)
      {
        std::ostringstream oss;
        oss << "PayloadLayout(): the partial statistics have more than "
            << maxCount << " elements in total, which is too many to exchange";
        throw std::invalid_argument(oss.str());
      }
      total += rows * cols;
    }
    counts[r] = (int) total - displs[r];
  }

  return (int) total;
}

template<typename eT>
PartitionedSequence<eT> MPIDispatcher::Distribute(
    const arma::Row<eT>& localChunk) const
{
  const uint64_t localSize = localChunk.n_elem;
  arma::Col<uint64_t> sizes(worldSize);
  MPI_Allgather(&localSize, 1, MPI_UINT64_T, sizes.memptr(), 1, MPI_UINT64_T,
      comm);

  std::vector<PartitionHandle> handles(worldSize);
  std::vector<arma::Row<eT>> chunks(worldSize);
  std::vector<bool> resident(worldSize, false);
  size_t offset = 0;
  for (size_t r = 0; r < worldSize; ++r)
  {
    handles[r] = PartitionHandle(r, r, offset, sizes[r]);
    offset += sizes[r];
  }

  chunks[worldRank] = localChunk;
  resident[worldRank] = true;

  return PartitionedSequence<eT>(handles, std::move(chunks), resident);
}

template<typename eT, typename FunctionType>
std::vector<arma::Mat<eT>> MPIDispatcher::Dispatch(
    const std::vector<PartitionHandle>& partitions,
    FunctionType f)
{
  // Every rank sees the same handles, so every rank can compute how many
  // partitions each worker owns.
  std::vector<int> ownedCounts(worldSize, 0);
  for (size_t p = 0; p < partitions.size(); ++p)
  {
    if (partitions[p].worker >= worldSize)
    {
      std::ostringstream oss;
      oss << "MPIDispatcher::Dispatch(): partition " << partitions[p].index
          << " is owned by worker " << partitions[p].worker << ", but there "
          << "are only " << worldSize << " MPI workers";
      throw std::invalid_argument(oss.str());
    }

    ++ownedCounts[partitions[p].worker];
  }

  // Compute the local partials.  After the first failure the remaining local
  // units are skipped.
  std::vector<size_t> owned;
  std::vector<arma::Mat<eT>> localResults;
  std::string localError;
  size_t failedPartition = partitions.size();
  for (size_t p = 0; p < partitions.size(); ++p)
  {
    if (partitions[p].worker != worldRank)
      continue;

    owned.push_back(p);
    localResults.push_back(arma::Mat<eT>());
    if (!localError.empty())
      continue;

    arma::wall_clock c;
    c.tic();
    try
    {
      localResults.back() = f(partitions[p]);
    }
    catch (const std::exception& e)
    {
      localError = (e.what()[0] == '\0') ? "unknown error" : e.what();
      failedPartition = p;
      continue;
    }
    catch (...)
    {
      localError = "unknown error";
      failedPartition = p;
      continue;
    }

    const double unitTime = c.toc();
    if (verbose)
    {
      std::cout << "Worker " << worldRank << " took " << unitTime << "s on "
          << "partition " << partitions[p].index << " (" << partitions[p].size
          << " points)." << std::endl;
    }
  }

  // Exchange one header per partition: index, failure flag, rows, columns.
  std::vector<uint64_t> localHeaders(4 * owned.size() + 1);
  for (size_t i = 0; i < owned.size(); ++i)
  {
    localHeaders[4 * i] = owned[i];
    localHeaders[4 * i + 1] = (owned[i] == failedPartition) ? 1 : 0;
    localHeaders[4 * i + 2] = localResults[i].n_rows;
    localHeaders[4 * i + 3] = localResults[i].n_cols;
  }

  std::vector<int> headerCounts(worldSize);
  std::vector<int> headerDispls(worldSize);
  int totalHeaders = 0;
  for (size_t r = 0; r < worldSize; ++r)
  {
    headerCounts[r] = 4 * ownedCounts[r];
    headerDispls[r] = totalHeaders;
    totalHeaders += headerCounts[r];
  }

  std::vector<uint64_t> headers(totalHeaders + 1);
  MPI_Allgatherv(localHeaders.data(), headerCounts[worldRank], MPI_UINT64_T,
      headers.data(), headerCounts.data(), headerDispls.data(), MPI_UINT64_T,
      comm);

  // Fail the whole round on every rank if any unit failed anywhere.
  std::vector<size_t> failedPartitions;
  for (int h = 0; h < totalHeaders; h += 4)
  {
    if (headers[h + 1] != 0)
      failedPartitions.push_back(headers[h]);
  }

  if (!failedPartitions.empty())
  {
    std::ostringstream oss;
    oss << "computation failed on partition(s)";
    for (size_t i = 0; i < failedPartitions.size(); ++i)
    {
      oss << " " << failedPartitions[i] << " (worker "
          << partitions[failedPartitions[i]].worker;
      if (failedPartitions[i] == failedPartition)
        oss << ": " << localError;
      oss << ")";
    }
    throw MetricError(MetricErrorKind::WORKER_COMPUTATION_FAILED, oss.str());
  }

  // Now exchange the payloads, laid out in the same order as the headers.
  std::vector<int> payloadCounts, payloadDispls;
  const int totalPayload = PayloadLayout(headers, ownedCounts, payloadCounts,
      payloadDispls);

  std::vector<eT> localPayload((size_t) payloadCounts[worldRank] + 1);
  size_t pos = 0;
  for (size_t i = 0; i < localResults.size(); ++i)
  {
    std::copy(localResults[i].begin(), localResults[i].end(),
        localPayload.begin() + pos);
    pos += localResults[i].n_elem;
  }

  std::vector<eT> payload((size_t) totalPayload + 1);
  MPI_Allgatherv(localPayload.data(), payloadCounts[worldRank],
      MPIType<eT>::Get(), payload.data(), payloadCounts.data(),
      payloadDispls.data(), MPIType<eT>::Get(), comm);

  std::vector<arma::Mat<eT>> results(partitions.size());
  pos = 0;
  for (int k = 0; k < totalHeaders; k += 4)
  {
    const size_t rows = headers[k + 2];
    const size_t cols = headers[k + 3];
    results[headers[k]] = arma::Mat<eT>(payload.data() + pos, rows, cols);
    pos += rows * cols;
  }

  return results;
}

#endif
