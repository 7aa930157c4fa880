/**
 * partitioned_sequence_impl.hpp
 *
 * Implementation of PartitionedSequence.
 */
#ifndef PARTITIONED_SEQUENCE_IMPL_HPP
#define PARTITIONED_SEQUENCE_IMPL_HPP

#include "partitioned_sequence.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

template<typename eT>
PartitionedSequence<eT>::PartitionedSequence()
{
  // Nothing to do.
}

template<typename eT>
PartitionedSequence<eT>::PartitionedSequence(
    const std::vector<PartitionHandle>& handles,
    std::vector<arma::Row<eT>>&& chunksIn,
    const std::vector<bool>& resident) :
    handles(handles),
    chunks(std::move(chunksIn)),
    resident(resident)
{
  if (chunks.size() != handles.size() || resident.size() != handles.size())
  {
    std::ostringstream oss;
    oss << "PartitionedSequence::PartitionedSequence(): got " << handles.size()
        << " handles but " << chunks.size() << " chunks and "
        << resident.size() << " residency flags";
    throw std::invalid_argument(oss.str());
  }

  for (size_t p = 0; p < handles.size(); ++p)
  {
    if (handles[p].index != p)
    {
      std::ostringstream oss;
      oss << "PartitionedSequence::PartitionedSequence(): handle " << p
          << " has index " << handles[p].index;
      throw std::invalid_argument(oss.str());
    }

    if (resident[p] && chunks[p].n_elem != handles[p].size)
    {
      std::ostringstream oss;
      oss << "PartitionedSequence::PartitionedSequence(): partition " << p
          << " should hold " << handles[p].size << " points but holds "
          << chunks[p].n_elem;
      throw std::invalid_argument(oss.str());
    }
  }
}

template<typename eT>
PartitionedSequence<eT> PartitionedSequence<eT>::Split(
    const arma::Row<eT>& data,
    const size_t partitions,
    const size_t workers)
{
  if (partitions == 0)
  {
    throw std::invalid_argument("PartitionedSequence::Split(): partitions "
        "must be positive");
  }

  // The last partition may be smaller than the others (or even empty).
  const size_t points = (data.n_elem + partitions - 1) / partitions;
  std::vector<size_t> sizes(partitions);
  for (size_t p = 0; p < partitions; ++p)
  {
    const size_t start = std::min(p * points, (size_t) data.n_elem);
    const size_t end = std::min((p + 1) * points, (size_t) data.n_elem);
    sizes[p] = end - start;
  }

  return Split(data, sizes, workers);
}

template<typename eT>
PartitionedSequence<eT> PartitionedSequence<eT>::Split(
    const arma::Row<eT>& data,
    const std::vector<size_t>& sizes,
    const size_t workers)
{
  if (workers == 0)
  {
    throw std::invalid_argument("PartitionedSequence::Split(): workers must "
        "be positive");
  }

  size_t total = 0;
  for (size_t p = 0; p < sizes.size(); ++p)
    total += sizes[p];

  if (total != data.n_elem)
  {
    std::ostringstream oss;
    oss << "PartitionedSequence::Split(): partition sizes sum to " << total
        << " but the data has " << data.n_elem << " points";
    throw std::invalid_argument(oss.str());
  }

  std::vector<PartitionHandle> handles(sizes.size());
  std::vector<arma::Row<eT>> chunks(sizes.size());
  size_t offset = 0;
  for (size_t p = 0; p < sizes.size(); ++p)
  {
    handles[p] = PartitionHandle(p, p % workers, offset, sizes[p]);
    if (sizes[p] > 0)
      chunks[p] = data.subvec(offset, offset + sizes[p] - 1);
    offset += sizes[p];
  }

  return PartitionedSequence<eT>(handles, std::move(chunks),
      std::vector<bool>(sizes.size(), true));
}

template<typename eT>
size_t PartitionedSequence<eT>::TotalSize() const
{
  size_t total = 0;
  for (size_t p = 0; p < handles.size(); ++p)
    total += handles[p].size;

  return total;
}

template<typename eT>
bool PartitionedSequence<eT>::IsResident(const size_t partition) const
{
  return (partition < resident.size()) && resident[partition];
}

template<typename eT>
const arma::Row<eT>& PartitionedSequence<eT>::Local(
    const size_t partition) const
{
  if (partition >= handles.size())
  {
    std::ostringstream oss;
    oss << "PartitionedSequence::Local(): partition " << partition
        << " requested but there are only " << handles.size() << " partitions";
    throw std::invalid_argument(oss.str());
  }
  else if (!resident[partition])
  {
    std::ostringstream oss;
    oss << "PartitionedSequence::Local(): partition " << partition
        << " is owned by worker " << handles[partition].worker
        << " and is not resident in this process";
    throw std::invalid_argument(oss.str());
  }

  return chunks[partition];
}

#endif
