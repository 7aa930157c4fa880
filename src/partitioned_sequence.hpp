/**
 * partitioned_sequence.hpp
 *
 * A sequence of values split into contiguous partitions, each owned by one
 * worker.  Only the partitions resident in this process can be accessed.
 */
#ifndef PARTITIONED_SEQUENCE_HPP
#define PARTITIONED_SEQUENCE_HPP

#include <armadillo>
#include <vector>

struct PartitionHandle
{
  PartitionHandle() : index(0), worker(0), offset(0), size(0) { }

  PartitionHandle(const size_t index,
                  const size_t worker,
                  const size_t offset,
                  const size_t size) :
      index(index), worker(worker), offset(offset), size(size) { }

  size_t index; // position of the partition in the sequence
  size_t worker; // thread or rank that owns the partition
  size_t offset; // global row of the first element
  size_t size; // number of rows
};

template<typename eT>
class PartitionedSequence
{
 public:
  PartitionedSequence();

  // Create a sequence from explicit handles.  `chunks[i]` holds the data of
  // partition i if it is resident in this process, and is ignored otherwise.
  PartitionedSequence(const std::vector<PartitionHandle>& handles,
                      std::vector<arma::Row<eT>>&& chunks,
                      const std::vector<bool>& resident);

  // Split `data` into `partitions` contiguous partitions, all resident here.
  // Partition p is owned by worker (p % workers).
  static PartitionedSequence Split(const arma::Row<eT>& data,
                                   const size_t partitions,
                                   const size_t workers = 1);

  // Split `data` into partitions of the given sizes, all resident here.
  static PartitionedSequence Split(const arma::Row<eT>& data,
                                   const std::vector<size_t>& sizes,
                                   const size_t workers = 1);

  const std::vector<PartitionHandle>& Partitions() const { return handles; }
  size_t NumPartitions() const { return handles.size(); }
  size_t TotalSize() const;

  bool IsResident(const size_t partition) const;

  // Get the data of a resident partition.  Throws std::invalid_argument if
  // the partition does not exist or lives on another worker.
  const arma::Row<eT>& Local(const size_t partition) const;

 private:
  std::vector<PartitionHandle> handles;
  std::vector<arma::Row<eT>> chunks;
  std::vector<bool> resident;
};

typedef PartitionedSequence<arma::sword> LabelSequence;
typedef PartitionedSequence<double> WeightSequence;

// Include implementation.
#include "partitioned_sequence_impl.hpp"

#endif
