/**
 * data_utils.hpp
 *
 * Miscellaneous utilities for the command-line programs.
 */
#ifndef DATA_UTILS_HPP
#define DATA_UTILS_HPP

#include <string>
#include <tuple>

// Get the true label and prediction files, if they were specified as one
// parameter separated by a comma.  The second file will be empty if not
// given.
std::tuple<std::string, std::string> SplitDatasetArgument(
    const std::string& arg);

// By convention a partition's file is `baseFilename.partition.extension`.
std::string PartitionFilename(const std::string& baseFilename,
                              const size_t partition,
                              const std::string& extension);

#include "data_utils_impl.hpp"

#endif
