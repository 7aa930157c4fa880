/**
 * data_utils_impl.hpp
 *
 * Implementation of miscellaneous utilities for the command-line programs.
 */
#ifndef DATA_UTILS_IMPL_HPP
#define DATA_UTILS_IMPL_HPP

#include "data_utils.hpp"
#include <sstream>

inline std::tuple<std::string, std::string> SplitDatasetArgument(
    const std::string& arg)
{
  size_t idx = arg.find_first_of(',');
  if (idx == std::string::npos)
  {
    return std::make_tuple(arg, std::string(""));
  }
  else
  {
    std::string trueFile = arg.substr(0, idx);
    std::string predFile = arg.substr(idx + 1);

    return std::make_tuple(trueFile, predFile);
  }
}

inline std::string PartitionFilename(const std::string& baseFilename,
                                     const size_t partition,
                                     const std::string& extension)
{
  std::ostringstream oss;
  oss << baseFilename << "." << partition << "." << extension;
  return oss.str();
}

#endif
