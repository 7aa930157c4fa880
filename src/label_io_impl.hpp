/**
 * label_io_impl.hpp
 *
 * Trivially simple loader for label and weight files.
 */
#ifndef LABEL_IO_IMPL_HPP
#define LABEL_IO_IMPL_HPP

#include "label_io.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

template<typename eT>
arma::Row<eT> load_labels(const std::string& filename, const bool verbose)
{
  arma::wall_clock c;
  c.tic();

  std::fstream f(filename, std::fstream::in);
  if (!f.good())
  {
    std::ostringstream oss;
    oss << "Error opening file '" << filename << "' for reading.";
    throw std::runtime_error(oss.str());
  }

  std::vector<eT> values;
  std::string line;
  size_t line_num = 0;
  while (std::getline(f, line))
  {
    ++line_num;

    // Isolate the first token.
    const size_t start = line.find_first_not_of(" \n\r\t");
    if (start == std::string::npos)
      continue;
    const size_t end = line.find_first_of(" \n\r\t", start);
    const std::string token = line.substr(start, (end == std::string::npos) ?
        std::string::npos : end - start);

    errno = 0;
    char* strtod_out = NULL;
    const double val = std::strtod(token.c_str(), &strtod_out);
    if (errno == ERANGE)
    {
      std::ostringstream oss;
      oss << "Error on line " << line_num << " of '" << filename << "': value '"
          << token << "' is out of range";
      throw std::runtime_error(oss.str());
    }
    else if (strtod_out == token.c_str() || *strtod_out != '\0')
    {
      std::ostringstream oss;
      oss << "Error on line " << line_num << " of '" << filename << "': value '"
          << token << "' could not be parsed";
      throw std::runtime_error(oss.str());
    }

    if (std::numeric_limits<eT>::is_integer && std::floor(val) != val)
    {
      std::ostringstream oss;
      oss << "Error on line " << line_num << " of '" << filename << "': label '"
          << token << "' is not an integer";
      throw std::runtime_error(oss.str());
    }

    values.push_back((eT) val);
  }

  if (f.bad())
  {
    std::ostringstream oss;
    oss << "Error reading '" << filename << "' after line " << line_num;
    throw std::runtime_error(oss.str());
  }

  arma::Row<eT> result(values.size());
  for (size_t i = 0; i < values.size(); ++i)
    result[i] = values[i];

  if (verbose)
  {
    std::cout << "Loading " << result.n_elem << " values from '" << filename
        << "' took " << c.toc() << "s." << std::endl;
  }

  return result;
}

#endif
