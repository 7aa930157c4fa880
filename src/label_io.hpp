/**
 * label_io.hpp
 *
 * Trivially simple loader for label and weight files.
 */
#ifndef LABEL_IO_HPP
#define LABEL_IO_HPP

#include <armadillo>

/**
 * Given a filename, return the first whitespace-separated token of every line
 * as an element of the returned row.  This reads both plain one-value-per-line
 * files and libsvm files (where the first token is the label).  Empty lines
 * are skipped.  If eT is an integer type, every value must be integral.
 */
template<typename eT>
arma::Row<eT> load_labels(const std::string& filename,
                          const bool verbose = false);

// Include implementation.
#include "label_io_impl.hpp"

#endif
