#ifndef CANOPY_UTILITIES_TEXT_H
#define CANOPY_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <canopy/core/exception.hpp>

namespace canopy {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
CANOPY_DEFINE_EXCEPTION(parsing_error)
CANOPY_DEFINE_ERROR_INFO(string, expected_format)
CANOPY_DEFINE_ERROR_INFO(string, parsed_text)
CANOPY_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace canopy

#endif
