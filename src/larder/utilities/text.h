#ifndef LARDER_UTILITIES_TEXT_H
#define LARDER_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <larder/core/exception.h>

namespace larder {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
LARDER_DEFINE_EXCEPTION(parsing_error)
LARDER_DEFINE_ERROR_INFO(string, expected_format)
LARDER_DEFINE_ERROR_INFO(string, parsed_text)
LARDER_DEFINE_ERROR_INFO(string, parsing_error)

// Parse a string like "200x150" into a width and height.
// Throws parsing_error if the text isn't in that form.
std::pair<int, int>
parse_dimensions(string const& text);

} // namespace larder

#endif
