#ifndef LARDER_UTILITIES_ENVIRONMENT_H
#define LARDER_UTILITIES_ENVIRONMENT_H

#include <larder/core.h>

// Environment variable access. Following the XDG conventions, a variable
// that's set to the empty string is treated as if it weren't set at all.

namespace larder {

// Get the value of a required environment variable.
// If it's missing (or empty), this throws missing_environment_variable.
string
get_environment_variable(string const& name);

LARDER_DEFINE_EXCEPTION(missing_environment_variable)
LARDER_DEFINE_ERROR_INFO(string, variable_name)

optional<string>
get_optional_environment_variable(string const& name);

// Set an environment variable. Setting it to the empty string unsets it.
void
set_environment_variable(string const& name, string const& value);

void
unset_environment_variable(string const& name);

// Override an environment variable for the lifetime of this object.
// (:value of none means the variable is unset.) Whatever value the variable
// had before is restored on destruction.
struct scoped_environment_variable : noncopyable
{
    scoped_environment_variable(string name, optional<string> const& value);
    ~scoped_environment_variable();

 private:
    string name_;
    optional<string> original_value_;
};

} // namespace larder

#endif
