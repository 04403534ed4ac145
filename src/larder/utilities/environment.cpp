#include <larder/utilities/environment.h>

#include <cstdlib>

namespace larder {

string
get_environment_variable(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
    {
        LARDER_THROW(
            missing_environment_variable() << variable_name_info(name));
    }
    return std::move(*value);
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    if (!value || *value == '\0')
        return none;
    return string(value);
}

void
set_environment_variable(string const& name, string const& value)
{
    if (value.empty())
        unset_environment_variable(name);
    else
        setenv(name.c_str(), value.c_str(), 1);
}

void
unset_environment_variable(string const& name)
{
    unsetenv(name.c_str());
}

static void
restore_environment_variable(string const& name, optional<string> const& value)
{
    if (value)
        set_environment_variable(name, *value);
    else
        unset_environment_variable(name);
}

scoped_environment_variable::scoped_environment_variable(
    string name, optional<string> const& value)
    : name_(std::move(name)),
      original_value_(get_optional_environment_variable(name_))
{
    restore_environment_variable(name_, value);
}

scoped_environment_variable::~scoped_environment_variable()
{
    restore_environment_variable(name_, original_value_);
}

} // namespace larder
