#ifndef XDGBASE_UTILITIES_ENVIRONMENT_HPP
#define XDGBASE_UTILITIES_ENVIRONMENT_HPP

#include <initializer_list>
#include <map>
#include <utility>

#include <xdgbase/core/exception.hpp>

namespace xdgbase {

// environment is a read-only view of a set of environment variables.
//
// Resolution functions take one of these instead of reading the process
// environment directly, so that callers (and tests) can supply a synthetic
// environment without touching real process state.
//
// An empty value is reported the same as an unset one.
//
struct environment
{
    virtual ~environment()
    {
    }

    virtual optional<string>
    get(string const& name) const = 0;
};

// process_environment reads the variables of the current process.
struct process_environment : environment
{
    optional<string>
    get(string const& name) const override;
};

// Get a process_environment instance.
environment const&
get_process_environment();

// mapped_environment serves variables out of an in-memory map.
struct mapped_environment : environment
{
    mapped_environment()
    {
    }

    mapped_environment(
        std::initializer_list<std::pair<string const, string>> variables)
        : variables(variables)
    {
    }

    optional<string>
    get(string const& name) const override;

    std::map<string, string> variables;
};

// Get the value of a variable from :env.
string
get_environment_variable(environment const& env, string const& name);
// If the variable isn't set, the following exception is thrown.
XDGBASE_DEFINE_EXCEPTION(missing_environment_variable)
XDGBASE_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an environment variable of the current process.
string
get_environment_variable(string const& name);

// Get the value of an optional environment variable of the current process.
// If the variable isn't set (or is empty), this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Set the value of an environment variable of the current process.
// Setting it to an empty string removes it.
void
set_environment_variable(string const& name, string const& value);

} // namespace xdgbase

#endif
