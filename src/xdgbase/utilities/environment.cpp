#include <xdgbase/utilities/environment.hpp>

#include <cstdlib>

namespace xdgbase {

optional<string>
process_environment::get(string const& name) const
{
    return get_optional_environment_variable(name);
}

environment const&
get_process_environment()
{
    static process_environment const the_process_environment{};
    return the_process_environment;
}

optional<string>
mapped_environment::get(string const& name) const
{
    auto i = variables.find(name);
    if (i == variables.end() || i->second.empty())
        return none;
    return i->second;
}

string
get_environment_variable(environment const& env, string const& name)
{
    auto value = env.get(name);
    if (!value)
    {
        XDGBASE_THROW(
            missing_environment_variable() << variable_name_info(name));
    }
    return *value;
}

string
get_environment_variable(string const& name)
{
    return get_environment_variable(get_process_environment(), name);
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

void
set_environment_variable(string const& name, string const& value)
{
#ifdef _WIN32
    auto assignment = name + "=" + value;
    _putenv(assignment.c_str());
#else
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
#endif
}

} // namespace xdgbase
