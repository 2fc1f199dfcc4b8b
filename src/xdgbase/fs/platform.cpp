#include <xdgbase/fs/platform.hpp>

#ifndef _WIN32

#include <cerrno>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include <xdgbase/core/logging.hpp>

namespace xdgbase {

char
posix_path_rules::list_separator() const
{
    return ':';
}

bool
posix_path_rules::is_absolute(file_path const& path) const
{
    return path.is_absolute();
}

optional<file_path>
posix_path_rules::get_home_dir(environment const& env) const
{
    auto home = env.get("HOME");
    if (home)
    {
        file_path dir = *home;
        if (is_absolute(dir))
            return dir;
        XDGBASE_LOG_DEBUG("HOME is not absolute ({}); ignoring it", *home)
    }
    return get_home_dir_from_passwd();
}

optional<file_path>
get_home_dir_from_passwd()
{
    long suggested_size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(suggested_size > 0 ? suggested_size : 1024);

    struct passwd entry;
    struct passwd* result = nullptr;
    int error;
    while ((error = getpwuid_r(
                geteuid(), &entry, buffer.data(), buffer.size(), &result))
           == ERANGE)
    {
        buffer.resize(buffer.size() * 2);
    }

    if (error != 0 || !result || !result->pw_dir || *result->pw_dir == '\0')
        return none;

    file_path dir = result->pw_dir;
    if (!dir.is_absolute())
        return none;
    return dir;
}

path_rules const&
get_native_path_rules()
{
    static posix_path_rules const the_rules{};
    return the_rules;
}

} // namespace xdgbase

#else

namespace xdgbase {

char
windows_path_rules::list_separator() const
{
    return ';';
}

bool
windows_path_rules::is_absolute(file_path const& path) const
{
    return path.is_absolute();
}

optional<file_path>
windows_path_rules::get_home_dir(environment const& env) const
{
    auto profile = env.get("USERPROFILE");
    if (profile)
    {
        file_path dir = *profile;
        if (is_absolute(dir))
            return dir;
    }
    return none;
}

path_rules const&
get_native_path_rules()
{
    static windows_path_rules const the_rules{};
    return the_rules;
}

} // namespace xdgbase

#endif
