#ifndef XDGBASE_FS_PLATFORM_HPP
#define XDGBASE_FS_PLATFORM_HPP

#include <xdgbase/fs/types.hpp>
#include <xdgbase/utilities/environment.hpp>

// This file defines the handful of platform-specific rules that directory
// resolution depends on. The resolution logic itself is written once against
// the path_rules interface.

namespace xdgbase {

struct path_rules
{
    virtual ~path_rules()
    {
    }

    // the separator used in list-valued variables like XDG_DATA_DIRS
    virtual char
    list_separator() const = 0;

    virtual bool
    is_absolute(file_path const& path) const = 0;

    // Get the user's home directory, or none if it can't be determined.
    // The result (if any) is always absolute.
    virtual optional<file_path>
    get_home_dir(environment const& env) const = 0;
};

#ifndef _WIN32

// posix_path_rules use ':' as the list separator. The home directory comes
// from $HOME if that's set to an absolute path. Otherwise, it comes from the
// password database entry for the effective user.
struct posix_path_rules : path_rules
{
    char
    list_separator() const override;

    bool
    is_absolute(file_path const& path) const override;

    optional<file_path>
    get_home_dir(environment const& env) const override;
};

// Look up the home directory of the effective user in the password database.
optional<file_path>
get_home_dir_from_passwd();

#else

// windows_path_rules use ';' as the list separator and take the home
// directory from %USERPROFILE%.
struct windows_path_rules : path_rules
{
    char
    list_separator() const override;

    bool
    is_absolute(file_path const& path) const override;

    optional<file_path>
    get_home_dir(environment const& env) const override;
};

#endif

// Get the rules for the platform we're running on.
path_rules const&
get_native_path_rules();

} // namespace xdgbase

#endif
