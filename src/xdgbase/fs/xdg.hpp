#ifndef XDGBASE_FS_XDG_HPP
#define XDGBASE_FS_XDG_HPP

#include <xdgbase/fs/platform.hpp>
#include <xdgbase/fs/types.hpp>
#include <xdgbase/utilities/environment.hpp>

// This file provides utilities for resolving directory locations according to
// the XDG Base Directory Specification.
//
// Every function here reads its variables from :env (the process environment
// by default) and applies the platform rules in :rules. Nothing is cached and
// nothing is created; the returned directories may not exist.
//
// Values that are set to relative paths are ignored, as the XDG specification
// requires, and empty values are treated the same as unset ones.

namespace xdgbase {

// If a home-relative default is needed and the user's home directory can't
// be determined, this is thrown. :variable_name_info is the XDG variable
// that would have overridden the default.
XDGBASE_DEFINE_EXCEPTION(missing_home_dir)

// XDG_RUNTIME_DIR has no default, so if it's not set, this is thrown.
XDGBASE_DEFINE_EXCEPTION(missing_runtime_dir)

// Get the directory for user-specific data files.
// $XDG_DATA_HOME, defaulting to $HOME/.local/share.
file_path
get_data_home(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the directory for user-specific configuration files.
// $XDG_CONFIG_HOME, defaulting to $HOME/.config.
file_path
get_config_home(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the directory for user-specific non-essential (cached) data.
// $XDG_CACHE_HOME, defaulting to $HOME/.cache.
file_path
get_cache_home(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the directory for user-specific state data (history, logs, etc.) that
// should persist between restarts but isn't important enough for data home.
// $XDG_STATE_HOME, defaulting to $HOME/.local/state.
file_path
get_state_home(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the directory for user-specific runtime files (sockets, named pipes,
// etc.). This is $XDG_RUNTIME_DIR. If that isn't set to an absolute path,
// missing_runtime_dir is thrown, since there's no safe default.
//
// Note that this doesn't check that the directory actually meets the
// XDG requirements. See validate_runtime_dir() for that.
//
file_path
get_runtime_dir(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the system directories to search for data files.
// $XDG_DATA_DIRS, defaulting to /usr/local/share:/usr/share.
search_path
get_data_dirs(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Get the system directories to search for configuration files.
// $XDG_CONFIG_DIRS, defaulting to /etc/xdg.
search_path
get_config_dirs(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Split a list-valued variable into its directories, preserving order.
// Empty segments and relative paths are dropped, so the result may be empty.
search_path
split_search_path(
    string const& value,
    path_rules const& rules = get_native_path_rules());

// Get the full list of places to look for configuration files, in XDG
// precedence order (i.e., the config home followed by the config dirs).
search_path
get_config_search_path(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Same as above, but for data files.
search_path
get_data_search_path(
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Given a search path and a relative path to a file (or directory), this will
// scan the search path and return the full path to the first place it's
// found. If the return value is none, the item doesn't exist anywhere.
optional<file_path>
search_in_path(search_path const& path, file_path const& item);

// Given a relative path to a configuration file (or directory) that the
// application wants to read, this will scan the list of possible locations
// where it could be stored and return the full path to the first place it's
// found.
optional<file_path>
find_config_item(
    file_path const& item,
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

// Same as above, but for data files.
optional<file_path>
find_data_item(
    file_path const& item,
    environment const& env = get_process_environment(),
    path_rules const& rules = get_native_path_rules());

} // namespace xdgbase

#endif
