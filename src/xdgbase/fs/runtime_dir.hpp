#ifndef XDGBASE_FS_RUNTIME_DIR_HPP
#define XDGBASE_FS_RUNTIME_DIR_HPP

#ifndef _WIN32

#include <ostream>

#include <xdgbase/fs/types.hpp>

// This file provides a check that a directory meets the requirements that the
// XDG Base Directory Specification places on $XDG_RUNTIME_DIR: it must be
// owned by the user, and its access mode must be 0700.
//
// The check is purely advisory. It never creates the directory or repairs its
// permissions. What to do about a directory that fails is up to the caller.

namespace xdgbase {

enum class runtime_dir_status
{
    // the directory meets all requirements
    VALID,
    // the path doesn't exist or isn't a directory
    NOT_FOUND,
    // the directory isn't owned by the effective user
    WRONG_OWNER,
    // the directory's mode isn't exactly 0700
    INSECURE_PERMISSIONS
};

// Get a short, human-readable description of :status.
char const*
get_description(runtime_dir_status status);

std::ostream&
operator<<(std::ostream& s, runtime_dir_status status);

// Check whether :path is acceptable as a runtime directory.
//
// Symbolic links are followed. The checks are applied in the order listed in
// runtime_dir_status, and the first one that fails determines the result.
//
// If the metadata can't be read for some reason other than the path not
// existing (e.g., a parent directory isn't searchable), system_call_failed is
// thrown.
//
runtime_dir_status
validate_runtime_dir(file_path const& path);

} // namespace xdgbase

#endif

#endif
