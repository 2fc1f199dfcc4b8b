#ifndef XDGBASE_FS_TYPES_HPP
#define XDGBASE_FS_TYPES_HPP

#include <filesystem>
#include <vector>

#include <xdgbase/core/exception.hpp>

namespace xdgbase {

// Use std::filesystem's path as our official type of representing paths.
// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read and this seems like a
// pretty common usage.)
typedef std::filesystem::path file_path;

// An ordered list of directories, highest precedence first.
typedef std::vector<file_path> search_path;

XDGBASE_DEFINE_ERROR_INFO(file_path, file_path)

} // namespace xdgbase

#endif
