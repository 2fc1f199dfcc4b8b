#ifndef XDGBASE_CORE_TESTING_HPP
#define XDGBASE_CORE_TESTING_HPP

#include <fstream>

#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <xdgbase/fs/platform.hpp>
#include <xdgbase/fs/types.hpp>

namespace xdgbase {

// Remove :dir (if it exists) and recreate it empty.
inline void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directory(dir);
}

// Write a string to a file (overwriting anything that might have been in it).
inline void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output(
        path, std::ios::out | std::ios::trunc | std::ios::binary);
    REQUIRE(output.good());
    output << contents;
}

// testing_path_rules behave like the native rules, except that the home
// directory only ever comes from the environment, so tests get the same
// answer no matter which user runs them.
struct testing_path_rules : path_rules
{
    char
    list_separator() const override
    {
        return get_native_path_rules().list_separator();
    }

    bool
    is_absolute(file_path const& path) const override
    {
        return get_native_path_rules().is_absolute(path);
    }

    optional<file_path>
    get_home_dir(environment const& env) const override
    {
        auto home = env.get("HOME");
        if (home && is_absolute(*home))
            return file_path(*home);
        return none;
    }
};

} // namespace xdgbase

#endif
