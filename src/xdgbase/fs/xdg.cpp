#include <xdgbase/fs/xdg.hpp>

#include <boost/algorithm/string.hpp>

#include <xdgbase/core/logging.hpp>

namespace xdgbase {

// Get the value of :variable as a path, or none if it's unset or relative.
optional<file_path> static
get_path_variable(
    environment const& env, path_rules const& rules, char const* variable)
{
    auto value = env.get(variable);
    if (!value)
        return none;
    file_path path = *value;
    if (!rules.is_absolute(path))
    {
        XDGBASE_LOG_DEBUG(
            "{} is not absolute ({}); ignoring it", variable, *value)
        return none;
    }
    return path;
}

file_path static
get_base_directory(
    environment const& env,
    path_rules const& rules,
    char const* variable,
    file_path const& default_under_home)
{
    auto dir = get_path_variable(env, rules, variable);
    if (dir)
        return *dir;

    auto home = rules.get_home_dir(env);
    if (!home)
        XDGBASE_THROW(missing_home_dir() << variable_name_info(variable));
    auto default_dir = *home / default_under_home;
    XDGBASE_LOG_DEBUG(
        "{} not usable; defaulting to {}", variable, default_dir.string())
    return default_dir;
}

search_path static
get_directory_list(
    environment const& env,
    path_rules const& rules,
    char const* variable,
    search_path const& defaults)
{
    auto value = env.get(variable);
    if (value)
    {
        auto dirs = split_search_path(*value, rules);
        if (!dirs.empty())
            return dirs;
        XDGBASE_LOG_DEBUG("{} has no usable entries ({})", variable, *value)
    }
    return defaults;
}

file_path
get_data_home(environment const& env, path_rules const& rules)
{
    return get_base_directory(
        env, rules, "XDG_DATA_HOME", file_path(".local") / "share");
}

file_path
get_config_home(environment const& env, path_rules const& rules)
{
    return get_base_directory(env, rules, "XDG_CONFIG_HOME", ".config");
}

file_path
get_cache_home(environment const& env, path_rules const& rules)
{
    return get_base_directory(env, rules, "XDG_CACHE_HOME", ".cache");
}

file_path
get_state_home(environment const& env, path_rules const& rules)
{
    return get_base_directory(
        env, rules, "XDG_STATE_HOME", file_path(".local") / "state");
}

file_path
get_runtime_dir(environment const& env, path_rules const& rules)
{
    auto dir = get_path_variable(env, rules, "XDG_RUNTIME_DIR");
    if (!dir)
    {
        XDGBASE_THROW(
            missing_runtime_dir() << variable_name_info("XDG_RUNTIME_DIR"));
    }
    return *dir;
}

search_path
get_data_dirs(environment const& env, path_rules const& rules)
{
    return get_directory_list(
        env,
        rules,
        "XDG_DATA_DIRS",
        {file_path("/usr/local/share"), file_path("/usr/share")});
}

search_path
get_config_dirs(environment const& env, path_rules const& rules)
{
    return get_directory_list(
        env, rules, "XDG_CONFIG_DIRS", {file_path("/etc/xdg")});
}

search_path
split_search_path(string const& value, path_rules const& rules)
{
    char const separator = rules.list_separator();
    std::vector<string> segments;
    boost::split(segments, value, [=](char c) { return c == separator; });

    search_path dirs;
    for (auto const& segment : segments)
    {
        if (segment.empty())
            continue;
        file_path dir(segment);
        if (rules.is_absolute(dir))
            dirs.push_back(dir);
        else
            XDGBASE_LOG_DEBUG("dropping relative search path entry {}", segment)
    }
    return dirs;
}

search_path
get_config_search_path(environment const& env, path_rules const& rules)
{
    search_path path{get_config_home(env, rules)};
    auto system_dirs = get_config_dirs(env, rules);
    path.insert(path.end(), system_dirs.begin(), system_dirs.end());
    return path;
}

search_path
get_data_search_path(environment const& env, path_rules const& rules)
{
    search_path path{get_data_home(env, rules)};
    auto system_dirs = get_data_dirs(env, rules);
    path.insert(path.end(), system_dirs.begin(), system_dirs.end());
    return path;
}

optional<file_path>
search_in_path(search_path const& path, file_path const& item)
{
    for (auto const& dir : path)
    {
        auto full_path = dir / item;
        // Locations we can't inspect are treated as not having the item.
        std::error_code error;
        if (std::filesystem::exists(full_path, error))
            return some(full_path);
    }
    return none;
}

optional<file_path>
find_config_item(
    file_path const& item, environment const& env, path_rules const& rules)
{
    return search_in_path(get_config_search_path(env, rules), item);
}

optional<file_path>
find_data_item(
    file_path const& item, environment const& env, path_rules const& rules)
{
    return search_in_path(get_data_search_path(env, rules), item);
}

} // namespace xdgbase
