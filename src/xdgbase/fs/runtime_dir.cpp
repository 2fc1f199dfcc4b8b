#ifndef _WIN32

#include <xdgbase/fs/runtime_dir.hpp>

#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

#include <xdgbase/core/logging.hpp>
#include <xdgbase/utilities/errors.hpp>

namespace xdgbase {

char const*
get_description(runtime_dir_status status)
{
    switch (status)
    {
        case runtime_dir_status::VALID:
            return "valid";
        case runtime_dir_status::NOT_FOUND:
            return "not found";
        case runtime_dir_status::WRONG_OWNER:
            return "wrong owner";
        case runtime_dir_status::INSECURE_PERMISSIONS:
            return "insecure permissions";
    }
    return "unknown";
}

std::ostream&
operator<<(std::ostream& s, runtime_dir_status status)
{
    return s << get_description(status);
}

runtime_dir_status static
check_runtime_dir(file_path const& path)
{
    struct stat info;
    if (stat(path.c_str(), &info) != 0)
    {
        // None of these can name an existing directory.
        if (errno == ENOENT || errno == ENOTDIR || errno == ELOOP
            || errno == ENAMETOOLONG)
        {
            return runtime_dir_status::NOT_FOUND;
        }
        XDGBASE_THROW(
            system_call_failed() << failed_system_call_info("stat")
                                 << file_path_info(path)
                                 << internal_error_message_info(
                                        std::strerror(errno)));
    }

    if (!S_ISDIR(info.st_mode))
        return runtime_dir_status::NOT_FOUND;

    if (info.st_uid != geteuid())
        return runtime_dir_status::WRONG_OWNER;

    if ((info.st_mode & 0777) != 0700)
        return runtime_dir_status::INSECURE_PERMISSIONS;

    return runtime_dir_status::VALID;
}

runtime_dir_status
validate_runtime_dir(file_path const& path)
{
    auto status = check_runtime_dir(path);
    XDGBASE_LOG_DEBUG(
        "runtime dir {}: {}", path.string(), get_description(status))
    return status;
}

} // namespace xdgbase

#endif
