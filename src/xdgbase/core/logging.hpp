#ifndef XDGBASE_CORE_LOGGING_HPP
#define XDGBASE_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

// The library itself stays quiet unless the host opts in. Diagnostics are
// sent to a logger registered under the name "xdgbase", and only if one has
// been registered (either by the host or by initialize_logging()).

namespace xdgbase {

// the name under which the library looks up its spdlog logger
constexpr char const* logger_name = "xdgbase";

// Get the library's logger, or nullptr if nobody has registered one.
inline std::shared_ptr<spdlog::logger>
get_logger()
{
    return spdlog::get(logger_name);
}

// Create and register a logger that writes to stdout. If a logger with the
// library's name is already registered, it's left untouched and returned.
std::shared_ptr<spdlog::logger>
initialize_logging(spdlog::level::level_enum level = spdlog::level::debug);

} // namespace xdgbase

// Log a debug message through the library's logger, if there is one.
#define XDGBASE_LOG_DEBUG(...)                                                \
    {                                                                         \
        if (auto xdgbase_logger = ::xdgbase::get_logger())                    \
            xdgbase_logger->debug(__VA_ARGS__);                               \
    }

#endif
