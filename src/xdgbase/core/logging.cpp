#include <xdgbase/core/logging.hpp>

#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>

namespace xdgbase {

std::shared_ptr<spdlog::logger>
initialize_logging(spdlog::level::level_enum level)
{
    auto existing = spdlog::get(logger_name);
    if (existing)
        return existing;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    auto logger = std::make_shared<spdlog::logger>(
        logger_name, begin(sinks), end(sinks));
    logger->set_level(level);
    try
    {
        spdlog::register_logger(logger);
    }
    catch (spdlog::spdlog_ex&)
    {
        // Another thread registered one in the meantime, so use that.
        return spdlog::get(logger_name);
    }
    return logger;
}

} // namespace xdgbase
