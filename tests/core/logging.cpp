#include <xdgbase/core/logging.hpp>

#include <thread>
#include <vector>

#include <xdgbase/core/testing.hpp>
#include <xdgbase/fs/xdg.hpp>

using namespace xdgbase;

TEST_CASE("logger registration", "[core][logging]")
{
    spdlog::drop(logger_name);
    REQUIRE(get_logger() == nullptr);

    // With no logger registered, resolution still works (quietly).
    mapped_environment env({{"XDG_CONFIG_HOME", "relative/config"},
                            {"HOME", "/home/user"}});
    REQUIRE(get_config_home(env, testing_path_rules()) == "/home/user/.config");

    auto logger = initialize_logging(spdlog::level::warn);
    REQUIRE(logger != nullptr);
    REQUIRE(get_logger() == logger);
    REQUIRE(logger->level() == spdlog::level::warn);

    // A second call leaves the existing logger alone.
    REQUIRE(initialize_logging() == logger);
    REQUIRE(logger->level() == spdlog::level::warn);

    REQUIRE(get_config_home(env, testing_path_rules()) == "/home/user/.config");

    spdlog::drop(logger_name);
}

TEST_CASE("concurrent logger initialization", "[core][logging]")
{
    spdlog::drop(logger_name);

    std::vector<std::shared_ptr<spdlog::logger>> loggers(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i != loggers.size(); ++i)
    {
        threads.emplace_back(
            [&loggers, i] { loggers[i] = initialize_logging(); });
    }
    for (auto& thread : threads)
        thread.join();

    // Everyone ends up with the one logger that got registered.
    auto registered = get_logger();
    REQUIRE(registered != nullptr);
    for (auto const& logger : loggers)
        REQUIRE(logger == registered);

    spdlog::drop(logger_name);
}
