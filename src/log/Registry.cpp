#include "keyhop/log/Registry.hpp"
#include <array>
#include <mutex>
#include <string_view>
#include <utility>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace keyhop::log
{
namespace
{

constexpr const char* g_kLogFormat{ "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v" };
constexpr std::array<const char*, 7> g_kKnownLoggers{ "keyhop", "keystore", "vault", "rotate",
                                                      "handoff", "config", "storage" };

struct RegistryState final
{
    std::mutex mutex;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sink;
    spdlog::level::level_enum level{ spdlog::level::warn };
    bool initialized{ false };
};

RegistryState& state()
{
    static RegistryState s{};
    return s;
}

// Caller holds state().mutex.
std::shared_ptr<spdlog::logger> makeLoggerLocked(RegistryState& s, const std::string& name)
{
    if (!s.sink)
    {
        s.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        s.sink->set_color_mode(spdlog::color_mode::automatic);
        s.sink->set_pattern(g_kLogFormat);
    }
    auto logger{ std::make_shared<spdlog::logger>(name, s.sink) };
    logger->set_level(s.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Registry::init(spdlog::level::level_enum level)
{
    auto& s{ state() };
    const std::lock_guard<std::mutex> lock{ s.mutex };
    s.level = level;
    for (const char* name : g_kKnownLoggers)
    {
        auto logger{ spdlog::get(name) };
        if (!logger)
        {
            logger = makeLoggerLocked(s, name);
        }
        logger->set_level(level);
    }
    s.initialized = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name)
{
    if (auto logger{ spdlog::get(name) })
    {
        return logger;
    }

    auto& s{ state() };
    const std::lock_guard<std::mutex> lock{ s.mutex };
    // Another thread may have won the race between the lookup above and the lock.
    if (auto logger{ spdlog::get(name) })
    {
        return logger;
    }
    return makeLoggerLocked(s, name);
}

bool Registry::isInitialized() noexcept
{
    auto& s{ state() };
    const std::lock_guard<std::mutex> lock{ s.mutex };
    return s.initialized;
}

std::optional<spdlog::level::level_enum> Registry::parseLevel(std::string_view name) noexcept
{
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels{ {
        { "trace", spdlog::level::trace },
        { "debug", spdlog::level::debug },
        { "info", spdlog::level::info },
        { "warn", spdlog::level::warn },
        { "warning", spdlog::level::warn },
        { "error", spdlog::level::err },
        { "critical", spdlog::level::critical },
        { "off", spdlog::level::off },
    } };
    for (const auto& [levelName, level] : kLevels)
    {
        if (levelName == name)
        {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace keyhop::log
