#ifndef INCLUDE_KEYHOP_LOG_REGISTRY_HPP
#define INCLUDE_KEYHOP_LOG_REGISTRY_HPP

#include <memory>
#include <optional>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <string>
#include <string_view>

namespace keyhop::log
{

// Named spdlog loggers sharing one stderr sink.
//
// Loggers are created on first use even before init(), so library code and tests can log
// without any setup. init() only fixes the level on every known and future logger.
class Registry final
{
public:
    Registry() = delete;

    static void init(spdlog::level::level_enum level);

    // Unknown names are created on demand.
    [[nodiscard]] static std::shared_ptr<spdlog::logger> get(const std::string& name);

    [[nodiscard]] static std::shared_ptr<spdlog::logger> keyhop()
    {
        return get("keyhop");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> keystore()
    {
        return get("keystore");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> vault()
    {
        return get("vault");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> rotate()
    {
        return get("rotate");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> handoff()
    {
        return get("handoff");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> config()
    {
        return get("config");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> storage()
    {
        return get("storage");
    }

    [[nodiscard]] static bool isInitialized() noexcept;

    // Accepts spdlog level names ("trace" .. "critical", "off"), case-sensitive.
    [[nodiscard]] static std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) noexcept;
};

} // namespace keyhop::log

#endif // INCLUDE_KEYHOP_LOG_REGISTRY_HPP
