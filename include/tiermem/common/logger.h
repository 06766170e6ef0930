#ifndef TIERMEM_COMMON_LOGGER_H_
#define TIERMEM_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace tiermem {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace tiermem

// Macros for convenient logging
#define TIERMEM_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TIERMEM_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TIERMEM_INFO(...)  spdlog::info(__VA_ARGS__)
#define TIERMEM_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TIERMEM_ERROR(...) spdlog::error(__VA_ARGS__)
#define TIERMEM_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TIERMEM_COMMON_LOGGER_H_
