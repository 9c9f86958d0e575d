//
// Created by Malik T on 03/10/2025.
//

#ifndef MATHHIGHLOW_LOG_HPP
#define MATHHIGHLOW_LOG_HPP

#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// Tagged console lines: "[Tag] message"
namespace mhl::core::log
{
    enum class Level : uint8_t
    {
        Silent = 0,
        Warn,
        Info
    };

    inline auto CurrentLevel() -> Level&
    {
        static Level lvl{Level::Info};
        return lvl;
    }

    inline auto SetLevel(Level const l) -> void { CurrentLevel() = l; }

    template <typename... Args>
    inline auto Info(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) -> void
    {
        if (CurrentLevel() < Level::Info) return;
        fmt::print("[{}] {}\n", tag, fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline auto Warn(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) -> void
    {
        if (CurrentLevel() < Level::Warn) return;
        fmt::print(stderr, "[{}] {}\n", tag, fmt::format(f, std::forward<Args>(args)...));
    }
}

#endif //MATHHIGHLOW_LOG_HPP
