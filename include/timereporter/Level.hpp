/*
 * TimeReporter - lightweight C++17 activity time reporting utility
 * Copyright (C) 2025 Steve Clarke <stephenlclarke@mac.com> https://xyzzy.tools
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * In accordance with section 13 of the AGPL, if you modify this program,
 * your modified version must prominently offer all users interacting with it
 * remotely through a computer network an opportunity to receive the source
 * code of your version.
 */
#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace xyzzy::timereporter {

    /**
     * @brief Severity attached to an emitted report.
     *
     * Ordered from most to least severe, so a smaller value is more important.
     * A sink filtering at `Info` accepts Error, Warn and Info.
     */
    enum class Level : unsigned char {
        Error = 0,
        Warn,
        Info,
        Debug,
        Trace
    };

    inline constexpr std::string_view levelName(Level level) noexcept {
        switch (level) {
            case Level::Error: return "ERROR";
            case Level::Warn:  return "WARN";
            case Level::Info:  return "INFO";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "INFO";
    }

    /**
     * @brief Returns true when `level` is at least as severe as `threshold`.
     */
    inline constexpr bool levelEnabled(Level level, Level threshold) noexcept {
        return static_cast<unsigned char>(level) <= static_cast<unsigned char>(threshold);
    }

    /**
     * @brief Parses a level name case-insensitively ("warn", "WARNING", "Info", ...).
     *
     * @return The level, or std::nullopt for anything unrecognized.
     */
    inline std::optional<Level> parseLevel(std::string_view text) {
        std::string val(text);

        for (auto& c : val) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        if (val == "ERROR")                    return Level::Error;
        if (val == "WARN" || val == "WARNING") return Level::Warn;
        if (val == "INFO")                     return Level::Info;
        if (val == "DEBUG")                    return Level::Debug;
        if (val == "TRACE")                    return Level::Trace;
        return std::nullopt;
    }

} // namespace xyzzy::timereporter
