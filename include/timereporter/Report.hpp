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

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace xyzzy::timereporter {

    /**
     * @brief Order in which accumulated totals appear in a report.
     */
    enum class PrintOrder {
        Start,       ///< First-started activity first.
        RevStart,    ///< Reverse of Start.
        Key,         ///< Ascending key.
        RevKey,      ///< Descending key.
        IncDuration, ///< Shortest total first.
        DecDuration  ///< Longest total first (default).
    };

    template <typename KeyT>
    using Entry = std::pair<KeyT, std::chrono::nanoseconds>;

    /**
     * @brief Sorts entries (given in first-started order) for printing.
     *
     * Duration orders use a stable sort, so ties keep their first-started order.
     * Callers must not rely on that: tie order is not part of the report format.
     */
    template <typename KeyT>
    std::vector<Entry<KeyT>> orderedEntries(std::vector<Entry<KeyT>> entries, PrintOrder order) {
        switch (order) {
            case PrintOrder::Start:
                break;
            case PrintOrder::RevStart:
                std::reverse(entries.begin(), entries.end());
                break;
            case PrintOrder::Key:
                std::sort(entries.begin(), entries.end(),
                          [](const auto& a, const auto& b) { return a.first < b.first; });
                break;
            case PrintOrder::RevKey:
                std::sort(entries.begin(), entries.end(),
                          [](const auto& a, const auto& b) { return b.first < a.first; });
                break;
            case PrintOrder::IncDuration:
                std::stable_sort(entries.begin(), entries.end(),
                                 [](const auto& a, const auto& b) { return a.second < b.second; });
                break;
            case PrintOrder::DecDuration:
                std::stable_sort(entries.begin(), entries.end(),
                                 [](const auto& a, const auto& b) { return b.second < a.second; });
                break;
        }
        return entries;
    }

    /// Widest field appendSeconds() pads to.
    inline constexpr std::size_t kMaxWidth = 256U;
    /// Most decimals appendSeconds() prints.
    inline constexpr std::size_t kMaxPrecision = 64U;

    namespace detail {
        inline int clampToInt(std::size_t v) noexcept {
            return v > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(v);
        }

        template <typename KeyT>
        void appendKey(std::string& out, const KeyT& key) {
            if constexpr (std::is_convertible_v<const KeyT&, std::string_view>) {
                out.append(std::string_view(key));
            } else {
                std::ostringstream os;
                os << key;
                out += os.str();
            }
        }
    } // namespace detail

    /**
     * @brief Appends `d` as fixed-point seconds, left-aligned in at least `width` columns.
     *
     * 1.5s with precision 3 prints "1.500". A width below precision + 2 never pads.
     * Width and precision are capped at kMaxWidth and kMaxPrecision.
     */
    inline void appendSeconds(std::string& out, std::chrono::nanoseconds d, std::size_t width, std::size_t precision) {
        const double secs = std::chrono::duration<double>(d).count();
        const int w = detail::clampToInt(std::min(width, kMaxWidth));
        const int p = detail::clampToInt(std::min(precision, kMaxPrecision));

        char buf[64];
        const int n = std::snprintf(buf, sizeof(buf), "%-*.*f", w, p, secs);
        if (n < 0) {
            return;
        }
        if (static_cast<std::size_t>(n) < sizeof(buf)) {
            out.append(buf, static_cast<std::size_t>(n));
            return;
        }

        // Wide fields: format straight into the output string.
        const std::size_t at = out.size();
        out.resize(at + static_cast<std::size_t>(n) + 1U);
        std::snprintf(&out[at], static_cast<std::size_t>(n) + 1U, "%-*.*f", w, p, secs);
        out.resize(at + static_cast<std::size_t>(n));
    }

    /**
     * @brief Renders "name: <name>, <key1>: <secs1>, <key2>: <secs2>, ...".
     *
     * Entries are printed in the order given; see orderedEntries().
     */
    template <typename KeyT>
    std::string renderReport(std::string_view name, const std::vector<Entry<KeyT>>& entries,
                             std::size_t width, std::size_t precision) {
        std::string out;
        out.reserve(8U + name.size() + entries.size() * 32U);
        out.append("name: ");
        out.append(name);

        for (const auto& [key, total] : entries) {
            out.append(", ");
            detail::appendKey(out, key);
            out.append(": ");
            appendSeconds(out, total, width, precision);
        }
        return out;
    }

} // namespace xyzzy::timereporter
