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
 *
 * Time sources:
 * -------------
 * Every reporter reads time through a plain function pointer chosen once when
 * the reporter is built, so the hot path is a single indirect call with no
 * branching. Both sources are monotonic; wall clock time is never used for
 * elapsed measurements.
 *
 * - ClockSource::Steady        std::chrono::steady_clock (default, portable).
 * - ClockSource::MonotonicRaw  clock_gettime(CLOCK_MONOTONIC_RAW) where the
 *                              platform has it; not slewed by NTP. Falls back
 *                              to steady_clock elsewhere.
 */
#pragma once

#include <chrono>
#include <ctime>

namespace xyzzy::timereporter {

    enum class ClockSource {
        Steady,
        MonotonicRaw
    };

    /// Monotonic instant expressed as nanoseconds since an unspecified epoch.
    using Instant = std::chrono::nanoseconds;
    using ClockFn = Instant (*)() noexcept;

    inline Instant steadyNow() noexcept {
        return std::chrono::duration_cast<Instant>(std::chrono::steady_clock::now().time_since_epoch());
    }

    inline Instant monotonicRawNow() noexcept {
#if defined(CLOCK_MONOTONIC_RAW)
        timespec ts{};
        if (::clock_gettime(CLOCK_MONOTONIC_RAW, &ts) == 0) {
            return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
        }
#endif
        return steadyNow();
    }

    inline constexpr ClockFn clockFor(ClockSource source) noexcept {
        switch (source) {
            case ClockSource::MonotonicRaw: return &monotonicRawNow;
            case ClockSource::Steady:       break;
        }
        return &steadyNow;
    }

} // namespace xyzzy::timereporter
