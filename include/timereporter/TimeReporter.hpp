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
 * TimeReporter Overview:
 * ----------------------
 * A TimeReporter answers "where did the time go?" for one unit of work. The
 * caller switches between named activities with start(key); the reporter adds
 * the time spent in each activity to a running total. When the work is done,
 * either through an explicit finish() or when the reporter leaves scope, it
 * emits exactly one report through an EventSink.
 *
 * Design Goals:
 * -------------
 * 1. **One report per reporter**: finish() is rvalue-qualified and the
 *    destructor checks a finalized flag, so early returns, exceptions and
 *    explicit finishes all end in a single emission.
 * 2. **Nothing measured is lost**: an activity still running at finalization
 *    is folded into its total before the report is rendered.
 * 3. **Monotonic time only**: steady_clock by default, CLOCK_MONOTONIC_RAW on
 *    request (see Clock.hpp).
 * 4. **Injectable sink**: reports go to the process-wide FileSink unless the
 *    builder is given another EventSink (see EventSink.hpp).
 *
 * Usage Example 1:
 * ---------------
 * #include "timereporter/TimeReporter.hpp"
 *
 * void ingest() {
 *     xyzzy::timereporter::TimeReporter tr("ingest");
 *     tr.start("parse");
 *     // ... parse ...
 *     tr.start("validate");
 *     // ... validate ...
 * } // report emitted here
 *
 * Output:
 * ------
 * [time-report] TID=001 | INFO | tracing-perf | at=2025-08-13 11:57:21.832 | name: ingest, parse: 0.010212345, validate: 0.005101234
 *
 * Usage Example 2:
 * ---------------
 * auto tr = TimeReporterBuilder("load")
 *               .level(Level::Debug)
 *               .printOrder(PrintOrder::Key)
 *               .precision(3)
 *               .build();
 * while (tr.startWith("read", [&] { return reader.next(record); })) {
 *     tr.start("decode");
 *     // ...
 * }
 * std::move(tr).finish();
 */
#pragma once

#include "Clock.hpp"
#include "EventSink.hpp"
#include "Level.hpp"
#include "Report.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#define TR_FUNCTION __PRETTY_FUNCTION__
#else
#define TR_FUNCTION __func__
#endif

namespace xyzzy::timereporter {

    class TimeReporter_TestFriend; // Forward declaration

    inline constexpr std::string_view kReportScope{ "time-report" };
    inline constexpr std::string_view kReportTarget{ "tracing-perf" };

    template <typename KeyT>
    class BasicTimeReporter;

    /**
     * @brief Reusable configuration for TimeReporter instances.
     *
     * Defaults: Level::Info, PrintOrder::DecDuration, width 11, precision 9,
     * ClockSource::Steady and the process-wide default sink.
     */
    template <typename KeyT = std::string_view>
    class BasicTimeReporterBuilder {
    public:
        explicit BasicTimeReporterBuilder(std::string name)
            : name_(std::move(name)) {}

        BasicTimeReporterBuilder& level(Level level) noexcept {
            level_ = level;
            return *this;
        }

        BasicTimeReporterBuilder& printOrder(PrintOrder order) noexcept {
            printOrder_ = order;
            return *this;
        }

        /**
         * @brief Minimum width of each printed total; fill is space, alignment is left.
         *
         * Only visible when at least precision + 2 (one leading digit and the point).
         */
        BasicTimeReporterBuilder& width(std::size_t width) noexcept {
            width_ = width;
            return *this;
        }

        /// Digits printed after the decimal point.
        BasicTimeReporterBuilder& precision(std::size_t precision) noexcept {
            precision_ = precision;
            return *this;
        }

        BasicTimeReporterBuilder& clock(ClockSource source) noexcept {
            now_ = clockFor(source);
            return *this;
        }

        /// Custom time source. Must be monotonic within the process.
        BasicTimeReporterBuilder& clock(ClockFn now) noexcept {
            now_ = now ? now : &steadyNow;
            return *this;
        }

        /// The sink must outlive every reporter built from here.
        BasicTimeReporterBuilder& sink(EventSink& sink) noexcept {
            sink_ = &sink;
            return *this;
        }

        BasicTimeReporter<KeyT> build() const {
            return BasicTimeReporter<KeyT>(*this);
        }

    private:
        friend class BasicTimeReporter<KeyT>;

        std::string name_;
        Level level_{ Level::Info };
        PrintOrder printOrder_{ PrintOrder::DecDuration };
        std::size_t width_{ 11U };
        std::size_t precision_{ 9U };
        ClockFn now_{ &steadyNow };
        EventSink* sink_{ nullptr }; ///< nullptr selects defaultSink() when the reporter is built.
    };

    /**
     * @brief Accumulates time per activity key and reports the totals once.
     *
     * KeyT needs operator< and must be convertible to std::string_view or
     * printable with operator<<. With the default std::string_view keys, the
     * referenced text must outlive the reporter (string literals are ideal).
     *
     * A reporter belongs to one thread at a time; it does no locking.
     */
    template <typename KeyT>
    class BasicTimeReporter {
    public:
        using key_type = KeyT;
        using duration = std::chrono::nanoseconds;

        explicit BasicTimeReporter(std::string name)
            : BasicTimeReporter(BasicTimeReporterBuilder<KeyT>(std::move(name))) {}

        BasicTimeReporter(std::string name, Level level)
            : BasicTimeReporter(BasicTimeReporterBuilder<KeyT>(std::move(name)).level(level)) {}

        BasicTimeReporter(const BasicTimeReporter&) = delete; ///< A copy would report twice.
        BasicTimeReporter& operator=(const BasicTimeReporter&) = delete;

        /// The moved-from reporter is left finalized and never reports.
        BasicTimeReporter(BasicTimeReporter&& other) noexcept
            : name_(std::move(other.name_)),
              level_(other.level_),
              printOrder_(other.printOrder_),
              width_(other.width_),
              precision_(other.precision_),
              now_(other.now_),
              sink_(other.sink_),
              times_(std::move(other.times_)),
              index_(std::move(other.index_)),
              current_(std::move(other.current_)),
              finalized_(other.finalized_) {
            other.current_.reset();
            other.finalized_ = true;
        }

        /// Reports what this reporter has gathered so far, then takes over `other`.
        BasicTimeReporter& operator=(BasicTimeReporter&& other) noexcept {
            if (this != &other) {
                finalize();
                name_ = std::move(other.name_);
                level_ = other.level_;
                printOrder_ = other.printOrder_;
                width_ = other.width_;
                precision_ = other.precision_;
                now_ = other.now_;
                sink_ = other.sink_;
                times_ = std::move(other.times_);
                index_ = std::move(other.index_);
                current_ = std::move(other.current_);
                finalized_ = other.finalized_;
                other.current_.reset();
                other.finalized_ = true;
            }
            return *this;
        }

        ~BasicTimeReporter() {
            finalize();
        }

        /**
         * @brief Starts counting time for `key`.
         *
         * If another activity (or the same one) is running, its elapsed time is
         * added to its total first. Restarting a key adds to its total.
         */
        void start(const KeyT& key) {
            if (finalized_) {
                return;
            }
            const Instant now = now_();
            saveCurrent(now);
            current_.emplace(key, now);
        }

        /**
         * @brief start(key), then returns work().
         *
         * Handy in `if` and `while` conditions where a separate start() call
         * does not fit.
         */
        template <typename F>
        decltype(auto) startWith(const KeyT& key, F&& work) {
            start(key);
            return std::forward<F>(work)();
        }

        /// Stops counting time. Does nothing when no activity is running.
        void stop() {
            if (finalized_) {
                return;
            }
            saveCurrent(now_());
        }

        /// Folds the running activity and emits the report now.
        void finish() && noexcept {
            finalize();
        }

        const std::string& name() const noexcept { return name_; }
        Level level() const noexcept { return level_; }
        PrintOrder printOrder() const noexcept { return printOrder_; }
        std::size_t width() const noexcept { return width_; }
        std::size_t precision() const noexcept { return precision_; }
        bool isRunning() const noexcept { return current_.has_value(); }
        bool isFinalized() const noexcept { return finalized_; }

        /// Accumulated total for `key`; the running activity is not included.
        duration total(const KeyT& key) const {
            const auto it = index_.find(key);
            return it == index_.end() ? duration::zero() : times_[it->second].second;
        }

        /// Accumulated totals in first-started order.
        const std::vector<Entry<KeyT>>& entries() const noexcept { return times_; }

        /// The report as it would be emitted now, minus the running activity.
        std::string toString() const {
            return renderReport(name_, orderedEntries(times_, printOrder_), width_, precision_);
        }

    private:
        friend class BasicTimeReporterBuilder<KeyT>;
        friend class xyzzy::timereporter::TimeReporter_TestFriend;

        explicit BasicTimeReporter(const BasicTimeReporterBuilder<KeyT>& b)
            : name_(b.name_),
              level_(b.level_),
              printOrder_(b.printOrder_),
              width_(b.width_),
              precision_(b.precision_),
              now_(b.now_),
              sink_(b.sink_ ? b.sink_ : &defaultSink()) {}

        void saveCurrent(Instant now) {
            if (!current_) {
                return;
            }
            const KeyT key = std::move(current_->first);
            const Instant began = current_->second;
            current_.reset();
            accumulate(key, now - began);
        }

        void accumulate(const KeyT& key, duration elapsed) {
            if (elapsed < duration::zero()) {
                elapsed = duration::zero();
            }

            auto it = index_.find(key);
            if (it == index_.end()) {
                times_.emplace_back(key, duration::zero());
                try {
                    it = index_.emplace(key, times_.size() - 1U).first;
                } catch (...) {
                    times_.pop_back();
                    throw;
                }
            }
            times_[it->second].second += elapsed;
        }

        void finalize() noexcept {
            if (finalized_) {
                return;
            }
            finalized_ = true;

            try {
                saveCurrent(now_());

                if (!sink_->enabled(level_)) {
                    return;
                }

                const std::string report = toString();
                sink_->emit(kReportScope, kReportTarget, level_, report);
            } catch (const std::exception&) {
                // Allocation failure while folding or rendering: this report is dropped.
            }
        }

        std::string name_;
        Level level_;
        PrintOrder printOrder_;
        std::size_t width_;
        std::size_t precision_;
        ClockFn now_;
        EventSink* sink_;

        std::vector<Entry<KeyT>> times_;        ///< Totals in first-started order.
        std::map<KeyT, std::size_t> index_;     ///< Key -> position in times_.
        std::optional<std::pair<KeyT, Instant>> current_;
        bool finalized_{ false };
    };

    template <typename KeyT>
    std::ostream& operator<<(std::ostream& os, const BasicTimeReporter<KeyT>& reporter) {
        return os << reporter.toString();
    }

    using TimeReporterBuilder = BasicTimeReporterBuilder<std::string_view>;
    using TimeReporter = BasicTimeReporter<std::string_view>;

} // namespace xyzzy::timereporter

/**
 * @brief Declares a TimeReporter named after the enclosing function.
 *
 * @code
 * void load() {
 *     TIME_REPORTER(tr);
 *     tr.start("read");
 *     // ...
 * }
 * @endcode
 */
#ifndef TIME_REPORTER
#define TIME_REPORTER(var) \
    ::xyzzy::timereporter::TimeReporter var{ TR_FUNCTION }
#endif
