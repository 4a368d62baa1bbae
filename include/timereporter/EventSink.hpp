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
 * Event sinks:
 * ------------
 * A TimeReporter hands its finished report to an EventSink. The default sink is
 * a process-wide FileSink that appends one line per event to TimeReporter.log.
 *
 * Environment Variables (read once, when the default sink is first used):
 * ----------------------------------------------------------------------
 * - TIME_REPORTER:
 *     Set to "OFF", "FALSE", "NO", or "0" (case-insensitive) to silence the
 *     default sink. Any other value or unset enables it.
 *
 * - TIME_REPORTER_DIR:
 *     Directory where `TimeReporter.log` is created. Defaults to `/tmp`.
 *
 * - TIME_REPORTER_FLUSH_N:
 *     Number of log lines between flushes. Positive integer; defaults to 256.
 *
 * - TIME_REPORTER_LEVEL:
 *     Most verbose level written: ERROR, WARN, INFO, DEBUG or TRACE
 *     (case-insensitive). Defaults to TRACE, i.e. everything is written.
 *
 * Output:
 * ------
 * [time-report] TID=001 | INFO | tracing-perf | at=2025-08-13 11:57:21.832 | name: ingest, parse: 0.010212345, validate: 0.005101234
 */
#pragma once

#include "Level.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <cerrno>
#include <fcntl.h>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <unistd.h>
#include <utility>

namespace xyzzy::timereporter {

    class TimeReporter_TestFriend; // Forward declaration

    /**
     * @brief Consumer of finished reports.
     *
     * Implementations must not throw: emit() runs from TimeReporter destructors.
     */
    class EventSink {
    public:
        virtual ~EventSink() = default;

        /**
         * @brief Lets a sink reject a level before the reporter renders anything.
         */
        virtual bool enabled(Level) const noexcept { return true; }

        /**
         * @param scope   Grouping label wrapping the event ("time-report").
         * @param target  Stream identifier ("tracing-perf").
         * @param level   Severity configured on the reporter.
         * @param message Rendered report.
         */
        virtual void emit(std::string_view scope, std::string_view target, Level level,
                          std::string_view message) noexcept = 0;
    };

    namespace detail {
        inline std::size_t finalize_snprintf_result(int n, char* line, std::size_t lineSize) noexcept {
            if (n < 0) {
                line[0] = '\0';
                return 0U;
            }

            if (static_cast<std::size_t>(n) >= lineSize) {
                // Truncated: snprintf wrote size-1 chars and a terminating '\0'
                const std::size_t len = lineSize - 1U;
                line[len] = '\0';
                return len;
            }

            return static_cast<std::size_t>(n);
        }

        /**
         * @brief Small sequential number per thread, assigned lock-free on first use.
         */
        inline std::uint32_t threadNumber() noexcept {
            thread_local std::uint32_t tid = 0;

            if (tid == 0) {
                static std::atomic<std::uint32_t> next{ 1 };
                tid = next.fetch_add(1, std::memory_order_relaxed);
            }

            return tid;
        }

#if defined(_WIN32)
#  define TR_LOCALTIME(tm_ptr, time_ptr) localtime_s((tm_ptr), (time_ptr))
#else
#  define TR_LOCALTIME(tm_ptr, time_ptr) localtime_r((time_ptr), (tm_ptr))
#endif

        /**
         * @brief Formats a wall clock time as "YYYY-MM-DD HH:MM:SS.mmm".
         */
        inline void formatTime(std::chrono::system_clock::time_point tp, char* out, std::size_t outSz) noexcept {
            const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
            auto tm = std::tm{};
            TR_LOCALTIME(&tm, &tt);

            const auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
            const auto ms3 = static_cast<int>(ms_since_epoch % 1000);

            std::snprintf(out, outSz, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                          1900 + tm.tm_year, 1 + tm.tm_mon, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec, ms3);
        }

        inline std::string upperCase(const char* s) {
            std::string val(s);
            for (auto& c : val) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return val;
        }
    } // namespace detail

    /**
     * @brief Settings for a FileSink. Defaults match an unset environment.
     */
    struct FileSinkConfig {
        bool enabled{ true };
        std::string directory{ "/tmp/" }; ///< Always ends with '/'.
        unsigned flushEvery{ 256U };
        Level maxLevel{ Level::Trace };

        static constexpr std::string_view kLogFileName{ "TimeReporter.log" };

        std::string logPath() const {
            return directory + std::string(kLogFileName);
        }

        /**
         * @brief Normalizes a directory: empty becomes /tmp, and a trailing '/' is added.
         */
        static std::string normalizeDirectory(std::string_view dir) {
            std::string normalized(dir);
            if (normalized.empty()) {
                normalized = "/tmp";
            }
            if (normalized.back() != '/') {
                normalized.push_back('/');
            }
            return normalized;
        }

        /**
         * @brief Builds a configuration from the TIME_REPORTER* environment variables.
         *
         * Invalid values fall back to their defaults; nothing here fails.
         */
        static FileSinkConfig fromEnvironment() {
            FileSinkConfig cfg;

            if (const char* env = std::getenv("TIME_REPORTER")) {
                const std::string val = detail::upperCase(env);
                cfg.enabled = !(val == "OFF" || val == "FALSE" || val == "NO" || val == "0");
            }

            if (const char* dir = std::getenv("TIME_REPORTER_DIR"); dir && *dir) {
                cfg.directory = normalizeDirectory(dir);
            }

            if (const char* p = std::getenv("TIME_REPORTER_FLUSH_N")) {
                char* end = nullptr;
                unsigned long v = std::strtoul(p, &end, 10);

                if (end != p && *end == '\0' && v > 0UL && v <= 1000000UL) {
                    cfg.flushEvery = static_cast<unsigned>(v);
                }
            }

            if (const char* lvl = std::getenv("TIME_REPORTER_LEVEL"); lvl && *lvl) {
                if (auto parsed = parseLevel(lvl)) {
                    cfg.maxLevel = *parsed;
                }
            }

            return cfg;
        }
    };

    /**
     * @brief Appends one line per event to `<directory>/TimeReporter.log`.
     *
     * The file is opened lazily on the first accepted event. If it cannot be
     * opened the sink stays silent, and the failing path is not retried until
     * the configuration changes. Writes are serialized by a mutex held only
     * around the I/O, and flushed every `flushEvery` lines.
     */
    class FileSink final : public EventSink {
    public:
        FileSink() = default;

        explicit FileSink(FileSinkConfig config)
            : config_(std::move(config)) {
            config_.directory = FileSinkConfig::normalizeDirectory(config_.directory);
            if (config_.flushEvery == 0U) {
                config_.flushEvery = 1U;
            }
        }

        FileSink(const FileSink&) = delete;
        FileSink& operator=(const FileSink&) = delete;

        ~FileSink() override {
            closeLogFd();
        }

        const FileSinkConfig& config() const noexcept { return config_; }

        bool enabled(Level level) const noexcept override {
            return config_.enabled && levelEnabled(level, config_.maxLevel);
        }

        void emit(std::string_view scope, std::string_view target, Level level,
                  std::string_view message) noexcept override {
            if (!enabled(level)) {
                return;
            }

            char at[32];
            detail::formatTime(std::chrono::system_clock::now(), at, sizeof(at));

            const std::string_view name = levelName(level);
            char prefix[256];
            int n = std::snprintf(prefix, sizeof(prefix), "[%.*s] TID=%03u | %.*s | %.*s | at=%s | ",
                                  static_cast<int>(scope.size()), scope.data(),
                                  detail::threadNumber(),
                                  static_cast<int>(name.size()), name.data(),
                                  static_cast<int>(target.size()), target.data(),
                                  at);
            const std::size_t prefixLen = detail::finalize_snprintf_result(n, prefix, sizeof(prefix));

            std::lock_guard lock(mutex_);

            if (!ensureLogFdOpen()) {
                return;
            }

            writeLine(prefix, prefixLen, message);

            if (++lines_ % config_.flushEvery == 0U) {
                ::fsync(fd_);
            }
        }

    private:
        friend class xyzzy::timereporter::TimeReporter_TestFriend;

        bool ensureLogFdOpen() noexcept {
            if (fd_ >= 0) {
                return true;
            }

            if (lastAttemptFailed_) {
                return false;
            }

            const std::string path = config_.logPath();

            if (int newFd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644); newFd >= 0) {
                fd_ = newFd;
                return true;
            }

            lastAttemptFailed_ = true;
            return false;
        }

        // One writev per line so concurrent appenders never interleave within a line.
        void writeLine(const char* prefix, std::size_t prefixLen, std::string_view message) noexcept {
            char newline = '\n';
            iovec parts[3] = {
                { const_cast<char*>(prefix), prefixLen },
                { const_cast<char*>(message.data()), message.size() },
                { &newline, 1U }
            };

            ssize_t rc;
            do {
                rc = ::writev(fd_, parts, 3);
            } while (rc < 0 && errno == EINTR);

            if (rc < 0) {
                closeLogFd();
                lastAttemptFailed_ = true;
            }
        }

        void closeLogFd() noexcept {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        FileSinkConfig config_;
        std::mutex mutex_;
        int fd_{ -1 };
        bool lastAttemptFailed_{ false };
        unsigned lines_{ 0U };
    };

    /**
     * @brief Process-wide sink configured from the environment on first use.
     */
    inline FileSink& defaultSink() {
        static FileSink sink{ FileSinkConfig::fromEnvironment() };
        return sink;
    }

} // namespace xyzzy::timereporter
