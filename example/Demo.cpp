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

#include "timereporter/TimeReporter.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace xyzzy::timereporter;

// Simulate some work for a given duration
static void busyFor(std::chrono::microseconds us) {
    std::this_thread::sleep_for(us);
}

// Example 1: Switching between activities; the report is emitted on scope exit
static void ingest() {
    TimeReporter tr("ingest");
    tr.start("parse");
    busyFor(10ms);
    tr.start("validate");
    busyFor(5ms);
    tr.start("parse");   // adds to the earlier parse total
    busyFor(2ms);
}

// Example 2: startWith inside a loop condition, explicit finish
static void drainQueue(int items) {
    auto tr = TimeReporterBuilder("drainQueue")
                  .printOrder(PrintOrder::Key)
                  .precision(6)
                  .build();

    int remaining = items;
    while (tr.startWith("dequeue", [&remaining] { busyFor(200us); return remaining-- > 0; })) {
        tr.start("handle");
        busyFor(500us);
    }

    std::move(tr).finish();
}

// Example 3: Early return still produces exactly one report
static bool loadConfig(bool missing) {
    auto tr = TimeReporterBuilder("loadConfig").level(Level::Debug).build();
    tr.start("open");
    busyFor(300us);
    if (missing) {
        return false;
    }
    tr.start("read");
    busyFor(700us);
    return true;
}

// Example 4: Reporter named after the enclosing function
static void compact() {
    TIME_REPORTER(tr);
    tr.start("scan");
    busyFor(1ms);
    tr.start("rewrite");
    busyFor(3ms);
    tr.stop();
    busyFor(1ms);   // not counted
}

// Example 5: One reporter per worker thread, all sharing the default sink
static void workers(int threads) {
    std::vector<std::thread> tg;
    tg.reserve(threads);
    for (int i = 0; i < threads; ++i) {
        tg.emplace_back([i] {
            auto tr = TimeReporterBuilder("worker")
                          .clock(ClockSource::MonotonicRaw)
                          .printOrder(PrintOrder::Start)
                          .build();
            tr.start("fetch");
            busyFor(std::chrono::microseconds{ 500 + (i * 200) });
            tr.start("store");
            busyFor(300us);
        });
    }
    for (auto& t : tg) t.join();
}

// Example 6: A sink of your own
class StderrSink final : public EventSink {
public:
    void emit(std::string_view scope, std::string_view target, Level level,
              std::string_view message) noexcept override {
        const std::string_view name = levelName(level);
        std::fprintf(stderr, "%.*s %.*s %.*s: %.*s\n",
                     static_cast<int>(name.size()), name.data(),
                     static_cast<int>(scope.size()), scope.data(),
                     static_cast<int>(target.size()), target.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

static void customSink() {
    static StderrSink sink;
    auto tr = TimeReporterBuilder("customSink").sink(sink).level(Level::Warn).build();
    tr.start("slow");
    busyFor(2ms);
    std::cout << "so far: " << tr << '\n';
}

static void usage(std::ostream& os) {
    os << "Usage: Demo [--iterations=N]\n"
          "Runs the instrumented examples N times. Reports go to\n"
          "$TIME_REPORTER_DIR/TimeReporter.log (default /tmp).\n";
}

static int parseIterations(int argc, char** argv) {
    int iterations = 1;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            std::exit(0);
        }
        const std::string value = arg.rfind("--iterations=", 0) == 0 ? arg.substr(13) : arg;
        try {
            iterations = std::max(1, std::stoi(value));
        } catch (const std::exception&) {
            std::cerr << "Demo: invalid iteration count '" << value << "'\n";
            usage(std::cerr);
            std::exit(2);
        }
    }
    return iterations;
}

int main(int argc, char** argv) {
    const int iterations = parseIterations(argc, argv);

    TimeReporter tr("Demo::main");
    for (int i = 0; i < iterations; ++i) {
        tr.start("ingest");
        ingest();
        tr.start("drainQueue");
        drainQueue(5);
        tr.start("loadConfig");
        loadConfig(i % 2 == 0);
        tr.start("compact");
        compact();
        tr.start("workers");
        workers(std::clamp(iterations, 2, 8));
        tr.start("customSink");
        customSink();
    }
    std::move(tr).finish();

    std::cout << "Reports written to " << defaultSink().config().logPath() << '\n';
    return 0;
}
