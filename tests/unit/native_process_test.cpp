#include <cassert>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "core/native_process.hpp"

using namespace std::chrono_literals;

int main() {
    // Line round trip through cat
    {
        core::NativeProcess p;
        assert(p.start({"cat"}));
        assert(p.pid() > 0);
        assert(p.is_running());
        assert(p.write_line("erste Zeile"));
        assert(p.write_line("zweite Zeile"));
        std::string line;
        assert(p.read_line(line, 2000ms));
        assert(line == "erste Zeile");
        assert(p.read_line(line, 2000ms));
        assert(line == "zweite Zeile");
        assert(p.terminate(2000ms));
        assert(!p.is_running());
        assert(p.exit_status() >= 0);
        // Pipes are closed after terminate
        assert(!p.write_line("weg"));
        assert(!p.read_line(line, 10ms));
    }

    // Silent child: read times out without killing it
    {
        core::NativeProcess p;
        assert(p.start({"sleep", "30"}));
        std::string line;
        const auto t0 = std::chrono::steady_clock::now();
        assert(!p.read_line(line, 100ms));
        assert(std::chrono::steady_clock::now() - t0 >= 100ms);
        assert(p.is_running());
        assert(!p.start({"cat"}));  // already running
        assert(p.terminate(2000ms));
    }

    // Child that ignores SIGTERM is killed after the grace period
    {
        core::NativeProcess p;
        assert(p.start({"sh", "-c", "trap '' TERM; echo up; exec sleep 30"}));
        std::string line;
        assert(p.read_line(line, 2000ms));
        assert(line == "up");
        assert(!p.terminate(200ms));
        assert(!p.is_running());
    }

    // EOF from a child that exits on its own
    {
        core::NativeProcess p;
        assert(p.start({"sh", "-c", "echo done; exit 3"}));
        std::string line;
        assert(p.read_line(line, 2000ms));
        assert(line == "done");
        assert(!p.read_line(line, 2000ms));
        assert(p.terminate(2000ms));
        assert(p.exit_status() == 3);
    }

    // Missing binary: the child exits, nothing to read
    {
        core::NativeProcess p;
        assert(p.start({"/nonexistent/localscribe-worker"}));
        std::string line;
        assert(!p.read_line(line, 2000ms));
        p.terminate(1000ms);
    }

    // Children started from several threads at once never hold each other's
    // stdin open, so closing it reaches every child as EOF right away
    {
        constexpr int kPairs = 6;
        std::vector<std::unique_ptr<core::NativeProcess>> cats(kPairs);
        std::vector<std::unique_ptr<core::NativeProcess>> sleepers(kPairs);
        std::vector<std::thread> starters;
        for (int i = 0; i < kPairs; ++i) {
            cats[i] = std::make_unique<core::NativeProcess>();
            sleepers[i] = std::make_unique<core::NativeProcess>();
            starters.emplace_back([&, i] {
                assert(cats[i]->start({"cat"}));
                assert(sleepers[i]->start({"sleep", "10"}));
            });
        }
        for (auto& t : starters) t.join();
        for (auto& cat : cats) {
            cat->close_input();
            assert(!cat->write_line("zu"));
            std::string line;
            const auto t0 = std::chrono::steady_clock::now();
            assert(!cat->read_line(line, 4000ms));
            assert(std::chrono::steady_clock::now() - t0 < 3000ms);
            assert(cat->terminate(2000ms));
        }
        for (auto& s : sleepers) s->terminate(1000ms);
    }

    // Writing to a child that already exited fails instead of raising SIGPIPE
    {
        core::NativeProcess p;
        assert(p.start({"sh", "-c", "exit 0"}));
        std::string line;
        assert(!p.read_line(line, 2000ms));
        bool failed = false;
        for (int i = 0; i < 50 && !failed; ++i) failed = !p.write_line(std::string(4096, 'x'));
        assert(failed);
        void (*prev)(int) = std::signal(SIGPIPE, SIG_IGN);
        assert(prev == SIG_IGN);
        p.terminate(1000ms);
    }

    core::NativeProcess idle;
    assert(!idle.start({}));
    assert(!idle.is_running());
    assert(idle.terminate(10ms));
    return 0;
}
