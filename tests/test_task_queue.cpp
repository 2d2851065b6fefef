#include <catch2/catch_test_macros.hpp>
#include "core/task_queue.hpp"
#include "core/generation.hpp"
#include "core/clock.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace sk::core;

namespace {

// Finishes after `steps` resumes, recording each resume into `log`.
class CountingTask final : public Task {
public:
    CountingTask(std::vector<std::string>& log, std::string name, int steps)
        : log_(log), name_(std::move(name)), steps_(steps) {}
    TaskState resume(double) override {
        log_.push_back(name_);
        return --steps_ > 0 ? TaskState::Pending : TaskState::Done;
    }
private:
    std::vector<std::string>& log_;
    std::string name_;
    int steps_;
};

} // namespace

TEST_CASE("Epoch invalidated by a newer advance", "[core]") {
    Generation gen;
    Epoch first = advance(gen);
    REQUIRE(first.valid());
    Epoch seen = capture(gen);
    REQUIRE(seen.valid());
    Epoch second = advance(gen);
    REQUIRE_FALSE(first.valid());
    REQUIRE_FALSE(seen.valid());
    REQUIRE(second.valid());
    REQUIRE_FALSE(Epoch{}.valid());
}

TEST_CASE("TaskQueue resumes in posting order until done", "[core]") {
    TaskQueue q;
    std::vector<std::string> log;
    q.post(std::make_unique<CountingTask>(log, "a", 2));
    q.post(std::make_unique<CountingTask>(log, "b", 1));
    REQUIRE(q.size() == 2);

    q.tick(0.0);
    REQUIRE(log == std::vector<std::string>{"a", "b"});
    REQUIRE(q.size() == 1);

    q.tick(0.1);
    REQUIRE(log == std::vector<std::string>{"a", "b", "a"});
    REQUIRE(q.empty());
}

TEST_CASE("TaskQueue runs tasks posted during a tick in the same tick", "[core]") {
    TaskQueue q;
    std::vector<std::string> log;
    Generation gen;
    q.post_delayed(0.0, capture(gen), [&] {
        log.push_back("outer");
        q.post_delayed(0.0, capture(gen), [&] { log.push_back("inner"); });
    });
    q.tick(0.0);
    REQUIRE(log == std::vector<std::string>{"outer", "inner"});
    REQUIRE(q.empty());
}

TEST_CASE("post_delayed waits for the due time and honours the epoch", "[core]") {
    TaskQueue q;
    Generation gen;
    int fired = 0;
    q.post_delayed(1.0, capture(gen), [&] { ++fired; });
    q.post_delayed(1.0, capture(gen), [&] { fired += 10; });

    q.tick(0.5);
    REQUIRE(fired == 0);

    q.tick(1.0);
    REQUIRE(fired == 11);

    q.post_delayed(2.0, capture(gen), [&] { fired += 100; });
    advance(gen);
    q.tick(5.0);
    REQUIRE(fired == 11);
    REQUIRE(q.empty());
}

TEST_CASE("TaskQueue clear from inside a task drops the rest", "[core]") {
    TaskQueue q;
    Generation gen;
    int later = 0;
    q.post_delayed(0.0, capture(gen), [&] { q.clear(); });
    q.post_delayed(0.0, capture(gen), [&] { ++later; });
    q.tick(0.0);
    REQUIRE(later == 0);
    REQUIRE(q.empty());
}

TEST_CASE("ManualClock advances and resets", "[core]") {
    ManualClock clock;
    REQUIRE(clock.now() == 0.0);
    clock.advance(0.25);
    clock.advance(0.25);
    REQUIRE(clock.now() == 0.5);
    clock.reset();
    REQUIRE(clock.now() == 0.0);
    clock.set(3.0);
    REQUIRE(clock.now() == 3.0);
}

TEST_CASE("SteadyClock starts near zero and never goes backwards", "[core]") {
    SteadyClock clock;
    double last = clock.now();
    REQUIRE(last >= 0.0);
    REQUIRE(last < 1.0);
    for(int i = 0; i < 10000; ++i) {
        const double now = clock.now();
        REQUIRE(now >= last);
        last = now;
    }
}
