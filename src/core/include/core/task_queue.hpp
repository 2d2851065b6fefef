#pragma once

#include "core/generation.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace sk::core {

enum class TaskState { Pending, Done };

/**
 * @brief Resumable continuation driven by the per-frame update
 *
 * A task never blocks. Each resume() re-checks its own conditions (deadline, generation
 * epoch) and either does one step of work or returns Pending until the next tick.
 */
class Task {
public:
    virtual ~Task() = default;

    /**
     * @brief Advance the continuation
     * @param now Current clock time in seconds
     * @return Done once the task has finished (or found itself superseded)
     */
    virtual TaskState resume(double now) = 0;
};

/**
 * @brief Single-threaded cooperative scheduler
 *
 * Tasks are resumed in posting order. Tasks posted from inside a resume() are resumed in
 * the same tick, after every task that was queued before them.
 */
class TaskQueue {
public:
    TaskQueue() = default;
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void post(std::unique_ptr<Task> task);

    // Runs `fn` once the clock reaches `due`, unless `epoch` has been superseded by then.
    void post_delayed(double due, Epoch epoch, std::function<void()> fn);

    void tick(double now);

    // Drops every queued task without resuming it. Safe to call from inside a task.
    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    std::vector<std::unique_ptr<Task>> tasks_;
    std::vector<std::unique_ptr<Task>> retired_;
    bool ticking_ = false;
};

} // namespace sk::core
