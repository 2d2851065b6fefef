#include "core/task_queue.hpp"
#include <algorithm>

namespace sk::core {

namespace {

class DelayedCall final : public Task {
public:
    DelayedCall(double due, Epoch epoch, std::function<void()> fn)
        : due_(due), epoch_(epoch), fn_(std::move(fn)) {}

    TaskState resume(double now) override {
        if(!epoch_.valid()) return TaskState::Done;
        if(now < due_) return TaskState::Pending;
        if(fn_) fn_();
        return TaskState::Done;
    }

private:
    double due_;
    Epoch epoch_;
    std::function<void()> fn_;
};

} // namespace

void TaskQueue::post(std::unique_ptr<Task> task) {
    if(task) tasks_.push_back(std::move(task));
}

void TaskQueue::post_delayed(double due, Epoch epoch, std::function<void()> fn) {
    post(std::make_unique<DelayedCall>(due, epoch, std::move(fn)));
}

size_t TaskQueue::size() const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                             [](const std::unique_ptr<Task>& t) { return t != nullptr; }));
}

void TaskQueue::tick(double now) {
    ticking_ = true;
    // Index loop: resume() may post, which can reallocate the vector.
    for(size_t i = 0; i < tasks_.size(); ++i) {
        Task* task = tasks_[i].get();
        if(!task) continue;
        if(task->resume(now) == TaskState::Done) {
            tasks_[i].reset();
        }
    }
    tasks_.erase(std::remove(tasks_.begin(), tasks_.end(), nullptr), tasks_.end());
    ticking_ = false;
    retired_.clear();
}

void TaskQueue::clear() {
    if(ticking_) {
        // The task currently inside resume() must outlive this call.
        for(auto& task : tasks_) {
            if(task) retired_.push_back(std::move(task));
        }
        return;
    }
    tasks_.clear();
}

} // namespace sk::core
