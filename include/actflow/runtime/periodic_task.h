// actflow/runtime/periodic_task.h
#ifndef ACTFLOW_RUNTIME_PERIODIC_TASK_H
#define ACTFLOW_RUNTIME_PERIODIC_TASK_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace actflow {

// Runs `tick` every `interval` on its own thread until the tick returns false or
// cancel() is called. cancel() wakes a sleeping task and joins it, so it must not be
// called from inside the tick; a tick stops its own task by returning false.
class PeriodicTask {
public:
    using Tick = std::function<bool()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void cancel();
    bool finished() const;
    const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool finished_ = false;
    std::thread thread_;
};

} // namespace actflow

#endif // ACTFLOW_RUNTIME_PERIODIC_TASK_H
