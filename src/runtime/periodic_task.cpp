// src/runtime/periodic_task.cpp
#include "actflow/runtime/periodic_task.h"
#include <iostream>

namespace actflow {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {
    thread_ = std::thread(&PeriodicTask::run, this);
}

PeriodicTask::~PeriodicTask() {
    cancel();
}

void PeriodicTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PeriodicTask::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void PeriodicTask::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return cancelled_; })) {
                break;
            }
        }

        bool keep_going = false;
        try {
            keep_going = tick_();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Task '" << name_ << "' stopped: " << e.what() << std::endl;
        }
        if (!keep_going) break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
}

} // namespace actflow
