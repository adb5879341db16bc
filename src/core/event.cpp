#include <peerlink/core/event.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::core {

// EventEmitter implementation

void EventEmitter::on(const std::string& type, EventCallback callback) {
    if (!callback) {
        listeners_.erase(type);
        return;
    }
    listeners_[type] = std::move(callback);
}

void EventEmitter::off(const std::string& type) {
    listeners_.erase(type);
}

void EventEmitter::removeAllListeners() {
    listeners_.clear();
}

bool EventEmitter::hasListener(const std::string& type) const {
    return listeners_.find(type) != listeners_.end();
}

bool EventEmitter::emit(const Event& event) const {
    auto it = listeners_.find(event.type());
    if (it == listeners_.end()) {
        return false;
    }

    // Copy agar listener boleh mengganti dirinya sendiri
    EventCallback callback = it->second;
    try {
        callback(event);
    }
    catch (const std::exception& e) {
        Logger::error("Listener for event '{}' threw: {}", event.type(), e.what());
    }
    return true;
}

bool EventEmitter::emit(std::string type, std::any data) const {
    return emit(Event(std::move(type), std::move(data)));
}

// EventLoop implementation

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
}

TimerId EventLoop::postDelayed(std::chrono::milliseconds delay, Job job) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        auto due = nowLocked() + delay;
        timers_.emplace(TimerKey{due, id}, std::move(job));
        timer_index_.emplace(id, due);
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_index_.find(id);
    if (it == timer_index_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_index_.erase(it);
    return true;
}

bool EventLoop::processOne() {
    Job job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!takeReady(job)) {
            return false;
        }
    }

    execute(job);
    return true;
}

std::size_t EventLoop::processAll() {
    std::size_t count = 0;
    while (processOne()) {
        ++count;
    }
    return count;
}

void EventLoop::advance(std::chrono::milliseconds delta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        offset_ += delta;
    }
    processAll();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    running_ = true;
    stop_requested_ = false;

    while (!stop_requested_) {
        Job job;
        if (takeReady(job)) {
            lock.unlock();
            execute(job);
            lock.lock();
            continue;
        }

        if (timers_.empty()) {
            cv_.wait(lock);
        } else {
            // Waktu timer dikonversi kembali ke jam sistem
            auto due = timers_.begin()->first.first - offset_;
            cv_.wait_until(lock, due);
        }
    }

    running_ = false;
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

EventLoop::Clock::time_point EventLoop::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nowLocked();
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + timers_.size();
}

std::size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

EventLoop::Clock::time_point EventLoop::nowLocked() const {
    return Clock::now() + offset_;
}

bool EventLoop::takeReady(Job& job) {
    if (!queue_.empty()) {
        job = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    if (!timers_.empty() && timers_.begin()->first.first <= nowLocked()) {
        auto it = timers_.begin();
        job = std::move(it->second);
        timer_index_.erase(it->first.second);
        timers_.erase(it);
        return true;
    }

    return false;
}

void EventLoop::execute(Job& job) {
    try {
        job();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing event loop job: {}", e.what());
    }
}

} // namespace peerlink::core
