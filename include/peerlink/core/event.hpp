#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <map>
#include <deque>
#include <mutex>
#include <any>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <utility>

#include <peerlink/core/error.hpp>

namespace peerlink::core {

class Event;

using EventCallback = std::function<void(const Event&)>;
using TimerId = std::uint64_t;

// Event class untuk menyimpan data event
class Event {
public:
    Event(std::string type, std::any data = std::any())
        : type_(std::move(type))
        , data_(std::move(data))
        , timestamp_(std::chrono::system_clock::now()) {}

    const std::string& type() const noexcept { return type_; }
    const std::any& data() const noexcept { return data_; }
    auto timestamp() const noexcept { return timestamp_; }

    // Data access dengan type checking
    template<typename T>
    const T& get() const {
        const T* value = std::any_cast<T>(&data_);
        if (!value) {
            throw_error(ErrorCode::InvalidArgument,
                "Invalid event data type cast for event '" + type_ + "'");
        }
        return *value;
    }

private:
    std::string type_;
    std::any data_;
    std::chrono::system_clock::time_point timestamp_;
};

// Synchronous emitter with one listener per event type. Registering a
// listener for a type that already has one replaces it.
class EventEmitter {
public:
    EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    void on(const std::string& type, EventCallback callback);
    void off(const std::string& type);
    void removeAllListeners();
    bool hasListener(const std::string& type) const;

    // Returns false when nobody listens for the event type.
    bool emit(const Event& event) const;
    bool emit(std::string type, std::any data = std::any()) const;

private:
    std::unordered_map<std::string, EventCallback> listeners_;
};

// Single-threaded event loop. Jobs posted from any thread run on the thread
// that calls run(), processOne() or processAll(), one at a time and in
// posting order. Timers fire in due order once the loop clock reaches them.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Job = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Job job);
    TimerId postDelayed(std::chrono::milliseconds delay, Job job);
    bool cancel(TimerId id);

    // Run one ready job or due timer. Returns false if nothing was ready.
    bool processOne();

    // Run until nothing is ready; returns the number of jobs executed.
    std::size_t processAll();

    // Move the loop clock forward and run everything that became due.
    void advance(std::chrono::milliseconds delta);

    // Blocking dispatch until stop() is called.
    void run();
    void stop();

    bool isRunning() const noexcept { return running_; }

    Clock::time_point now() const;
    std::size_t queueSize() const;
    std::size_t pendingTimers() const;

private:
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    Clock::time_point nowLocked() const;
    bool takeReady(Job& job);
    void execute(Job& job);

    std::deque<Job> queue_;
    std::map<TimerKey, Job> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_index_;
    TimerId next_timer_id_ = 1;
    Clock::duration offset_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_requested_ = false;
};

inline std::unique_ptr<EventLoop> make_event_loop() {
    return std::make_unique<EventLoop>();
}

} // namespace peerlink::core
