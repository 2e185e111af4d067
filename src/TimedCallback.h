#ifndef TIMED_CALLBACK_H
#define TIMED_CALLBACK_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

/**
 * The TimedCallback class implements a recurring, resettable timer. Once
 * started, it executes its callback every time a full duration elapses
 * without a restart, drawing a fresh duration before each wait. It sleeps
 * between deadlines rather than polling.
 *
 * The callback runs on the timer's own thread without the timer lock held,
 * so it may call start() or stop() on the same timer.
 */
class TimedCallback {
  public:
    using DurationSource = std::function<std::chrono::milliseconds()>;

    TimedCallback(std::chrono::milliseconds period, std::function<void()> f);
    TimedCallback(DurationSource next_duration, std::function<void()> f);
    ~TimedCallback();

    TimedCallback(const TimedCallback&) = delete;
    TimedCallback& operator=(const TimedCallback&) = delete;

    void start();
    void stop();

  private:
    enum TimerState {
        NOT_RUNNING,
        RUNNING,
        RESTART_REQUESTED
    };

    void run();

    std::function<void()> cb;
    DurationSource next_duration;

    TimerState timer_state {NOT_RUNNING};
    bool shutting_down {false};
    std::mutex m;
    std::condition_variable cv;

    /* declared last: started once every other member is initialized */
    std::thread worker;
};

#endif /* !TIMED_CALLBACK_H */
