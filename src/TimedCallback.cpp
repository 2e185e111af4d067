#include "TimedCallback.h"
#include <loguru/loguru.hpp>

/* loguru priority */
const int LOG_PRIORITY = 3;

/**
 * Construct a TimedCallback that, once started, executes f every
 * 'period' milliseconds.
 */
TimedCallback::TimedCallback(std::chrono::milliseconds period,
    std::function<void()> f)
  : TimedCallback([period] { return period; }, std::move(f)) {}

/**
 * Here, each wait lasts for whatever 'next_duration' returns when the wait
 * begins, e.g. a random duration within an interval.
 */
TimedCallback::TimedCallback(DurationSource _next_duration,
    std::function<void()> f)
  : cb(std::move(f)), next_duration(std::move(_next_duration))
{
    worker = std::thread(&TimedCallback::run, this);
}

/**
 * Stop the timer thread. A callback in progress is allowed to finish.
 */
TimedCallback::~TimedCallback()
{
    {
        std::lock_guard<std::mutex> l(m);
        shutting_down = true;
    }
    cv.notify_all();
    worker.join();
}

/**
 * Start the timer. If the timer is already running, it is restarted with a
 * fresh duration and the pending expiry is discarded.
 */
void TimedCallback::start()
{
    std::lock_guard<std::mutex> l(m);
    if (timer_state == NOT_RUNNING) {
        VLOG_F(LOG_PRIORITY, "Starting timed callback");
        timer_state = RUNNING;
    } else {
        VLOG_F(LOG_PRIORITY, "Timer already running; signalling restart");
        timer_state = RESTART_REQUESTED;
    }
    cv.notify_one();
}

/**
 * Stop the callback timer. If the timer has not been started, this function
 * will have no effect.
 */
void TimedCallback::stop()
{
    std::lock_guard<std::mutex> l(m);
    if (timer_state != NOT_RUNNING) {
        VLOG_F(LOG_PRIORITY, "Timer running; signalling stoppage");
        timer_state = NOT_RUNNING;
        cv.notify_one();
    }
}

/**
 * Timer thread routine. Idles while the timer is stopped, otherwise waits
 * out one duration at a time and fires the callback on every expiry.
 */
void TimedCallback::run()
{
    loguru::set_thread_name("timer");
    std::unique_lock<std::mutex> l(m);
    for (;;) {
        cv.wait(l, [this] {
            return shutting_down || timer_state != NOT_RUNNING;
        });
        if (shutting_down) return;

        timer_state = RUNNING;
        std::chrono::milliseconds duration = next_duration();
        bool interrupted = cv.wait_for(l, duration, [this] {
            return shutting_down || timer_state != RUNNING;
        });
        if (shutting_down) return;

        if (interrupted) {
            if (timer_state == RESTART_REQUESTED) {
                VLOG_F(LOG_PRIORITY, "Timer restart request received");
            } else {
                VLOG_F(LOG_PRIORITY, "Timer stop request received");
            }
            continue;
        }

        VLOG_F(LOG_PRIORITY, "Timer expired after %lld ms; executing cb",
            static_cast<long long>(duration.count()));
        l.unlock();
        cb();
        l.lock();
    }
}
