#include "TimedCallback.h"
#include <atomic>
#include <cassert>
#include <iostream>

using std::cout;
using namespace std::chrono_literals;

void test_recurring() {
    std::atomic<int> fired {0};
    TimedCallback t(20ms, [&fired] { fired++; });
    std::this_thread::sleep_for(100ms);
    assert(fired == 0);

    t.start();
    std::this_thread::sleep_for(210ms);
    t.stop();
    int n = fired;
    assert(n >= 3 && n <= 11);

    std::this_thread::sleep_for(100ms);
    assert(fired == n);
}

void test_restart_postpones() {
    std::atomic<int> fired {0};
    TimedCallback t(300ms, [&fired] { fired++; });
    t.start();
    for (int i = 0; i < 8; i++) {
        std::this_thread::sleep_for(50ms);
        t.start();
    }
    assert(fired == 0);

    std::this_thread::sleep_for(600ms);
    assert(fired >= 1);
}

void test_fresh_duration_per_wait() {
    std::atomic<int> drawn {0};
    std::atomic<int> fired {0};
    TimedCallback t([&drawn] { drawn++; return std::chrono::milliseconds(20); },
                    [&fired] { fired++; });
    t.start();
    std::this_thread::sleep_for(150ms);
    t.stop();
    assert(fired >= 2);
    assert(drawn >= fired);
}

void test_callback_restarts_timer() {
    std::atomic<int> fired {0};
    TimedCallback *self = nullptr;
    TimedCallback t(20ms, [&fired, &self] {
        fired++;
        self->stop();
        self->start();
    });
    self = &t;
    t.start();
    std::this_thread::sleep_for(150ms);
    t.stop();
    assert(fired >= 2);
}

void test_destroy_while_running() {
    std::atomic<int> fired {0};
    {
        TimedCallback t(10s, [&fired] { fired++; });
        t.start();
    }
    assert(fired == 0);
}

int main(int argc, char* argv[]) {
    test_recurring();
    test_restart_postpones();
    test_fresh_duration_per_wait();
    test_callback_restarts_timer();
    test_destroy_while_running();

    cout << "ALL TESTS PASS!\n";
    return 0;
}
