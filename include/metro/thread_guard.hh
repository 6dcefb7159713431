#ifndef METRO_THREAD_GUARD_HH
#define METRO_THREAD_GUARD_HH

#include <thread>
#include <system_error>
#include "metro/logging.hh"

namespace metro {

//! owns a std::thread and joins it when destroyed or replaced
class thread_guard {
private:
    std::thread _thread;
public:
    thread_guard() {}
    thread_guard(std::thread t) : _thread{std::move(t)} {}
    thread_guard(thread_guard &&other) : _thread{std::move(other._thread)} {}

    thread_guard &operator = (thread_guard &&other) {
        if (this != &other) {
            join();
            _thread = std::move(other._thread);
        }
        return *this;
    }

    ~thread_guard() { join(); }

    //! no-op when no thread is attached
    void join() {
        if (!_thread.joinable())
            return;
        try {
            _thread.join();
        } catch (std::system_error &e) {
            LOG(ERROR) << "join of thread " << _thread.get_id() << " failed: " << e.what();
        }
    }
};

} // metro

#endif // METRO_THREAD_GUARD_HH
