#include "metro/reporter.hh"
#include "metro/error.hh"
#include "metro/logging.hh"

namespace metro {

reporter::reporter(std::string name, interval_type interval)
    : _name(std::move(name)), _interval(interval)
{
    if (interval.count() <= 0)
        throw_stream() << "invalid " << _name << " reporter interval: " << interval.count() << " ms" << endx;
}

reporter::~reporter() {
    stop();
}

void reporter::start() {
    std::lock_guard<std::mutex> lk(_mutex);
    if (_running)
        throw errorx("%s reporter already running", _name.c_str());
    _stopping = false;
    _running = true;
    _thread = thread_guard(std::thread([this] { run_loop(); }));
    LOG(INFO) << _name << " reporter started, interval " << _interval.count() << " ms";
}

void reporter::stop() {
    std::lock_guard<std::mutex> stop_lk(_stop_mutex);
    thread_guard worker;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (!_running)
            return;
        _stopping = true;
        worker = std::move(_thread);
    }
    _cv.notify_all();
    worker.join();
    {
        std::lock_guard<std::mutex> lk(_mutex);
        _running = false;
    }
    on_stop();
    LOG(INFO) << _name << " reporter stopped";
}

bool reporter::running() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _running;
}

void reporter::run_loop() {
    using clock_type = std::chrono::steady_clock;
    auto next = clock_type::now() + _interval;
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(_mutex);
            if (_cv.wait_until(lk, next, [this] { return _stopping; }))
                return;
        }
        try {
            report();
        } catch (std::exception &e) {
            LOG(ERROR) << _name << " report failed: " << e.what();
        }
        next += _interval;
        // fell behind, e.g. a send that ran into its timeout; skip missed passes
        const auto now = clock_type::now();
        if (next < now)
            next = now + _interval;
    }
}

} // end namespace metro
