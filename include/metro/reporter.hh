#ifndef LIBMETRO_REPORTER_HH
#define LIBMETRO_REPORTER_HH

#include "metro/thread_guard.hh"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace metro {

//! runs report() on a background thread at a fixed interval
//
//! derived classes must call stop() in their destructor, before their own
//! members are gone; the base destructor stopping is only a last resort.
class reporter {
public:
    using interval_type = std::chrono::milliseconds;

private:
    const std::string _name;
    const interval_type _interval;
    mutable std::mutex _mutex;
    // held for the whole of stop(), so concurrent stops run one after another
    std::mutex _stop_mutex;
    std::condition_variable _cv;
    bool _stopping = false;
    bool _running = false;
    thread_guard _thread;

    void run_loop();

protected:
    //! called by stop() once the background thread has exited
    virtual void on_stop() {}

public:
    reporter(std::string name, interval_type interval);
    virtual ~reporter();

    reporter(const reporter &) = delete;
    reporter &operator = (const reporter &) = delete;

    //! one reporting pass
    virtual void report() = 0;

    //! start reporting every interval()
    //! \throw errorx if already running
    void start();

    //! no new passes start; a pass in flight finishes or times out first
    void stop();

    bool running() const;

    const std::string &name() const { return _name; }
    interval_type interval() const { return _interval; }
};

} // end namespace metro

#endif
