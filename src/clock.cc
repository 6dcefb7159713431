#include "metro/clock.hh"
#include "metro/logging.hh"
#include <time.h>
#include <string.h>
#include <errno.h>

namespace metro {

bool system_clock_source::read(int64_t &seconds) const {
    struct timespec ts;
    if (::clock_gettime(CLOCK_REALTIME, &ts) == -1)
        return false;
    seconds = ts.tv_sec;
    return true;
}

int64_t system_clock_source::now() const {
    int64_t last = _last.load();
    int64_t t = 0;
    if (!read(t)) {
        LOG_EVERY_N(WARNING, 1000) << "clock source failed: " << strerror(errno);
        return _last.load();
    }
    // keep the largest value seen; a stepped wall clock holds still instead of rewinding
    while (t > last) {
        if (_last.compare_exchange_weak(last, t))
            return t;
    }
    return last;
}

std::shared_ptr<const clock> default_clock() {
    static const std::shared_ptr<const clock> sys = std::make_shared<system_clock_source>();
    return sys;
}

} // metro
