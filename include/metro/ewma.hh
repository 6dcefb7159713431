#ifndef METRO_EWMA_HH
#define METRO_EWMA_HH

#include <chrono>
#include <cmath>
#include <atomic>
#include <cstdint>
#include <ratio>

namespace metro {

//! exponentially weighted moving average of an event rate
//
//! events are accumulated with update() and folded into the rate every
//! tick_seconds by tick(), the same recurrence as the unix load average:
//!   rate += alpha * (instant_rate - rate)
//! where alpha = 1 - e^(-tick / window). the first tick takes the
//! instant rate as is, so a fresh average does not start out biased to 0.
//
//! update() and rate() may be called from any thread. tick() must only
//! be called by one thread at a time.
class ewma {
public:
    static constexpr int64_t tick_seconds = 5;

private:
    const double _alpha;
    std::atomic<uint64_t> _uncounted{0};
    std::atomic<double> _rate{0.0};
    std::atomic<bool> _initialized{false};

public:
    //! average over the given window (1, 5 and 15 minutes for load averages)
    explicit ewma(std::chrono::minutes window)
        : _alpha{alpha_for(window)} {}

    ewma(const ewma &) = delete;
    ewma &operator = (const ewma &) = delete;

    static double alpha_for(std::chrono::minutes window) {
        using std::chrono::seconds;
        const double w = static_cast<double>(std::chrono::duration_cast<seconds>(window).count());
        return 1.0 - std::exp(-static_cast<double>(tick_seconds) / w);
    }

    double alpha() const { return _alpha; }

    void update(uint64_t n) {
        _uncounted.fetch_add(n);
    }

    void tick() {
        const double instant = static_cast<double>(_uncounted.exchange(0)) / tick_seconds;
        if (_initialized.load()) {
            const double r = _rate.load();
            _rate.store(r + _alpha * (instant - r));
        } else {
            _rate.store(instant);
            _initialized.store(true);
        }
    }

    //! events per RateUnit; 0 before the first tick
    template <class RateUnit=std::chrono::seconds>
    double rate() const {
        using cvt = std::ratio_divide<typename RateUnit::period, std::ratio<1>>;
        return (_rate.load() * cvt::num) / cvt::den;
    }
};

} // metro

#endif
