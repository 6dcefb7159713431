#include "metro/meter.hh"
#include "metro/logging.hh"

namespace metro {

constexpr int64_t ewma::tick_seconds;

meter::meter() : meter(default_clock()) {}

meter::meter(std::shared_ptr<const clock> c)
    : _clock(std::move(c)),
      _birthstamp(_clock->now()),
      _last_tick(_birthstamp),
      _m01(std::chrono::minutes{1}),
      _m05(std::chrono::minutes{5}),
      _m15(std::chrono::minutes{15})
{
}

// one compare-exchange decides which caller folds the elapsed ticks in.
// losers saw a stale timestamp and do nothing; the winner owns every tick
// up to the new timestamp. clock values never decrease, so there is no ABA.
void meter::tick_if_necessary() const {
    const int64_t now = _clock->now();
    int64_t old = _last_tick.load();
    const int64_t elapsed = now - old;
    if (elapsed > ewma::tick_seconds) {
        const int64_t aligned = now - elapsed % ewma::tick_seconds;
        if (_last_tick.compare_exchange_strong(old, aligned)) {
            const int64_t ticks = elapsed / ewma::tick_seconds;
            VLOG(3) << "meter " << this << " catching up " << ticks << " ticks";
            for (int64_t i = 0; i < ticks; ++i) {
                _m01.tick();
                _m05.tick();
                _m15.tick();
            }
        }
    }
}

void meter::mark(count_type n) {
    tick_if_necessary();
    _count.fetch_add(n);
    _m01.update(n);
    _m05.update(n);
    _m15.update(n);
}

double meter::mean_rate() const {
    const count_type c = _count.load();
    if (c == 0)
        return 0.0;
    const int64_t elapsed = _clock->now() - _birthstamp;
    if (elapsed <= 0)
        return 0.0;
    return static_cast<double>(c) / static_cast<double>(elapsed);
}

double meter::m01rate() const {
    tick_if_necessary();
    return _m01.rate();
}

double meter::m05rate() const {
    tick_if_necessary();
    return _m05.rate();
}

double meter::m15rate() const {
    tick_if_necessary();
    return _m15.rate();
}

meter_snapshot meter::snapshot() const {
    tick_if_necessary();
    meter_snapshot s;
    s.count = count();
    s.rates[0] = _m01.rate();
    s.rates[1] = _m05.rate();
    s.rates[2] = _m15.rate();
    s.mean = mean_rate();
    return s;
}

metric_value meter::export_metric() const {
    return snapshot();
}

} // end namespace metro
