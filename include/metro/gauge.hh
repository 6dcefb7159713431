#ifndef LIBMETRO_GAUGE_HH
#define LIBMETRO_GAUGE_HH

#include "metro/metric.hh"
#include <atomic>

namespace metro {

//! last value set wins
class gauge : public metric {
public:
    using value_type = int64_t;

private:
    std::atomic<value_type> _value{0};

public:
    gauge() {}
    explicit gauge(value_type v) : _value{v} {}
    gauge(const gauge &) = delete;
    gauge &operator = (const gauge &) = delete;

    metric_value export_metric() const override {
        return snapshot();
    }

    gauge_snapshot snapshot() const {
        return gauge_snapshot{value()};
    }

    value_type value() const {
        return _value.load();
    }

    void set(value_type v) {
        _value.store(v);
    }
};

} // end namespace metro

#endif
