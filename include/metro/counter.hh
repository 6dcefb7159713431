#ifndef LIBMETRO_COUNTER_HH
#define LIBMETRO_COUNTER_HH

#include "metro/metric.hh"
#include <atomic>

namespace metro {

//! signed count that can move both ways
class counter : public metric {
public:
    using value_type = int64_t;

private:
    std::atomic<value_type> _count{0};

public:
    counter() {}
    counter(const counter &) = delete;
    counter &operator = (const counter &) = delete;

    metric_value export_metric() const override {
        return snapshot();
    }

    counter_snapshot snapshot() const {
        return counter_snapshot{value()};
    }

    value_type value() const {
        return _count.load();
    }

    void inc(value_type n=1) {
        _count.fetch_add(n);
    }

    void dec(value_type n=1) {
        _count.fetch_sub(n);
    }

    void clear() {
        _count.store(0);
    }
};

} // end namespace metro

#endif
