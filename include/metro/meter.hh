#ifndef LIBMETRO_METER_HH
#define LIBMETRO_METER_HH

#include "metro/metric.hh"
#include "metro/ewma.hh"
#include "metro/clock.hh"
#include <atomic>
#include <memory>

namespace metro {

//! measures the rate at which a set of events occur
//
//! just like the unix load averages visible in top: a 1, 5 and 15 minute
//! exponentially weighted rate plus the mean rate since creation.
//! all members are safe to call from any number of threads; none of
//! them take a lock.
class meter : public metric {
public:
    using count_type = uint64_t;

private:
    const std::shared_ptr<const clock> _clock;
    const int64_t _birthstamp;
    // readers catch the averages up too, so the tick state is mutable
    mutable std::atomic<int64_t> _last_tick;
    // wraps modulo 2^64
    std::atomic<count_type> _count{0};
    mutable ewma _m01;
    mutable ewma _m05;
    mutable ewma _m15;

    void tick_if_necessary() const;

public:
    meter();
    explicit meter(std::shared_ptr<const clock> c);

    meter(const meter &) = delete;
    meter &operator = (const meter &) = delete;

    //! mark the occurrence of n events
    void mark(count_type n=1);

    //! number of events marked so far
    count_type count() const { return _count.load(); }

    //! events per second since the meter was created
    double mean_rate() const;

    double m01rate() const;
    double m05rate() const;
    double m15rate() const;

    //! count, rates and mean read after one catch-up
    meter_snapshot snapshot() const;

    metric_value export_metric() const override;
};

} // end namespace metro

#endif
