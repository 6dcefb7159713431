#ifndef LIBMETRO_CLOCK_HH
#define LIBMETRO_CLOCK_HH

#include <atomic>
#include <cstdint>
#include <memory>

namespace metro {

//! source of whole seconds for metrics
//
//! successive calls to now() never go backwards. meters rely on this
//! so their tick timestamp only ever moves forward.
class clock {
public:
    virtual ~clock() {}
    virtual int64_t now() const = 0;
};

//! wall clock seconds since the epoch
//
//! never fails: if the time source errors, or steps backwards, the
//! last good reading is returned instead.
class system_clock_source : public clock {
private:
    mutable std::atomic<int64_t> _last{0};
protected:
    //! one raw reading of the time source
    //! \return false if the source failed; errno is set
    virtual bool read(int64_t &seconds) const;
public:
    int64_t now() const override;
};

//! clock that only moves when told to, for tests and simulations
class manual_clock : public clock {
private:
    std::atomic<int64_t> _now;
public:
    explicit manual_clock(int64_t start = 0) : _now{start} {}

    int64_t now() const override { return _now.load(); }

    //! move forward; moving backwards is ignored
    void set(int64_t t) {
        int64_t cur = _now.load();
        while (t > cur && !_now.compare_exchange_weak(cur, t)) {}
    }

    void advance(int64_t seconds) { _now.fetch_add(seconds > 0 ? seconds : 0); }
};

//! shared system clock used when no clock is given
std::shared_ptr<const clock> default_clock();

} // metro

#endif // LIBMETRO_CLOCK_HH
