#ifndef LIBMETRO_CARBON_REPORTER_HH
#define LIBMETRO_CARBON_REPORTER_HH

#include "metro/reporter.hh"
#include "metro/registry.hh"
#include "metro/carbon_sender.hh"
#include "metro/clock.hh"
#include <atomic>
#include <memory>
#include <mutex>

namespace metro {

//! periodically sends every metric in a registry to carbon
//
//! a batch that fails to send is logged and dropped; nothing is buffered.
//! the next pass starts over with a fresh connection.
class carbon_reporter : public reporter {
private:
    const std::shared_ptr<const registry> _registry;
    const std::shared_ptr<const clock> _clock;
    const std::string _prefix;
    // passes from report() and the background thread take turns on the sender
    std::mutex _send_mutex;
    std::unique_ptr<line_sender> _sender;
    std::atomic<uint64_t> _sent{0};
    std::atomic<uint64_t> _failed{0};
    std::atomic<uint64_t> _consecutive_failures{0};

protected:
    void on_stop() override;

public:
    carbon_reporter(std::shared_ptr<const registry> reg,
            std::unique_ptr<line_sender> sender,
            std::string prefix,
            interval_type interval,
            std::shared_ptr<const clock> c = default_clock());
    ~carbon_reporter() override;

    //! format every registered metric; metrics with unusable names are skipped
    carbon_batch collect() const;

    //! collect and send one batch stamped with the clock's now()
    void report() override;

    const std::string &prefix() const { return _prefix; }

    uint64_t batches_sent() const { return _sent.load(); }
    uint64_t batches_failed() const { return _failed.load(); }
    uint64_t consecutive_failures() const { return _consecutive_failures.load(); }
};

} // end namespace metro

#endif
