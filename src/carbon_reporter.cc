#include "metro/carbon_reporter.hh"
#include "metro/logging.hh"

namespace metro {

carbon_reporter::carbon_reporter(std::shared_ptr<const registry> reg,
        std::unique_ptr<line_sender> sender,
        std::string prefix,
        interval_type interval,
        std::shared_ptr<const clock> c)
    : reporter("carbon", interval),
      _registry(std::move(reg)),
      _clock(std::move(c)),
      _prefix(std::move(prefix)),
      _sender(std::move(sender))
{
    if (!_registry || !_sender || !_clock)
        throw errorx("carbon reporter needs a registry, a sender and a clock");
}

carbon_reporter::~carbon_reporter() {
    stop();
}

void carbon_reporter::on_stop() {
    std::lock_guard<std::mutex> lk(_send_mutex);
    _sender->close();
}

carbon_batch carbon_reporter::collect() const {
    carbon_batch batch;
    _registry->each([&](const std::string &name, const metric &m) {
        try {
            format_metric(batch, _prefix, name, m.export_metric());
        } catch (errorx &e) {
            LOG_EVERY_N(WARNING, 100) << "skipping metric: " << e.what();
        }
    });
    return batch;
}

void carbon_reporter::report() {
    std::lock_guard<std::mutex> lk(_send_mutex);
    const int64_t timestamp = _clock->now();
    const carbon_batch batch = collect();
    if (batch.empty()) {
        VLOG(2) << "no metrics to report";
        return;
    }
    try {
        _sender->send(batch, timestamp);
    } catch (std::exception &e) {
        ++_failed;
        const uint64_t n = ++_consecutive_failures;
        if (n == 1) {
            LOG(WARNING) << "dropped batch of " << batch.size() << " carbon lines: " << e.what();
        } else {
            LOG(ERROR) << "dropped batch of " << batch.size() << " carbon lines, "
                << n << " failures in a row: " << e.what();
        }
        return;
    }
    ++_sent;
    const uint64_t failures = _consecutive_failures.exchange(0);
    LOG_IF(INFO, failures > 0) << "carbon reporting recovered after " << failures << " failures";
    VLOG(1) << "reported " << batch.size() << " carbon lines at " << timestamp;
}

} // end namespace metro
