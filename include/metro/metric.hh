#ifndef LIBMETRO_METRIC_HH
#define LIBMETRO_METRIC_HH

#include <boost/variant.hpp>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>

namespace metro {

// convenience wrappers to create metric names.
//   join('.', @arg)  # equivalent Perl

namespace impl {
template <typename Arg>
inline void path_shift(std::stringstream &ss, Arg&& arg) {
    ss << std::forward<Arg>(arg);
}

template <typename Arg, typename ...Args>
inline void path_shift(std::stringstream &ss, Arg&& arg, Args&& ...args) {
    ss << std::forward<Arg>(arg) << ".";
    path_shift(ss, std::forward<Args>(args)...);
}
} // namespace impl

inline std::string metric_path(const std::string &arg) { return arg; }
inline std::string metric_path(std::string &&arg)      { return std::move(arg); }

template <typename Arg, typename ...Args>
inline std::string metric_path(Arg&& arg, Args&& ...args) {
    std::stringstream ss;
    impl::path_shift(ss, std::forward<Arg>(arg), std::forward<Args>(args)...);
    return ss.str();
}

// point-in-time copies of metric state, never changed after creation

struct counter_snapshot {
    int64_t value;
};

struct gauge_snapshot {
    int64_t value;
};

struct meter_snapshot {
    uint64_t count;
    //! 1, 5 and 15 minute rates, events per second
    double rates[3];
    //! events per second since the meter was created
    double mean;

    double m01rate() const { return rates[0]; }
    double m05rate() const { return rates[1]; }
    double m15rate() const { return rates[2]; }
};

//! what a metric exports to reporters
//! histograms are summarized by an outside statistics library and are not part of this set
using metric_value = boost::variant<counter_snapshot, gauge_snapshot, meter_snapshot>;

//! anything that can be found in a registry and exported
class metric {
public:
    virtual ~metric() {}
    virtual metric_value export_metric() const = 0;
};

} // end namespace metro

#endif
