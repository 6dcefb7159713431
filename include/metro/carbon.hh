#ifndef LIBMETRO_CARBON_HH
#define LIBMETRO_CARBON_HH

#include "metro/metric.hh"
#include "metro/error.hh"
#include <cstdint>
#include <string>
#include <vector>

namespace metro {

//! \file
//! carbon plaintext protocol: one "path value timestamp\n" line per sample
//
//! suffixes appended to a metric's name:
//!   counter  .count
//!   gauge    .value
//!   meter    .count .mean_rate .m1_rate .m5_rate .m15_rate

//! one sample without its timestamp; every line of a batch shares one
struct carbon_line {
    std::string path;
    std::string value;

    //! "path value timestamp\n"
    std::string str(int64_t timestamp) const;
    void append_to(std::string &buf, int64_t timestamp) const;
};

using carbon_batch = std::vector<carbon_line>;

//! a sample parsed back from the wire
struct carbon_sample {
    std::string path;
    double value;
    int64_t timestamp;
};

std::string format_value(int64_t v);
std::string format_value(uint64_t v);
//! fixed point, six fractional digits
std::string format_value(double v);

//! append the lines for one metric
//! \param prefix prepended with a '.' unless empty
//! \throw errorx if the resulting path would not survive the line format
void format_metric(carbon_batch &out, const std::string &prefix,
        const std::string &name, const metric_value &value);

//! render a whole batch as it goes on the wire
std::string render_batch(const carbon_batch &batch, int64_t timestamp);

//! parse one line, with or without its trailing newline
//! \throw errorx on malformed input
carbon_sample parse_carbon_line(const std::string &line);

} // end namespace metro

#endif
