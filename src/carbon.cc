#include "metro/carbon.hh"
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace metro {

namespace {

bool valid_path(const std::string &path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\0')
            return false;
    }
    return true;
}

struct carbon_visitor : boost::static_visitor<> {
    carbon_batch &out;
    const std::string &base;

    carbon_visitor(carbon_batch &out_, const std::string &base_)
        : out(out_), base(base_) {}

    void add(const char *suffix, std::string value) const {
        out.push_back(carbon_line{metric_path(base, suffix), std::move(value)});
    }

    void operator()(const counter_snapshot &c) const {
        add("count", format_value(c.value));
    }

    void operator()(const gauge_snapshot &g) const {
        add("value", format_value(g.value));
    }

    void operator()(const meter_snapshot &m) const {
        add("count",     format_value(m.count));
        add("mean_rate", format_value(m.mean));
        add("m1_rate",   format_value(m.rates[0]));
        add("m5_rate",   format_value(m.rates[1]));
        add("m15_rate",  format_value(m.rates[2]));
    }
};

} // anon namespace

void carbon_line::append_to(std::string &buf, int64_t timestamp) const {
    buf += path;
    buf += ' ';
    buf += value;
    buf += ' ';
    buf += format_value(timestamp);
    buf += '\n';
}

std::string carbon_line::str(int64_t timestamp) const {
    std::string s;
    append_to(s, timestamp);
    return s;
}

std::string format_value(int64_t v) {
    return boost::lexical_cast<std::string>(v);
}

std::string format_value(uint64_t v) {
    return boost::lexical_cast<std::string>(v);
}

std::string format_value(double v) {
    // carbon has no spelling for these
    if (!std::isfinite(v))
        v = 0.0;
    // shortest of %.15g and %.17g that reads back as v, so slow rates keep their digits
    char buf[64];
    int n = snprintf(buf, sizeof buf, "%.15g", v);
    if (n > 0 && static_cast<size_t>(n) < sizeof buf && std::strtod(buf, nullptr) != v)
        n = snprintf(buf, sizeof buf, "%.17g", v);
    if (n < 0 || static_cast<size_t>(n) >= sizeof buf)
        throw errorx("unformattable value");
    return std::string(buf, n);
}

void format_metric(carbon_batch &out, const std::string &prefix,
        const std::string &name, const metric_value &value)
{
    const std::string base = prefix.empty() ? name : metric_path(prefix, name);
    if (!valid_path(base))
        throw errorx("invalid carbon path: '%s'", base.c_str());
    boost::apply_visitor(carbon_visitor{out, base}, value);
}

std::string render_batch(const carbon_batch &batch, int64_t timestamp) {
    std::string buf;
    buf.reserve(batch.size() * 64);
    for (const auto &line : batch)
        line.append_to(buf, timestamp);
    return buf;
}

carbon_sample parse_carbon_line(const std::string &line) {
    std::string l = line;
    if (!l.empty() && l.back() == '\n')
        l.pop_back();
    std::vector<std::string> parts;
    boost::split(parts, l, boost::is_any_of(" "));
    if (parts.size() != 3 || parts[0].empty())
        throw errorx("malformed carbon line: '%s'", l.c_str());
    carbon_sample s;
    s.path = parts[0];
    try {
        s.value = boost::lexical_cast<double>(parts[1]);
        s.timestamp = boost::lexical_cast<int64_t>(parts[2]);
    } catch (boost::bad_lexical_cast &) {
        throw errorx("malformed carbon line: '%s'", l.c_str());
    }
    return s;
}

} // end namespace metro
