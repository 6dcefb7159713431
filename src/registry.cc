#include "metro/registry.hh"
#include "metro/logging.hh"
#include <algorithm>

namespace metro {

void registry::insert(const std::string &name, metric_ptr m) {
    if (name.empty())
        throw errorx("empty metric name");
    if (!m)
        throw errorx("null metric for name: %s", name.c_str());
    const bool inserted = _metrics([&](map_type &mm) {
        return mm.emplace(name, std::move(m)).second;
    });
    if (!inserted)
        throw name_already_registered(name);
    VLOG(2) << "registered metric " << name;
}

auto registry::get(const std::string &name) const -> metric_ptr {
    return _metrics([&](const map_type &mm) -> metric_ptr {
        const auto i = mm.find(name);
        return i == mm.end() ? metric_ptr() : i->second;
    });
}

bool registry::remove(const std::string &name) {
    const bool removed = _metrics([&](map_type &mm) {
        return mm.erase(name) != 0;
    });
    VLOG_IF(2, removed) << "removed metric " << name;
    return removed;
}

bool registry::contains(const std::string &name) const {
    return _metrics([&](const map_type &mm) {
        return mm.count(name) != 0;
    });
}

size_t registry::size() const {
    return _metrics([](const map_type &mm) {
        return mm.size();
    });
}

std::vector<std::string> registry::names() const {
    std::vector<std::string> n;
    for (const auto &e : snapshot())
        n.push_back(e.first);
    return n;
}

auto registry::snapshot() const -> entries {
    entries ents = _metrics([](const map_type &mm) {
        return entries(mm.begin(), mm.end());
    });
    std::sort(ents.begin(), ents.end(),
        [](const entry &a, const entry &b) { return a.first < b.first; });
    return ents;
}

} // end namespace metro
