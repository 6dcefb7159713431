#ifndef LIBMETRO_REGISTRY_HH
#define LIBMETRO_REGISTRY_HH

#include "metro/metric.hh"
#include "metro/synchronized.hh"
#include "metro/error.hh"
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metro {

//! thrown by registry::insert when the name is taken
class name_already_registered : public errorx {
public:
    explicit name_already_registered(const std::string &name)
        : errorx("metric name already registered: %s", name.c_str()) {}
};

//! named metrics of a process, for reporters to walk
//
//! names are unique. a second insert under a taken name throws
//! name_already_registered and leaves the first metric in place.
//! entries stay until removed.
class registry {
public:
    using metric_ptr = std::shared_ptr<metric>;
    using entry = std::pair<std::string, metric_ptr>;
    using entries = std::vector<entry>;

private:
    using map_type = std::unordered_map<std::string, metric_ptr>;
    synchronized<map_type> _metrics;

public:
    registry() {}
    registry(const registry &) = delete;
    registry &operator = (const registry &) = delete;

    //! \throw name_already_registered
    void insert(const std::string &name, metric_ptr m);

    //! construct a metric of type M and register it
    //! \throw name_already_registered
    template <typename M, typename ...Args>
    std::shared_ptr<M> insert_new(const std::string &name, Args&& ...args) {
        auto m = std::make_shared<M>(std::forward<Args>(args)...);
        insert(name, m);
        return m;
    }

    //! \return the metric, or an empty pointer
    metric_ptr get(const std::string &name) const;

    //! \return the metric if it is an M, or an empty pointer
    template <typename M>
    std::shared_ptr<M> get_as(const std::string &name) const {
        return std::dynamic_pointer_cast<M>(get(name));
    }

    //! \return true if something was removed
    bool remove(const std::string &name);

    bool contains(const std::string &name) const;

    size_t size() const;

    //! sorted names
    std::vector<std::string> names() const;

    //! copy of every entry, taken in one critical section and sorted by name
    entries snapshot() const;

    //! call f(name, metric) for each entry of a snapshot
    //
    //! f runs without the registry lock held, so it may use the registry.
    template <typename Func>
    void each(Func &&f) const {
        for (const auto &e : snapshot()) {
            f(e.first, *e.second);
        }
    }
};

} // end namespace metro

#endif
