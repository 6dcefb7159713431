#ifndef LIBMETRO_SYNCHRONIZED_HH
#define LIBMETRO_SYNCHRONIZED_HH

#include <mutex>
#include <type_traits>

namespace metro {

//! a value only reachable through a function called with its mutex held
//
//! synchronized<std::vector<int>> v;
//! size_t n = v([](std::vector<int> &vec) { vec.push_back(1); return vec.size(); });
template <typename T, typename Mutex = std::mutex>
class synchronized {
private:
    mutable Mutex _mutex;
    T _value;

public:
    synchronized() {}

    synchronized(const synchronized &) = delete;
    synchronized &operator = (const synchronized &) = delete;

    template <typename Func>
    auto operator () (Func &&f) -> typename std::result_of<Func(T &)>::type {
        std::lock_guard<Mutex> lk(_mutex);
        return f(_value);
    }

    //! f receives a const T &
    template <typename Func>
    auto operator () (Func &&f) const -> typename std::result_of<Func(T &)>::type {
        std::lock_guard<Mutex> lk(_mutex);
        return f(_value);
    }
};

} // end namespace metro

#endif // LIBMETRO_SYNCHRONIZED_HH
