#ifndef LIBMETRO_ERROR_HH
#define LIBMETRO_ERROR_HH

#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <errno.h>

namespace metro {

//! printf into a std::string
std::string strprintf(const char *fmt, ...) __attribute__((format (printf, 1, 2)));

//! base of every exception libmetro throws
class errorx : public std::exception {
private:
    std::string _what;

public:
    errorx(const std::string &msg) : _what(msg) {}
    errorx(const char *msg) : _what(msg) {}

    //! \param fmt printf-style format string
    template <typename A, typename... Args>
    errorx(const char *fmt, A &&a, Args&&... args)
        : _what(strprintf(fmt, std::forward<A>(a), std::forward<Args>(args)...)) {}

    const char *what() const noexcept override { return _what.c_str(); }
};

//! errorx with ": strerror(error())" appended
//
//! constructors without an explicit error read errno before anything
//! else can change it.
class errno_error : public errorx {
private:
    int _error;

    static std::string describe(int err, const std::string &msg);

public:
    errno_error(int err, const std::string &msg) : errorx(describe(err, msg)), _error(err) {}
    errno_error(int err, const char *msg) : errno_error(err, std::string(msg)) {}

    template <typename A, typename... Args>
    errno_error(int err, const char *fmt, A &&a, Args&&... args)
        : errno_error(err, strprintf(fmt, std::forward<A>(a), std::forward<Args>(args)...)) {}

    errno_error() : errno_error(errno, std::string()) {}
    errno_error(const char *msg) : errno_error(errno, std::string(msg)) {}

    template <typename A, typename... Args>
    errno_error(const char *fmt, A &&a, Args&&... args)
        : errno_error(errno, fmt, std::forward<A>(a), std::forward<Args>(args)...) {}

    //! the errno value, 0 if none
    int error() const { return _error; }
};

//! throw errno_error(args...) if condition holds
template <class ...Args>
void throw_if(bool condition, Args ...args) {
    if (condition)
        throw errno_error(std::forward<Args>(args)...);
}

template <class NotBool, class ...Args>
void throw_if(NotBool, Args ...args) {
    static_assert(std::is_same<NotBool, bool>::value, "throw_if needs a bool condition");
}

enum endx_t { endx };

//! collects a message with operator<< and throws it at endx
template <class Exception>
class error_stream {
private:
    std::ostringstream _os;

public:
    error_stream() {}
    error_stream(error_stream &&other) : _os(std::move(other._os)) {}

    template <class T>
    error_stream &operator << (const T &t) {
        _os << t;
        return *this;
    }

    void operator << (endx_t) {
        throw Exception(_os.str());
    }
};

//! throw_stream() << "bad value " << v << endx;
template <class Exception = errorx>
inline error_stream<Exception> throw_stream() { return error_stream<Exception>(); }

} // end namespace metro

#endif // LIBMETRO_ERROR_HH
