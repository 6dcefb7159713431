#include "metro/error.hh"

#include <cstdarg>
#include <cstdio>
#include <string.h>

namespace metro {

std::string strprintf(const char *fmt, ...) {
    char buf[256];
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(buf, sizeof buf, fmt, ap);
    va_end(ap);
    if (n < 0)
        return fmt;
    if (static_cast<size_t>(n) < sizeof buf)
        return std::string(buf, n);

    std::string out(static_cast<size_t>(n) + 1, '\0');
    va_start(ap, fmt);
    vsnprintf(&out[0], out.size(), fmt, ap);
    va_end(ap);
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string errno_error::describe(int err, const std::string &msg) {
    if (err == 0)
        return msg;
    // GNU strerror_r; may return a static string instead of ebuf
    char ebuf[128];
    const char *es = strerror_r(err, ebuf, sizeof ebuf);
    if (msg.empty())
        return es;
    return msg + ": " + es;
}

} // end namespace metro
