#ifndef LIBMETRO_LOGGING_HH
#define LIBMETRO_LOGGING_HH

#include <glog/logging.h>
#include <glog/stl_logging.h>
#include <sstream>
#include <string>

namespace metro {

//! render a byte buffer for VLOG output, non-printables escaped
template <typename T> std::string escape_bytes(const T &in) {
    static const char hexs[] = "0123456789ABCDEF";
    std::stringstream ss;
    for (typename T::const_iterator i = in.begin(); i!=in.end(); i++) {
        const unsigned char c = static_cast<unsigned char>(*i);
        if (c == '\n') {
            ss << "\\n";
        } else if (c < 0x20 || c >= 0x7f) {
            ss << "\\x" << hexs[(c>>4) & 0xF] << hexs[c & 0x0F];
        } else {
            ss << *i;
        }
    }
    return ss.str();
}

} // end namespace metro

#endif // LIBMETRO_LOGGING_HH
