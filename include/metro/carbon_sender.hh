#ifndef LIBMETRO_CARBON_SENDER_HH
#define LIBMETRO_CARBON_SENDER_HH

#include "metro/carbon.hh"
#include "metro/net.hh"
#include <cstdint>
#include <string>

namespace metro {

//! pure-virtual destination for batches of carbon lines
//
//! send() either delivers the whole batch or throws. it never retries;
//! the caller decides what happens to a batch that failed.
class line_sender {
public:
    virtual ~line_sender() {}

    virtual void send(const carbon_batch &lines, int64_t timestamp) = 0;
    virtual void close() = 0;
    virtual bool connected() const = 0;
};

//! writes batches to a carbon collector over one tcp connection
//
//! connects lazily on the first send. any connect or write failure closes
//! the connection and throws; the next send dials again. not thread-safe,
//! it is meant to have a single owner.
class carbon_sender : public line_sender {
private:
    std::string _host;
    uint16_t _port;
    io_timeout _connect_timeout;
    io_timeout _send_timeout;
    socket_fd _sock;
    std::string _last_error;
    uint64_t _connects = 0;
    uint64_t _failures = 0;

    bool peer_closed();
    void ensure_connected();
    void fail(const std::string &what);

public:
    //! \throw errorx on an empty host, port 0, or a timeout outside (0, max_io_timeout]
    carbon_sender(std::string host, uint16_t port,
            io_timeout connect_timeout = io_timeout{1000},
            io_timeout send_timeout = io_timeout{1000});
    ~carbon_sender() override;

    carbon_sender(const carbon_sender &) = delete;
    carbon_sender &operator = (const carbon_sender &) = delete;

    //! \throw errno_error, hostname_error
    void send(const carbon_batch &lines, int64_t timestamp) override;

    void close() override;

    bool connected() const override { return _sock.valid(); }

    const std::string &host() const { return _host; }
    uint16_t port() const { return _port; }

    //! successful connection attempts
    uint64_t connects() const { return _connects; }
    //! sends that threw
    uint64_t failures() const { return _failures; }
    //! what() of the most recent failure, empty if there never was one
    const std::string &last_error() const { return _last_error; }
};

} // end namespace metro

#endif
