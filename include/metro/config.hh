#ifndef LIBMETRO_CONFIG_HH
#define LIBMETRO_CONFIG_HH

#include <boost/program_options.hpp>
#include <boost/program_options/parsers.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "metro/logging.hh"
#include "metro/carbon_reporter.hh"

namespace metro {

//! inherit application config from this
struct app_config {
    std::string config_path;

    // google glog options
    int glog_min_level;
    int glog_stderr_level;
    int glog_file_level;
    std::string glog_dir;
    int glog_maxsize;
    int glog_v;
    std::string glog_vmodule;

    //! apply the glog options; name is the log file base name
    void configure_glog(const char *name) const;
};

//! where and how often to report
struct carbon_config {
    std::string carbon_address;
    std::string host;
    uint16_t port;
    std::string prefix;
    int64_t interval_sec;
    int64_t connect_timeout_ms;
    int64_t send_timeout_ms;

    //! \throw errorx when a value is out of range
    void validate() const;
};

namespace po = boost::program_options;

//! setup options for programs that report metrics
struct options {
    po::options_description generic;
    po::options_description configuration;
    po::options_description visible;
    po::variables_map vm;

    options(const char *appname, app_config &a, carbon_config &c);

    //! parse the command line, then the config file if there is one
    //! \return false if --help or --version was given
    //! \throw errorx on bad options or values
    bool parse(int argc, const char *const argv[]);

    void showhelp(std::ostream &os = std::cerr) const;

private:
    app_config &_app;
    carbon_config &_carbon;
};

//! build a reporter sending reg to the configured collector
std::unique_ptr<carbon_reporter> make_carbon_reporter(const carbon_config &c,
        std::shared_ptr<const registry> reg,
        std::shared_ptr<const clock> clk = default_clock());

} // end namespace metro

#endif // LIBMETRO_CONFIG_HH
