#include "metro/config.hh"
#include "metro/address.hh"
#include "metro/error.hh"
#include "metro/net.hh"
#include <fstream>
#include <sys/stat.h>

namespace metro {

void app_config::configure_glog(const char *name) const {
    FLAGS_logtostderr = false; // turn master switch back off

    FLAGS_minloglevel = glog_min_level;
    FLAGS_stderrthreshold = glog_stderr_level;
    FLAGS_log_dir = glog_dir;
    FLAGS_max_log_size = glog_maxsize;
    FLAGS_v = glog_v;
    FLAGS_vmodule = glog_vmodule;

    // Log only at the requested level (if any).
    // Other levels disabled by setting filename to "" (not null).
    for (int i = 0; i < google::NUM_SEVERITIES; ++i)
        google::SetLogDestination(static_cast<google::LogSeverity>(i), (i == glog_file_level) ? name : "");
    // Ensure sane umask if we know we're writing log files.
    if (glog_file_level >= 0 && glog_file_level < google::NUM_SEVERITIES) {
        const mode_t oldmask = umask(0777);
        umask(oldmask & ~0555);
    }
}

void carbon_config::validate() const {
    const int64_t limit = max_io_timeout.count();
    if (host.empty())
        throw errorx("carbon host is empty");
    if (port == 0)
        throw errorx("carbon port must not be 0");
    if (interval_sec <= 0 || interval_sec > limit)
        throw_stream() << "carbon interval out of range: " << interval_sec << "s" << endx;
    if (connect_timeout_ms <= 0 || connect_timeout_ms > limit)
        throw_stream() << "carbon connect timeout out of range: " << connect_timeout_ms << "ms" << endx;
    if (send_timeout_ms <= 0 || send_timeout_ms > limit)
        throw_stream() << "carbon send timeout out of range: " << send_timeout_ms << "ms" << endx;
}

options::options(const char *appname, app_config &a, carbon_config &c)
    : generic("Generic options"),
      configuration("Configuration"),
      visible("Allowed options"),
      _app(a),
      _carbon(c)
{
    generic.add_options()
        ("version,v", "Show version")
        ("help", "Show help message")
        ;

    std::string conffile(appname);
    conffile += ".conf";
    configuration.add_options()
        ("config", po::value(&a.config_path)->default_value(conffile), "config file path")
        ("glog-min", po::value(&a.glog_min_level)->default_value(0), "ignore log messages below this level")
        ("glog-stderr", po::value(&a.glog_stderr_level)->default_value(0), "log to stderr at or above this level")
        ("glog-file", po::value(&a.glog_file_level)->default_value(-1), "log to file at or above this level (if nonnegative)")
        ("glog-dir", po::value(&a.glog_dir)->default_value(""), "write log files to this directory")
        ("glog-maxsize", po::value(&a.glog_maxsize)->default_value(1800), "max log size (in MB)")
        ("glog-v", po::value(&a.glog_v)->default_value(0), "log vlog messages at or below this value")
        ("glog-vmodule", po::value(&a.glog_vmodule), "comma separated <module>=<level>. overides glog-v")
        ("carbon,C", po::value(&c.carbon_address), "carbon collector host:port, overrides carbon-host and carbon-port")
        ("carbon-host", po::value(&c.host)->default_value("127.0.0.1"), "carbon collector host")
        ("carbon-port", po::value(&c.port)->default_value(2003), "carbon collector plaintext port")
        ("carbon-prefix", po::value(&c.prefix)->default_value(""), "prefix for every metric path")
        ("carbon-interval", po::value(&c.interval_sec)->default_value(60), "seconds between reports")
        ("carbon-connect-timeout", po::value(&c.connect_timeout_ms)->default_value(1000), "connect timeout (ms)")
        ("carbon-send-timeout", po::value(&c.send_timeout_ms)->default_value(1000), "send timeout (ms)")
        ;

    visible.add(generic).add(configuration);
}

bool options::parse(int argc, const char *const argv[]) {
    try {
        po::store(po::command_line_parser(argc, argv).options(visible).run(), vm);
        if (vm.count("help") || vm.count("version")) {
            po::notify(vm);
            return false;
        }
        // command line wins; config file only fills in what is missing
        const auto &path = vm["config"].as<std::string>();
        std::ifstream cf(path);
        if (cf) {
            VLOG(1) << "reading config file " << path;
            po::store(po::parse_config_file(cf, configuration), vm);
        } else if (!vm["config"].defaulted()) {
            throw errorx("cannot open config file: %s", path.c_str());
        }
        po::notify(vm);
    } catch (po::error &e) {
        throw errorx("%s", e.what());
    }

    if (!_carbon.carbon_address.empty()) {
        std::string host = _carbon.carbon_address;
        uint16_t port = _carbon.port;
        parse_host_port(host, port);
        _carbon.host = host;
        _carbon.port = port;
    }
    _carbon.validate();
    return true;
}

void options::showhelp(std::ostream &os) const {
    os << visible << std::endl;
}

std::unique_ptr<carbon_reporter> make_carbon_reporter(const carbon_config &c,
        std::shared_ptr<const registry> reg,
        std::shared_ptr<const clock> clk)
{
    c.validate();
    std::unique_ptr<line_sender> sender{new carbon_sender(c.host, c.port,
            io_timeout{c.connect_timeout_ms}, io_timeout{c.send_timeout_ms})};
    return std::unique_ptr<carbon_reporter>{new carbon_reporter(std::move(reg),
            std::move(sender), c.prefix, std::chrono::seconds{c.interval_sec}, std::move(clk))};
}

} // end namespace metro
