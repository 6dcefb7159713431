#include "gtest/gtest.h"
#include "metro/config.hh"
#include "metro/error.hh"
#include <cstdio>
#include <sstream>
#include <unistd.h>
#include <vector>

using namespace metro;

namespace {

struct parsed {
    app_config app;
    carbon_config carbon;
    options opts{"metro-test", app, carbon};

    bool parse(std::vector<const char *> args) {
        args.insert(args.begin(), "metro-test");
        return opts.parse(static_cast<int>(args.size()), args.data());
    }
};

struct temp_file {
    std::string path;

    explicit temp_file(const std::string &content) {
        char tmpl[] = "/tmp/metro-conf-XXXXXX";
        int fd = mkstemp(tmpl);
        throw_if(fd == -1);
        path = tmpl;
        ssize_t nw = ::write(fd, content.data(), content.size());
        ::close(fd);
        throw_if(nw != static_cast<ssize_t>(content.size()));
    }
    ~temp_file() { unlink(path.c_str()); }
};

} // anon namespace

TEST(Config, Defaults) {
    parsed p;
    ASSERT_TRUE(p.parse({}));
    EXPECT_EQ("127.0.0.1", p.carbon.host);
    EXPECT_EQ(2003, p.carbon.port);
    EXPECT_EQ("", p.carbon.prefix);
    EXPECT_EQ(60, p.carbon.interval_sec);
    EXPECT_EQ(1000, p.carbon.connect_timeout_ms);
    EXPECT_EQ(1000, p.carbon.send_timeout_ms);
    EXPECT_EQ(-1, p.app.glog_file_level);
    EXPECT_EQ("metro-test.conf", p.app.config_path);
}

TEST(Config, CarbonAddress) {
    parsed p;
    ASSERT_TRUE(p.parse({"-C", "graphite.example.com:2103", "--carbon-prefix", "web01"}));
    EXPECT_EQ("graphite.example.com", p.carbon.host);
    EXPECT_EQ(2103, p.carbon.port);
    EXPECT_EQ("web01", p.carbon.prefix);
}

TEST(Config, CarbonAddressKeepsPort) {
    parsed p;
    ASSERT_TRUE(p.parse({"--carbon", "10.0.0.7", "--carbon-port", "2004"}));
    EXPECT_EQ("10.0.0.7", p.carbon.host);
    EXPECT_EQ(2004, p.carbon.port);
}

TEST(Config, Invalid) {
    {
        parsed p;
        EXPECT_THROW(p.parse({"--carbon-interval", "0"}), errorx);
    }
    {
        parsed p;
        EXPECT_THROW(p.parse({"--carbon-port", "0"}), errorx);
    }
    {
        parsed p;
        EXPECT_THROW(p.parse({"--carbon-port", "http"}), errorx);
    }
    {
        parsed p;
        EXPECT_THROW(p.parse({"--no-such-option"}), errorx);
    }
    {
        parsed p;
        EXPECT_THROW(p.parse({"--config", "/nonexistent/metro.conf"}), errorx);
    }
}

TEST(Config, TimeoutRange) {
    const std::vector<std::vector<const char *>> bad{
        {"--carbon-send-timeout=-1"},
        {"--carbon-connect-timeout=-1"},
        {"--carbon-send-timeout=0"},
        {"--carbon-connect-timeout=4294967295"},
        {"--carbon-send-timeout=2147483648"},
        {"--carbon-interval=-1"},
        {"--carbon-interval=4294967295"},
    };
    for (const auto &args : bad) {
        parsed p;
        EXPECT_THROW(p.parse(args), errorx) << args[0];
    }

    parsed p;
    ASSERT_TRUE(p.parse({"--carbon-send-timeout=2147483647", "--carbon-connect-timeout=1"}));
    EXPECT_EQ(2147483647, p.carbon.send_timeout_ms);
    EXPECT_EQ(1, p.carbon.connect_timeout_ms);

    // validate() also guards structs filled in by hand
    carbon_config c = p.carbon;
    c.send_timeout_ms = int64_t(1) << 32;
    EXPECT_THROW(c.validate(), errorx);
    c.send_timeout_ms = 1000;
    c.connect_timeout_ms = -5;
    EXPECT_THROW(make_carbon_reporter(c, std::make_shared<registry>()), errorx);
}

TEST(Config, Help) {
    parsed p;
    EXPECT_FALSE(p.parse({"--help"}));
    std::ostringstream ss;
    p.opts.showhelp(ss);
    EXPECT_NE(std::string::npos, ss.str().find("carbon-interval"));
}

TEST(Config, ConfigFile) {
    temp_file f("carbon-host = carbon.internal\n"
            "carbon-prefix = fromfile\n"
            "carbon-interval = 15\n");
    parsed p;
    ASSERT_TRUE(p.parse({"--config", f.path.c_str(), "--carbon-prefix", "fromargs"}));
    EXPECT_EQ("carbon.internal", p.carbon.host);
    EXPECT_EQ("fromargs", p.carbon.prefix);
    EXPECT_EQ(15, p.carbon.interval_sec);
}

TEST(Config, MakeReporter) {
    parsed p;
    ASSERT_TRUE(p.parse({"--carbon-prefix", "svc", "--carbon-interval", "5"}));
    auto reg = std::make_shared<registry>();
    auto rep = make_carbon_reporter(p.carbon, reg);
    ASSERT_TRUE(rep != nullptr);
    EXPECT_EQ(std::chrono::milliseconds{5000}, rep->interval());
    EXPECT_EQ("svc", rep->prefix());
    EXPECT_FALSE(rep->running());

    carbon_config bad = p.carbon;
    bad.host.clear();
    EXPECT_THROW(make_carbon_reporter(bad, reg), errorx);
}
