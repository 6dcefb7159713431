#include "gtest/gtest.h"
#include "metro/meter.hh"
#include "metro/thread_guard.hh"
#include <atomic>
#include <cmath>
#include <limits>
#include <vector>

using namespace metro;

namespace {

// 0 for the first two reads, 10 after that
class scripted_clock : public metro::clock {
    mutable std::atomic<int> _calls{0};
public:
    int64_t now() const override {
        return _calls.fetch_add(1) < 2 ? 0 : 10;
    }
    int calls() const { return _calls.load(); }
};

double decay(int minutes, int ticks) {
    return std::pow(1.0 - ewma::alpha_for(std::chrono::minutes{minutes}), ticks);
}

} // anon namespace

TEST(Meter, Zero) {
    meter m;
    EXPECT_EQ(0u, m.count());
    EXPECT_EQ(0.0, m.mean_rate());
    EXPECT_EQ(0.0, m.m01rate());
    EXPECT_EQ(0.0, m.m05rate());
    EXPECT_EQ(0.0, m.m15rate());
}

TEST(Meter, NoElapsedTime) {
    auto clk = std::make_shared<manual_clock>(1000);
    meter m(clk);
    uint64_t sum = 0;
    for (uint64_t n : {1, 5, 0, 17, 3}) {
        m.mark(n);
        sum += n;
    }
    EXPECT_EQ(sum, m.count());
    EXPECT_EQ(0.0, m.mean_rate());
    EXPECT_EQ(0.0, m.m01rate());
    EXPECT_EQ(0.0, m.m05rate());
    EXPECT_EQ(0.0, m.m15rate());
}

TEST(Meter, NonZero) {
    auto clk = std::make_shared<scripted_clock>();
    meter m(clk);

    m.mark(1);
    m.mark(2);

    EXPECT_EQ(3u, m.count());
    EXPECT_NEAR(0.3, m.mean_rate(), 1e-3);
    EXPECT_NEAR(0.1840, m.m01rate(), 1e-3);
    EXPECT_NEAR(0.1966, m.m05rate(), 1e-3);
    EXPECT_NEAR(0.1988, m.m15rate(), 1e-3);

    // construction, two marks, mean rate and three rate reads
    EXPECT_EQ(7, clk->calls());
}

TEST(Meter, MeanRate) {
    auto clk = std::make_shared<manual_clock>(100);
    meter m(clk);
    m.mark(10);
    EXPECT_EQ(0.0, m.mean_rate());
    clk->advance(5);
    EXPECT_DOUBLE_EQ(2.0, m.mean_rate());
    clk->advance(15);
    EXPECT_DOUBLE_EQ(0.5, m.mean_rate());
}

TEST(Meter, TickBoundary) {
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    m.mark(5);
    // exactly one interval is not enough to tick
    clk->set(5);
    EXPECT_EQ(0.0, m.m01rate());
    clk->set(6);
    EXPECT_DOUBLE_EQ(1.0, m.m01rate());
}

TEST(Meter, CatchUpAligned) {
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    m.mark(5);
    clk->set(23);
    // four ticks owed; the last tick lands on 20
    EXPECT_NEAR(decay(1, 3), m.m01rate(), 1e-12);
    clk->set(25);
    EXPECT_NEAR(decay(1, 3), m.m01rate(), 1e-12);
    clk->set(26);
    EXPECT_NEAR(decay(1, 4), m.m01rate(), 1e-12);
}

TEST(Meter, ConcurrentCatchUp) {
    static const int nthreads = 16;
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    m.mark(5);
    clk->set(23);

    std::atomic<bool> go{false};
    std::atomic<int> ready{0};
    {
        std::vector<thread_guard> threads;
        for (int i = 0; i < nthreads; ++i) {
            threads.emplace_back(std::thread([&] {
                ++ready;
                while (!go.load()) {}
                (void)m.m15rate();
                (void)m.m05rate();
                (void)m.m01rate();
            }));
        }
        while (ready.load() != nthreads) {}
        go.store(true);
    }

    // 23s owes exactly 4 ticks, however many threads noticed
    EXPECT_NEAR(decay(1, 3),  m.m01rate(), 1e-12);
    EXPECT_NEAR(decay(5, 3),  m.m05rate(), 1e-12);
    EXPECT_NEAR(decay(15, 3), m.m15rate(), 1e-12);
}

TEST(Meter, ConcurrentMarks) {
    static const int nthreads = 8;
    static const int nmarks = 5000;
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    {
        std::vector<thread_guard> threads;
        for (int i = 0; i < nthreads; ++i) {
            threads.emplace_back(std::thread([&m, clk, i] {
                for (int n = 0; n < nmarks; ++n) {
                    m.mark(2);
                    if (i == 0 && n % 100 == 0)
                        clk->advance(1);
                }
            }));
        }
    }
    EXPECT_EQ(uint64_t(nthreads) * nmarks * 2, m.count());
    EXPECT_GE(m.m01rate(), 0.0);
}

TEST(Meter, Snapshot) {
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    m.mark();
    m.mark();
    const meter_snapshot s = m.snapshot();
    m.mark();
    EXPECT_EQ(2u, s.count);
    EXPECT_EQ(3u, m.snapshot().count);

    clk->set(10);
    const auto v = m.export_metric();
    const meter_snapshot &e = boost::get<meter_snapshot>(v);
    EXPECT_EQ(3u, e.count);
    EXPECT_DOUBLE_EQ(0.3, e.mean);
    EXPECT_NEAR(0.6 * decay(1, 1), e.m01rate(), 1e-12);
    EXPECT_NEAR(0.6 * decay(5, 1), e.m05rate(), 1e-12);
    EXPECT_NEAR(0.6 * decay(15, 1), e.m15rate(), 1e-12);
}

TEST(Meter, CountWraps) {
    auto clk = std::make_shared<manual_clock>();
    meter m(clk);
    m.mark(std::numeric_limits<meter::count_type>::max());
    m.mark(2);
    EXPECT_EQ(1u, m.count());
}
