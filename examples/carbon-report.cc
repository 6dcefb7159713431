#include "metro/config.hh"
#include "metro/counter.hh"
#include "metro/gauge.hh"
#include "metro/meter.hh"
#include "metro/registry.hh"
#include "metro/thread_guard.hh"

#include <atomic>
#include <random>
#include <signal.h>
#include <vector>

using namespace metro;

static app_config aconf;
static carbon_config cconf;

static void worker(std::atomic<bool> &done, std::shared_ptr<meter> requests,
        std::shared_ptr<counter> in_flight, unsigned seed)
{
    std::minstd_rand eng{seed};
    std::uniform_int_distribution<int> pause_ms{1, 50};
    while (!done.load()) {
        in_flight->inc();
        requests->mark();
        std::this_thread::sleep_for(std::chrono::milliseconds{pause_ms(eng)});
        in_flight->dec();
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    options opts(program_invocation_short_name, aconf, cconf);
    try {
        if (!opts.parse(argc, argv)) {
            if (opts.vm.count("version"))
                std::cout << "carbon-report 0.1.0" << std::endl;
            else
                opts.showhelp(std::cout);
            return 0;
        }
    } catch (errorx &e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        opts.showhelp();
        return 1;
    }
    aconf.configure_glog(program_invocation_short_name);

    // every thread started below inherits the mask, so only sigwait sees these
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    auto reg = std::make_shared<registry>();
    auto requests = reg->insert_new<meter>("requests");
    auto in_flight = reg->insert_new<counter>("in_flight");
    auto workers_gauge = reg->insert_new<gauge>("workers");

    const unsigned nworkers = 4;
    workers_gauge->set(nworkers);

    std::unique_ptr<carbon_reporter> rep;
    try {
        rep = make_carbon_reporter(cconf, reg);
    } catch (errorx &e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    rep->start();

    std::atomic<bool> done{false};
    {
        std::vector<thread_guard> threads;
        for (unsigned n = 0; n < nworkers; ++n)
            threads.emplace_back(std::thread(worker, std::ref(done), requests, in_flight, n + 1));

        int sig = 0;
        sigwait(&sigs, &sig);
        LOG(INFO) << "caught signal " << sig << ", shutting down";
        done.store(true);
    }

    rep->stop();
    LOG(INFO) << "sent " << rep->batches_sent() << " batches, "
        << rep->batches_failed() << " failed; "
        << requests->count() << " requests at " << requests->m01rate() << "/s";
    return 0;
}
