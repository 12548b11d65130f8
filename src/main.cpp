#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <atomic>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <signal.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "node/index_node.hpp"

using namespace std::chrono_literals;

// 阻塞 SIGINT / SIGTERM，改由 sigwait 同步处理；必须在创建任何线程前调用
static sigset_t block_stop_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    return set;
}

static int run(const Config& config, const sigset_t& stop_signals) {
    IndexNode node(IndexNode::Options::fromConfig(config));
    spdlog::info("Main: {} is running, waiting for SIGINT/SIGTERM", node.options().nodeName);

    int sig = 0;
    if (sigwait(&stop_signals, &sig) != 0) {
        spdlog::error("Main: sigwait failed");
        return 1;
    }
    spdlog::info("Main: received signal {}, graceful stop", sig);

    // drain 期间再收到一次信号则放弃等待
    std::atomic<bool> done{false};
    bool drained = true;
    std::thread stopper([&] {
        drained = node.stop();
        done = true;
    });
    while (!done) {
        timespec ts{0, 200 * 1000 * 1000};
        int again = sigtimedwait(&stop_signals, nullptr, &ts);
        if (again > 0) {
            spdlog::warn("Main: received signal {} again, abort draining", again);
            node.context().cancel();
        }
    }
    stopper.join();

    if (!drained) {
        spdlog::warn("Main: stopped with tasks still in progress");
    }
    return 0;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("taskledger_node", "Task state registry of an index worker node");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config/indexnode.yaml"));

    auto stop_signals = block_stop_signals();
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        Config config(result["config"].as<std::string>());
        initLogging(config);
        return run(config, stop_signals);
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }
}
