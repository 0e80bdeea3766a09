#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "control/Coordinator.hpp"
#include "exchange/FeedSession.hpp"
#include "exchange/ReplayFeed.hpp"
#include "exchange/ReplayPacer.hpp"
#include "runtime/Config.hpp"
#include "runtime/Context.hpp"
#include "telemetry/HttpServer.hpp"

using namespace tandem;

static std::atomic<bool>* g_running = nullptr;
static void on_signal(int) {
    if (g_running) g_running->store(false);
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>\n";
        return 2;
    }

    AppConfig cfg;
    try {
        cfg = load_config_file(argv[1]);
    } catch (const ConfigError& e) {
        std::cerr << "[TANDEM] Config error: " << e.what() << "\n";
        return 2;
    }

    Context ctx(cfg);
    g_running = &ctx.running;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[TANDEM] " << cfg.symbols.size() << " symbols, venues "
              << cfg.venues[0] << "/" << cfg.venues[1]
              << ", risk policy " << ctx.risk.policy_name() << "\n";

    ReplayPacer pacer;
    std::vector<std::unique_ptr<ReplayFeed>> feeds;
    std::vector<std::unique_ptr<FeedSession>> sessions;
    try {
        for (const auto& kv : cfg.feeds.replay) {
            feeds.push_back(std::make_unique<ReplayFeed>(kv.first, kv.second, &pacer));
            std::cout << "[FEED] " << kv.first << " replaying " << kv.second << "\n";
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "[TANDEM] " << e.what() << "\n";
        return 1;
    }
    if (feeds.empty())
        std::cerr << "[TANDEM] No feeds configured, waiting for a signal\n";

    for (auto& f : feeds) {
        sessions.push_back(std::make_unique<FeedSession>(
            *f, cfg.symbols, ctx.channel, ctx.telemetry, cfg.feeds.session));
        sessions.back()->start();
    }

    std::thread telemetry_thread;
    if (cfg.telemetry.port > 0) {
        telemetry_thread = std::thread([&ctx, tc = cfg.telemetry] {
            HttpServer server(tc.port, ctx.telemetry, ctx.running,
                              std::chrono::milliseconds(tc.io_timeout_ms));
            server.run();
        });
    }

    Coordinator coord(ctx);
    coord.run([&sessions] {
        if (sessions.empty()) return false;
        for (const auto& s : sessions)
            if (!s->finished()) return false;
        return true;
    });

    coord.publish_metrics(coord.feed_clock());

    for (auto& s : sessions) s->stop();
    pacer.close();
    ctx.shutdown();
    for (auto& s : sessions) s->join();
    if (telemetry_thread.joinable()) telemetry_thread.join();
    g_running = nullptr;

    std::cout << "[TANDEM] Final snapshot\n" << ctx.telemetry.to_json() << "\n";
    return 0;
}
