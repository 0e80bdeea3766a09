#include "runtime/Context.hpp"
#include <iostream>
#include <utility>

using namespace tandem;

Context::Context(AppConfig cfg)
    : Context(std::move(cfg), nullptr) {}

Context::Context(AppConfig cfg, OrderAdapter& orders)
    : Context(std::move(cfg), &orders) {}

Context::Context(AppConfig cfg, OrderAdapter* external)
    : config(std::move(cfg))
    , books(config.book.staleness_ns)
    , fees(config.fees)
    , risk(config.risk)
    , channel(config.trade.channel_capacity)
    , pool(config.trade.workers)
    , paper(external ? std::unique_ptr<PaperOrderAdapter>()
                     : std::make_unique<PaperOrderAdapter>(books, config.book.depth_levels))
    , orders(external ? *external : *paper)
    , execution(config.execution, orders, telemetry) {}

Context::~Context() {
    shutdown();
}

void Context::shutdown() {
    if (shut_down_.exchange(true)) return;
    running.store(false);
    channel.close();
    pool.join();
    std::cout << "[TANDEM] Context shut down\n";
}
