#include "exchange/FeedMessage.hpp"
#include <cmath>

#include <nlohmann/json.hpp>

using namespace tandem;
using json = nlohmann::json;

namespace {

const json& require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) throw FeedProtocolError(std::string("missing field: ") + key);
    return *it;
}

double require_number(const json& j, const char* key) {
    const json& v = require(j, key);
    if (!v.is_number()) throw FeedProtocolError(std::string("not a number: ") + key);
    const double d = v.get<double>();
    if (!std::isfinite(d)) throw FeedProtocolError(std::string("not finite: ") + key);
    return d;
}

}

FeedMessage FeedMessage::parse(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw FeedProtocolError(std::string("invalid json: ") + e.what());
    }
    if (!j.is_object()) throw FeedProtocolError("message is not an object");

    FeedMessage m;

    const json& symbol = require(j, "symbol");
    if (!symbol.is_string() || symbol.get<std::string>().empty())
        throw FeedProtocolError("symbol must be a non-empty string");
    m.symbol = symbol.get<std::string>();

    const json& side = require(j, "side");
    if (!side.is_string()) throw FeedProtocolError("side must be a string");
    const std::string s = side.get<std::string>();
    if (s == "bid") m.side = BookSide::BID;
    else if (s == "ask") m.side = BookSide::ASK;
    else throw FeedProtocolError("side must be bid or ask, got " + s);

    m.price = require_number(j, "price");
    if (m.price <= 0.0) throw FeedProtocolError("price must be > 0");

    m.quantity = require_number(j, "quantity");
    if (m.quantity < 0.0) throw FeedProtocolError("quantity must be >= 0");

    const json& ts = require(j, "ts");
    if (!ts.is_number_integer()) throw FeedProtocolError("ts must be an integer");
    if (ts.is_number_unsigned()) {
        m.ts_ns = ts.get<uint64_t>();
    } else {
        const int64_t v = ts.get<int64_t>();
        if (v < 0) throw FeedProtocolError("ts must be >= 0");
        m.ts_ns = static_cast<uint64_t>(v);
    }
    return m;
}
