#pragma once
#include <map>
#include <string>

namespace tandem {

// Per-symbol setting with a fallback for symbols not listed explicitly.
template <typename T>
struct SymbolMap {
    T fallback{};
    std::map<std::string, T> overrides;

    SymbolMap() = default;
    explicit SymbolMap(T def) : fallback(def) {}

    const T& get(const std::string& symbol) const {
        auto it = overrides.find(symbol);
        return it == overrides.end() ? fallback : it->second;
    }

    void set(const std::string& symbol, T value) { overrides[symbol] = value; }
};

}
