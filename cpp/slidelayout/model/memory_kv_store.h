#pragma once

#include "slidelayout/host/host_api.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace slidelayout::model {

class MemoryKeyValueStore final : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) const override {
        const auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override { values_[key] = value; }
    void remove(const std::string& key) override { values_.erase(key); }

private:
    std::unordered_map<std::string, std::string> values_;
};

} // namespace slidelayout::model
