// product_registry.h
// MIT License (c) 2026 Pedro

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mockup_config.h"

namespace mockforge::core {

using PresetFactory = std::function<PresetBuilder()>;

// Product-type tag -> preset factory. Types are registered explicitly.
class ProductRegistry {
public:
    static ProductRegistry with_builtin_types();

    // False when the tag is empty or already registered.
    bool register_type(const std::string& tag, PresetFactory factory);

    bool contains(const std::string& tag) const;
    std::optional<PresetBuilder> create(const std::string& tag) const;
    std::vector<std::string> tags() const;

private:
    std::map<std::string, PresetFactory> factories_;
};

} // namespace mockforge::core
