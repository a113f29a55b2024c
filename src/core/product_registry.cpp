// product_registry.cpp
// MIT License (c) 2026 Pedro

#include "product_registry.h"

#include <utility>

namespace mockforge::core {

ProductRegistry ProductRegistry::with_builtin_types() {
    ProductRegistry registry;
    registry.register_type("clipart", &PresetBuilder::clipart_defaults);
    registry.register_type("pattern", &PresetBuilder::pattern_defaults);
    registry.register_type("border_clipart", &PresetBuilder::border_clipart_defaults);
    return registry;
}

bool ProductRegistry::register_type(const std::string& tag, PresetFactory factory) {
    if (tag.empty() || !factory) {
        return false;
    }
    return factories_.emplace(tag, std::move(factory)).second;
}

bool ProductRegistry::contains(const std::string& tag) const {
    return factories_.find(tag) != factories_.end();
}

std::optional<PresetBuilder> ProductRegistry::create(const std::string& tag) const {
    auto it = factories_.find(tag);
    if (it == factories_.end()) {
        return std::nullopt;
    }
    return it->second();
}

std::vector<std::string> ProductRegistry::tags() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [tag, factory] : factories_) {
        out.push_back(tag);
    }
    return out;
}

} // namespace mockforge::core
