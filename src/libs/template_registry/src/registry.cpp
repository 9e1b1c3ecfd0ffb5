#include <template_registry/registry.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace template_registry {

TemplateNotFoundError::TemplateNotFoundError(const std::string& name)
    : std::out_of_range("template not found: " + name), name_(name) {}

TemplateRegistry::TemplateRegistry() = default;

void TemplateRegistry::register_template(const std::string& name, template_model::DocumentTemplate master) {
    const bool replaced = contains(name);
    masters_.insert_or_assign(name, std::move(master));
    spdlog::debug("template registry: {} '{}' ({} entries)", replaced ? "replaced" : "registered", name, masters_.size());
}

template_model::DocumentTemplate TemplateRegistry::create(const std::string& name) const {
    auto it = masters_.find(name);
    if (it == masters_.end()) {
        spdlog::warn("template registry: no master registered under '{}'", name);
        throw TemplateNotFoundError(name);
    }
    spdlog::debug("template registry: cloning '{}'", name);
    return it->second.clone();
}

std::vector<std::string> TemplateRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(masters_.size());
    for (const auto& [name, master] : masters_)
        out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace template_registry
