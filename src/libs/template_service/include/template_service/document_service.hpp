#pragma once

#include <template_model/document_template.hpp>
#include <template_registry/registry.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace template_service {

class DocumentService {
public:
    DocumentService();

    // Registers "service_contract" and "consulting_contract" (derived from the former).
    void register_builtin_templates();
    // Registers every template in a JSON file. Returns the number of distinct
    // names registered, or nullopt if the file could not be read or parsed.
    // Derivations are logged at debug level as identical to or differing from their base.
    std::optional<std::size_t> load_templates(const std::string& path);

    template_model::DocumentTemplate create(const std::string& name) const { return registry_.create(name); }

    template_registry::TemplateRegistry& registry() { return registry_; }
    const template_registry::TemplateRegistry& registry() const { return registry_; }

private:
    template_registry::TemplateRegistry registry_;
};

// Multi-line summary: title, category, section count, required fields, approvers.
std::string describe(const template_model::DocumentTemplate& tpl);

} // namespace template_service
