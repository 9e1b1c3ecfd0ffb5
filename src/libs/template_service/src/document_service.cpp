#include <template_service/document_service.hpp>
#include <template_loaders/json_loader.hpp>
#include <template_loaders/sample_templates.hpp>
#include <spdlog/spdlog.h>
#include <ctime>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

namespace template_service {

namespace {

std::string current_timestamp() {
    std::time_t now = std::time(nullptr);
    const std::tm* local = std::localtime(&now);
    if (!local) return {};
    char buf[32] = {};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", local);
    return buf;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

void log_derivation(const std::string& name, const std::string& base_name,
    const template_model::DocumentTemplate& derived, const template_model::DocumentTemplate& base)
{
    spdlog::debug("template '{}' {} '{}'", name, derived == base ? "is identical to" : "differs from", base_name);
}

} // namespace

DocumentService::DocumentService() = default;

void DocumentService::register_builtin_templates() {
    spdlog::info("Building base service contract template...");
    auto service_contract = template_loaders::build_service_contract_template(current_timestamp());
    auto consulting_contract = template_loaders::build_consulting_contract_template(service_contract);
    log_derivation("consulting_contract", "service_contract", consulting_contract, service_contract);
    registry_.register_template("service_contract", std::move(service_contract));
    registry_.register_template("consulting_contract", std::move(consulting_contract));
}

std::optional<std::size_t> DocumentService::load_templates(const std::string& path) {
    auto loaded = template_loaders::load_templates_from_json_file(path);
    if (!loaded) {
        spdlog::warn("Could not load templates from {}", path);
        return std::nullopt;
    }

    // Bases precede their derivations, so the latest earlier entry is the one cloned.
    for (std::size_t i = 0; i < loaded->size(); ++i) {
        const auto& entry = (*loaded)[i];
        if (entry.derived_from.empty()) continue;
        for (std::size_t b = i; b-- > 0;) {
            if ((*loaded)[b].name != entry.derived_from) continue;
            log_derivation(entry.name, entry.derived_from, entry.master, (*loaded)[b].master);
            break;
        }
    }

    std::unordered_set<std::string> names;
    for (auto& entry : *loaded) {
        names.insert(entry.name);
        registry_.register_template(entry.name, std::move(entry.master));
    }
    spdlog::info("Loaded {} template(s) from {}", names.size(), path);
    return names.size();
}

std::string describe(const template_model::DocumentTemplate& tpl) {
    std::ostringstream out;
    out << "=== " << tpl.title << " ===\n";
    out << "Category: " << tpl.category << "\n";
    out << "Sections: " << tpl.sections.size() << "\n";
    out << "Required fields: " << join(tpl.required_fields, ", ") << "\n";
    out << "Approvers: " << (tpl.workflow ? join(tpl.workflow->approvers, ", ") : std::string("(none)")) << "\n";
    return out.str();
}

} // namespace template_service
