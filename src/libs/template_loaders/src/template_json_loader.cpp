#include <template_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>

namespace template_loaders {

namespace {

std::vector<std::string> parse_strings(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& s : arr)
        if (s.is_string()) out.push_back(s.get<std::string>());
    return out;
}

// Absent or non-integer keys leave `out` alone. Returns false if the value
// does not fit in an int.
bool read_int(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key) || !j[key].is_number_integer()) return true;
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            spdlog::warn("template loader: '{}' out of range: {}", key, u);
            return false;
        }
        out = static_cast<int>(u);
        return true;
    }
    const auto i = v.get<std::int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
        spdlog::warn("template loader: '{}' out of range: {}", key, i);
        return false;
    }
    out = static_cast<int>(i);
    return true;
}

bool apply_margins(const nlohmann::json& m, template_model::Margins& out) {
    return read_int(m, "top", out.top)
        && read_int(m, "bottom", out.bottom)
        && read_int(m, "left", out.left)
        && read_int(m, "right", out.right);
}

bool apply_style(const nlohmann::json& s, template_model::DocumentStyle& out) {
    if (s.contains("font_family") && s["font_family"].is_string()) out.font_family = s["font_family"].get<std::string>();
    if (!read_int(s, "font_size", out.font_size)) return false;
    if (s.contains("header_color") && s["header_color"].is_string()) out.header_color = s["header_color"].get<std::string>();
    if (s.contains("logo_url") && s["logo_url"].is_string()) out.logo_url = s["logo_url"].get<std::string>();
    if (s.contains("page_margins")) {
        const auto& m = s["page_margins"];
        if (m.is_null()) {
            out.page_margins.reset();
        } else if (m.is_object()) {
            if (!out.page_margins) out.page_margins = std::make_unique<template_model::Margins>();
            if (!apply_margins(m, *out.page_margins)) return false;
        }
    }
    return true;
}

bool apply_workflow(const nlohmann::json& w, template_model::ApprovalWorkflow& out) {
    if (w.contains("approvers") && w["approvers"].is_array()) out.approvers = parse_strings(w["approvers"]);
    return read_int(w, "required_approvals", out.required_approvals)
        && read_int(w, "timeout_days", out.timeout_days);
}

template_model::Section parse_section(const nlohmann::json& s) {
    template_model::Section sec;
    sec.name = s.contains("name") && s["name"].is_string() ? s["name"].get<std::string>() : "";
    sec.content = s.contains("content") && s["content"].is_string() ? s["content"].get<std::string>() : "";
    sec.is_editable = s.contains("is_editable") && s["is_editable"].is_boolean() ? s["is_editable"].get<bool>() : false;
    if (s.contains("placeholders") && s["placeholders"].is_array())
        sec.placeholders = parse_strings(s["placeholders"]);
    return sec;
}

// Keys present in `t` override the fields of `out`; absent keys leave them alone.
// Returns false on a value the model cannot hold.
bool apply_template(const nlohmann::json& t, template_model::DocumentTemplate& out) {
    if (t.contains("title") && t["title"].is_string()) out.title = t["title"].get<std::string>();
    if (t.contains("category") && t["category"].is_string()) out.category = t["category"].get<std::string>();

    if (t.contains("sections") && t["sections"].is_array()) {
        out.sections.clear();
        for (const auto& s : t["sections"])
            out.sections.push_back(parse_section(s));
    }
    if (t.contains("style")) {
        const auto& s = t["style"];
        if (s.is_null()) {
            out.style.reset();
        } else if (s.is_object()) {
            if (!out.style) out.style = std::make_unique<template_model::DocumentStyle>();
            if (!apply_style(s, *out.style)) return false;
        }
    }
    if (t.contains("required_fields") && t["required_fields"].is_array())
        out.required_fields = parse_strings(t["required_fields"]);
    // Metadata merges: listed keys are set, other inherited keys stay.
    if (t.contains("metadata") && t["metadata"].is_object()) {
        for (const auto& item : t["metadata"].items())
            if (item.value().is_string()) out.metadata[item.key()] = item.value().get<std::string>();
    }
    if (t.contains("workflow")) {
        const auto& w = t["workflow"];
        if (w.is_null()) {
            out.workflow.reset();
        } else if (w.is_object()) {
            if (!out.workflow) out.workflow = std::make_unique<template_model::ApprovalWorkflow>();
            if (!apply_workflow(w, *out.workflow)) return false;
        }
    }
    if (t.contains("tags") && t["tags"].is_array()) out.tags = parse_strings(t["tags"]);
    return true;
}

std::optional<std::vector<NamedTemplate>> parse_templates_json(const nlohmann::json& j) {
    if (!j.contains("templates") || !j["templates"].is_array()) return std::nullopt;

    std::vector<NamedTemplate> out;
    for (const auto& t : j["templates"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) return std::nullopt;
        NamedTemplate entry;
        entry.name = t["name"].get<std::string>();

        if (t.contains("derive_from") && t["derive_from"].is_string()) {
            entry.derived_from = t["derive_from"].get<std::string>();
            const NamedTemplate* base = nullptr;
            for (const auto& prev : out)
                if (prev.name == entry.derived_from) base = &prev;
            if (!base) {
                spdlog::warn("template loader: '{}' derives from unknown template '{}'", entry.name, entry.derived_from);
                return std::nullopt;
            }
            entry.master = base->master.clone();
        }
        if (!apply_template(t, entry.master)) {
            spdlog::warn("template loader: template '{}' has an out-of-range value", entry.name);
            return std::nullopt;
        }
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace

std::optional<std::vector<NamedTemplate>> load_templates_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_templates_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("template loader: invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<NamedTemplate>> load_templates_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_templates_from_json(f);
}

} // namespace template_loaders
