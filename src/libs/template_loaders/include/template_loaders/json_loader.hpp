#pragma once

#include <template_model/document_template.hpp>
#include <optional>
#include <istream>
#include <string>
#include <vector>

namespace template_loaders {

struct NamedTemplate {
    std::string name;
    template_model::DocumentTemplate master;
    // Empty unless the entry was derived from an earlier one.
    std::string derived_from;
};

// Entries are returned in file order. An entry with "derive_from" starts as a
// clone of the named earlier entry and only overrides the keys it carries.
// Integer values that do not fit in an int make the whole document invalid.
std::optional<std::vector<NamedTemplate>> load_templates_from_json(std::istream& in);
std::optional<std::vector<NamedTemplate>> load_templates_from_json_file(const std::string& path);

} // namespace template_loaders
