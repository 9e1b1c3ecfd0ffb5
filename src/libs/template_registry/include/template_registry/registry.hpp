#pragma once

#include <template_model/document_template.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace template_registry {

class TemplateNotFoundError : public std::out_of_range {
public:
    explicit TemplateNotFoundError(const std::string& name);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Name-keyed store of master templates. Lookups hand out deep clones; the
// stored masters are never given out or mutated.
// Not synchronized: concurrent callers must guard register_template and
// create with one lock.
class TemplateRegistry {
public:
    TemplateRegistry();

    // Takes ownership of `master` as is; overwrites any entry under `name`.
    void register_template(const std::string& name, template_model::DocumentTemplate master);

    // Throws TemplateNotFoundError if nothing is registered under `name`.
    template_model::DocumentTemplate create(const std::string& name) const;

    bool contains(const std::string& name) const { return masters_.count(name) != 0; }
    std::size_t size() const { return masters_.size(); }
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, template_model::DocumentTemplate> masters_;
};

} // namespace template_registry
