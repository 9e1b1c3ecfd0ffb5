#pragma once

#include <template_model/types.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace template_model {

// Every nested entity and collection element is owned by this instance.
// The type is move-only; clone() is the only way to duplicate it.
struct DocumentTemplate {
    std::string title;
    std::string category;
    std::vector<Section> sections;
    std::unique_ptr<DocumentStyle> style;
    std::vector<std::string> required_fields;
    std::map<std::string, std::string> metadata;
    std::unique_ptr<ApprovalWorkflow> workflow;
    std::vector<std::string> tags;

    // When adding a field that holds a mutable sub-object, give it its own
    // clone step in document_template.cpp; plain values are copied as is.
    DocumentTemplate clone() const;
    bool operator==(const DocumentTemplate& other) const;
};

static_assert(Cloneable<DocumentTemplate>);

} // namespace template_model
