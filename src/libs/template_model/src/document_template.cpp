#include <template_model/document_template.hpp>

namespace template_model {

DocumentTemplate DocumentTemplate::clone() const {
    DocumentTemplate out;
    out.title = title;
    out.category = category;
    out.sections = clone_each(sections);
    out.style = clone_optional(style);
    out.required_fields.assign(required_fields.begin(), required_fields.end());
    out.metadata = std::map<std::string, std::string>(metadata.begin(), metadata.end());
    out.workflow = clone_optional(workflow);
    out.tags.assign(tags.begin(), tags.end());
    return out;
}

bool DocumentTemplate::operator==(const DocumentTemplate& other) const {
    return title == other.title
        && category == other.category
        && sections == other.sections
        && optional_equal(style, other.style)
        && required_fields == other.required_fields
        && metadata == other.metadata
        && optional_equal(workflow, other.workflow)
        && tags == other.tags;
}

} // namespace template_model
