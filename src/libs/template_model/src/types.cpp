#include <template_model/types.hpp>

namespace template_model {

Margins Margins::clone() const {
    return *this;
}

DocumentStyle DocumentStyle::clone() const {
    DocumentStyle out;
    out.font_family = font_family;
    out.font_size = font_size;
    out.header_color = header_color;
    out.logo_url = logo_url;
    out.page_margins = clone_optional(page_margins);
    return out;
}

bool DocumentStyle::operator==(const DocumentStyle& other) const {
    return font_family == other.font_family
        && font_size == other.font_size
        && header_color == other.header_color
        && logo_url == other.logo_url
        && optional_equal(page_margins, other.page_margins);
}

Section Section::clone() const {
    Section out;
    out.name = name;
    out.content = content;
    out.is_editable = is_editable;
    out.placeholders.assign(placeholders.begin(), placeholders.end());
    return out;
}

ApprovalWorkflow ApprovalWorkflow::clone() const {
    ApprovalWorkflow out;
    out.approvers.assign(approvers.begin(), approvers.end());
    out.required_approvals = required_approvals;
    out.timeout_days = timeout_days;
    return out;
}

} // namespace template_model
