#pragma once

#include <template_model/cloneable.hpp>
#include <memory>
#include <string>
#include <vector>

namespace template_model {

struct Margins {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;

    Margins clone() const;
    bool operator==(const Margins&) const = default;
};

struct DocumentStyle {
    std::string font_family;
    int font_size = 0;
    std::string header_color;
    std::string logo_url;
    // nullptr = no margins configured
    std::unique_ptr<Margins> page_margins;

    DocumentStyle clone() const;
    bool operator==(const DocumentStyle& other) const;
};

struct Section {
    std::string name;
    std::string content;
    bool is_editable = false;
    // Substitution order.
    std::vector<std::string> placeholders;

    Section clone() const;
    bool operator==(const Section&) const = default;
};

struct ApprovalWorkflow {
    // Priority order; duplicates allowed.
    std::vector<std::string> approvers;
    // Not checked against approvers.size().
    int required_approvals = 0;
    int timeout_days = 0;

    ApprovalWorkflow clone() const;
    bool operator==(const ApprovalWorkflow&) const = default;
};

static_assert(Cloneable<Margins>);
static_assert(Cloneable<DocumentStyle>);
static_assert(Cloneable<Section>);
static_assert(Cloneable<ApprovalWorkflow>);

} // namespace template_model
