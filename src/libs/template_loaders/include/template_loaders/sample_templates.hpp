#pragma once

#include <template_model/document_template.hpp>
#include <string>

namespace template_loaders {

// Service contract master: three editable clauses, two-approver workflow.
template_model::DocumentTemplate build_service_contract_template(const std::string& last_revision);

// Derived from `base` by cloning: retitled, tagged "consultoria", first clause rewritten.
template_model::DocumentTemplate build_consulting_contract_template(const template_model::DocumentTemplate& base);

} // namespace template_loaders
