#include <template_loaders/sample_templates.hpp>
#include <initializer_list>
#include <memory>

namespace template_loaders {

template_model::DocumentTemplate build_service_contract_template(const std::string& last_revision) {
    template_model::DocumentTemplate out;
    out.title = "Contrato de Prestação de Serviços";
    out.category = "Contratos";

    auto margins = std::make_unique<template_model::Margins>();
    margins->top = 2;
    margins->bottom = 2;
    margins->left = 3;
    margins->right = 3;

    out.style = std::make_unique<template_model::DocumentStyle>();
    out.style->font_family = "Arial";
    out.style->font_size = 12;
    out.style->header_color = "#003366";
    out.style->logo_url = "https://company.com/logo.png";
    out.style->page_margins = std::move(margins);

    out.workflow = std::make_unique<template_model::ApprovalWorkflow>();
    out.workflow->approvers = { "gerente@empresa.com", "juridico@empresa.com" };
    out.workflow->required_approvals = 2;
    out.workflow->timeout_days = 5;

    auto section = [](const char* name, const char* content, std::initializer_list<std::string> placeholders = {}) {
        template_model::Section s;
        s.name = name;
        s.content = content;
        s.is_editable = true;
        s.placeholders.assign(placeholders.begin(), placeholders.end());
        return s;
    };
    out.sections.push_back(section("Cláusula 1 - Objeto", "O presente contrato tem por objeto..."));
    out.sections.push_back(section("Cláusula 2 - Prazo", "O prazo de vigência será de..."));
    out.sections.push_back(section("Cláusula 3 - Valor", "O valor total do contrato é de..."));

    out.required_fields = { "NomeCliente", "CPF", "Endereco" };
    out.tags = { "contrato", "servicos" };
    out.metadata = {
        { "Versao", "1.0" },
        { "Departamento", "Comercial" },
        { "UltimaRevisao", last_revision },
    };
    return out;
}

template_model::DocumentTemplate build_consulting_contract_template(const template_model::DocumentTemplate& base) {
    template_model::DocumentTemplate out = base.clone();
    out.title = "Contrato de Consultoria";
    out.tags.push_back("consultoria");
    if (!out.sections.empty())
        out.sections[0].content = "O presente contrato de consultoria tem por objeto...";
    return out;
}

} // namespace template_loaders
