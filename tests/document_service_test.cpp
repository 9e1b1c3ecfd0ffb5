#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <template_service/document_service.hpp>

using template_service::DocumentService;

namespace {

std::string write_temp_file(const std::string& file_name, const std::string& text) {
    const auto path = std::filesystem::temp_directory_path() / file_name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

// Routes the default spdlog logger into a string for the lifetime of the object.
class CapturedLog {
public:
    CapturedLog() : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        auto logger = std::make_shared<spdlog::logger>("document_service_test", sink);
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%v");
        spdlog::set_default_logger(logger);
    }
    ~CapturedLog() { spdlog::set_default_logger(previous_); }

    std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> previous_;
};

} // namespace

TEST(DocumentService, BuiltinTemplates) {
    DocumentService service;
    service.register_builtin_templates();

    EXPECT_EQ(service.registry().names(), (std::vector<std::string>{ "consulting_contract", "service_contract" }));

    const auto service_contract = service.create("service_contract");
    EXPECT_EQ(service_contract.title, "Contrato de Prestação de Serviços");
    EXPECT_EQ(service_contract.sections.size(), 3u);
    EXPECT_EQ(service_contract.metadata.count("UltimaRevisao"), 1u);
    EXPECT_EQ(service_contract.style->page_margins->left, 3);

    const auto consulting = service.create("consulting_contract");
    EXPECT_EQ(consulting.title, "Contrato de Consultoria");
    EXPECT_EQ(consulting.tags.back(), "consultoria");
    EXPECT_EQ(consulting.sections[0].content, "O presente contrato de consultoria tem por objeto...");
    EXPECT_EQ(consulting.category, service_contract.category);
}

TEST(DocumentService, DerivationDoesNotLeakIntoServiceContract) {
    DocumentService service;
    service.register_builtin_templates();

    const auto original = service.create("service_contract");
    EXPECT_EQ(original.tags, (std::vector<std::string>{ "contrato", "servicos" }));
    EXPECT_EQ(original.sections[0].content, "O presente contrato tem por objeto...");
}

TEST(DocumentService, CreateUnknownThrows) {
    DocumentService service;
    EXPECT_THROW((void)service.create("nonexistent"), template_registry::TemplateNotFoundError);
}

TEST(DocumentService, LoadTemplatesFromFile) {
    DocumentService service;
    const auto count = service.load_templates(std::string(TEMPLATE_REGISTRY_DATA_DIR) + "/templates.json");
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 3u);
    EXPECT_TRUE(service.registry().contains("nda_mutual"));
    EXPECT_EQ(service.create("nda_mutual").title, "Acordo de Confidencialidade Mútuo");
    EXPECT_FALSE(service.load_templates("/nonexistent/templates.json"));
    EXPECT_EQ(service.registry().size(), 3u);
}

TEST(DocumentService, LoadTemplatesCountsDistinctNames) {
    DocumentService service;
    const auto path = write_temp_file("template_registry_duplicate_names.json", R"({
        "templates": [ { "name": "memo", "title": "First" }, { "name": "memo", "title": "Second" } ]
    })");
    const auto count = service.load_templates(path);
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 1u);
    EXPECT_EQ(service.registry().size(), 1u);
    EXPECT_EQ(service.create("memo").title, "Second");
}

TEST(DocumentService, LoadEmptyTemplateListSucceeds) {
    DocumentService service;
    const auto count = service.load_templates(write_temp_file("template_registry_empty.json", R"({ "templates": [] })"));
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 0u);
    EXPECT_EQ(service.registry().size(), 0u);
}

TEST(DocumentService, LoadUnparsableFileFails) {
    DocumentService service;
    EXPECT_FALSE(service.load_templates(write_temp_file("template_registry_broken.json", "{ not json")));
}

TEST(DocumentService, BuiltinDerivationIsLogged) {
    CapturedLog log;
    DocumentService service;
    service.register_builtin_templates();
    EXPECT_NE(log.text().find("template 'consulting_contract' differs from 'service_contract'"), std::string::npos);
}

TEST(DocumentService, FileDerivationsAreLogged) {
    CapturedLog log;
    DocumentService service;
    const auto path = write_temp_file("template_registry_derived.json", R"({
        "templates": [
            { "name": "base", "title": "Base", "tags": ["a"] },
            { "name": "copy", "derive_from": "base" },
            { "name": "variant", "derive_from": "base", "title": "Variant" }
        ]
    })");
    ASSERT_TRUE(service.load_templates(path));
    const std::string text = log.text();
    EXPECT_NE(text.find("template 'copy' is identical to 'base'"), std::string::npos);
    EXPECT_NE(text.find("template 'variant' differs from 'base'"), std::string::npos);
}

TEST(DocumentService, DescribeSummarizesTemplate) {
    DocumentService service;
    service.register_builtin_templates();
    const std::string text = template_service::describe(service.create("consulting_contract"));
    EXPECT_NE(text.find("=== Contrato de Consultoria ==="), std::string::npos);
    EXPECT_NE(text.find("Sections: 3"), std::string::npos);
    EXPECT_NE(text.find("Required fields: NomeCliente, CPF, Endereco"), std::string::npos);
    EXPECT_NE(text.find("Approvers: gerente@empresa.com, juridico@empresa.com"), std::string::npos);
}

TEST(DocumentService, DescribeWithoutWorkflow) {
    template_model::DocumentTemplate t;
    t.title = "Memo";
    EXPECT_NE(template_service::describe(t).find("Approvers: (none)"), std::string::npos);
}
