// Template registry demo: builds or loads master templates, hands out clones (C++20)
#include <template_service/document_service.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--templates <file.json>] [--clones <n>] [--log-file <path>] [--verbose]\n", argv0);
}

// Redirects the default logger to `path`; keeps the console logger if the file can't be opened.
void install_file_logger(const std::string& path, spdlog::level::level_enum level) {
    try {
        const std::filesystem::path log_file(path);
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        auto logger = spdlog::basic_logger_mt("template_demo", log_file.string(), true);
        logger->set_level(level);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("File logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex& e) {
        (void)fprintf(stderr, "log file %s unavailable (%s), logging to console\n", path.c_str(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        (void)fprintf(stderr, "log file %s unavailable (%s), logging to console\n", path.c_str(), e.what());
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::string templates_path;
    std::string log_file;
    int clone_count = 5;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--templates" && i + 1 < argc) {
            templates_path = argv[++i];
        } else if (arg == "--clones" && i + 1 < argc) {
            const std::string value(argv[++i]);
            const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), clone_count);
            if (ec != std::errc() || end != value.data() + value.size()) {
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (clone_count < 0) {
        print_usage(argv[0]);
        return 1;
    }

    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
    spdlog::set_level(level);
    if (!log_file.empty())
        install_file_logger(log_file, level);

    template_service::DocumentService service;

    // Built-ins are used only when no template file was read.
    std::optional<std::size_t> loaded;
    if (!templates_path.empty()) {
        loaded = service.load_templates(templates_path);
        if (!loaded) {
            (void)fprintf(stderr, "failed to load templates from %s\n", templates_path.c_str());
            return 1;
        }
    } else {
        const char* default_paths[] = { "data/templates.json", "templates.json" };
        for (const char* path : default_paths) {
            if (!std::filesystem::exists(path)) continue;
            loaded = service.load_templates(path);
            if (loaded) break;
        }
    }
    if (!loaded)
        service.register_builtin_templates();

    if (service.registry().contains("service_contract")) {
        spdlog::info("Creating {} service contracts by cloning...", clone_count);
        std::vector<template_model::DocumentTemplate> contracts;
        for (int i = 1; i <= clone_count; ++i) {
            auto contract = service.create("service_contract");
            contract.title = "Contrato #" + std::to_string(i) + " - Cliente " + std::to_string(i);
            contract.metadata["Cliente"] = "Cliente " + std::to_string(i);
            contracts.push_back(std::move(contract));
        }
        for (const auto& c : contracts)
            spdlog::debug("{} -> Cliente={}", c.title, c.metadata.at("Cliente"));
    }

    for (const auto& name : service.registry().names()) {
        try {
            (void)fprintf(stdout, "\n%s", template_service::describe(service.create(name)).c_str());
        } catch (const template_registry::TemplateNotFoundError& e) {
            (void)fprintf(stderr, "%s\n", e.what());
            return 1;
        }
    }
    return 0;
}
