#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "finops/cost_estimator.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tokenmeter {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

// Substitutes ${NAME} with the environment value (unset -> empty). `key` is
// the dotted TOML path, only used for the error message.
std::string substitute_env(std::string_view value, const std::string& key) {
    std::string out;
    out.reserve(value.size());

    size_t pos = 0;
    for (size_t open = value.find("${"); open != std::string_view::npos;
         open = value.find("${", pos)) {
        const size_t close = value.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution in '{}' at offset {}", key, open));
        }
        out.append(value, pos, open - pos);
        const std::string name(value.substr(open + 2, close - open - 2));
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        } else {
            utils::log::debug(std::format("{}: ${{{}}} is not set, using empty value", key, name));
        }
        pos = close + 1;
    }
    out.append(value, pos);
    return out;
}

void expand_env_in_table(toml::table& tbl, const std::string& prefix) {
    for (auto&& [name, node] : tbl) {
        const std::string key = prefix.empty()
            ? std::string(name.str())
            : prefix + "." + std::string(name.str());
        if (auto* str = node.as_string()) {
            if (str->get().find("${") != std::string::npos) {
                *str = substitute_env(str->get(), key);
            }
        } else if (auto* sub = node.as_table()) {
            expand_env_in_table(*sub, key);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_in_table(result, "");
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_in_table(result, "");
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::filesystem::path ConfigLoader::default_config_path() {
    return utils::home_dir() / ".config" / "tokenmeter" / "config.toml";
}

// ---- Section extractors ----------------------------------------------------

DataConfig ConfigLoader::extract_data(const toml::table& root) {
    DataConfig cfg;
    const auto* data = root["data"].as_table();
    if (!data) return cfg;
    const auto& d = *data;

    cfg.dir = d["dir"].value_or(""s);
    if (!cfg.dir.empty()) {
        cfg.dir = utils::expand_home(cfg.dir).string();
    }
    cfg.extension = d["extension"].value_or(".jsonl"s);
    if (!cfg.extension.empty() && cfg.extension.front() != '.') {
        cfg.extension.insert(cfg.extension.begin(), '.');
    }
    cfg.threads = d["threads"].value_or(int64_t{1});
    return cfg;
}

ReportConfig ConfigLoader::extract_report(const toml::table& root) {
    ReportConfig cfg;
    const auto* report = root["report"].as_table();
    if (!report) return cfg;
    const auto& r = *report;

    cfg.days = r["days"].value_or(int64_t{30});
    cfg.plan = utils::to_lower(r["plan"].value_or("pro"s));
    cfg.compact = r["compact"].value_or(false);
    cfg.format = utils::to_lower(r["format"].value_or("text"s));
    cfg.show_blocks = r["blocks"].value_or(false);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("warn"s);
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.data = extract_data(root);
    config.report = extract_report(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 36500>(config.report.days)) {
        errors.push_back(std::format("report.days must be 1-36500, got {}", config.report.days));
    }

    if (!find_plan(config.report.plan)) {
        std::string names;
        for (const auto& plan : plan_limits()) {
            if (!names.empty()) names += ", ";
            names += plan.name;
        }
        errors.push_back(std::format("report.plan must be one of {}, got '{}'",
                                     names, config.report.plan));
    }

    if (config.report.format != "text" && config.report.format != "json") {
        errors.push_back(std::format("report.format must be text or json, got '{}'",
                                     config.report.format));
    }

    if (!utils::in_range<1, 64>(config.data.threads)) {
        errors.push_back(std::format("data.threads must be 1-64, got {}", config.data.threads));
    }

    if (config.data.extension.size() < 2) {
        errors.push_back("data.extension must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace tokenmeter
