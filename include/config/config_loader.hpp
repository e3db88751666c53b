#pragma once

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tokenmeter {

// ============================================================================
// Data Source Config
// ============================================================================

struct DataConfig {
    std::string dir;                    // empty = <home>/.claude/projects
    std::string extension = ".jsonl";
    int64_t threads = 1;
};

// ============================================================================
// Report Config
// ============================================================================

struct ReportConfig {
    int64_t days = 30;
    std::string plan = "pro";
    bool compact = false;
    std::string format = "text";        // text | json
    bool show_blocks = false;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "warn";
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    DataConfig data;
    ReportConfig report;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief <home>/.config/tokenmeter/config.toml
     */
    [[nodiscard]] static std::filesystem::path default_config_path();

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to config.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, collecting every problem found
     * @return Empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static DataConfig extract_data(const toml::table& root);
    static ReportConfig extract_report(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace tokenmeter
