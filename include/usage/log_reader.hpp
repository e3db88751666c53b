#pragma once

#include "core/error.hpp"
#include "usage/usage_record.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tokenmeter {

/**
 * @brief Outcome of decoding one log line.
 *
 * RECORD       - line decoded and carried a usage block
 * NO_RECORD    - valid JSON, but no usage block; invalid_field is set when a
 *                usage block was present but a field was unusable (bad
 *                timestamp, negative or oversized counter, ...)
 * DECODE_ERROR - not valid JSON
 */
struct LineParseResult {
    enum class Status { RECORD, NO_RECORD, DECODE_ERROR };

    Status status = Status::NO_RECORD;
    bool invalid_field = false;
    std::optional<UsageRecord> record;
    std::string reason;

    static LineParseResult ok(UsageRecord r) {
        LineParseResult result;
        result.status = Status::RECORD;
        result.record = std::move(r);
        return result;
    }

    static LineParseResult none(std::string why) {
        LineParseResult result;
        result.status = Status::NO_RECORD;
        result.reason = std::move(why);
        return result;
    }

    static LineParseResult invalid(std::string why) {
        LineParseResult result = none(std::move(why));
        result.invalid_field = true;
        return result;
    }

    static LineParseResult decode_error(std::string why) {
        LineParseResult result;
        result.status = Status::DECODE_ERROR;
        result.reason = std::move(why);
        return result;
    }

    [[nodiscard]] bool has_record() const { return status == Status::RECORD; }
};

struct ReaderStats {
    uint64_t files_found = 0;
    uint64_t files_read = 0;
    uint64_t files_skipped = 0;
    uint64_t lines_read = 0;
    uint64_t lines_malformed = 0;
    uint64_t lines_without_usage = 0;
    uint64_t lines_invalid = 0;
    uint64_t records = 0;

    void merge(const ReaderStats& other);
};

/**
 * @brief Locates usage log files under a data root and decodes them.
 *
 * Per-line and per-file failures are recovered here and only counted in
 * ReaderStats. The only error surfaced to callers is an inaccessible root.
 */
class LogReader {
public:
    struct Config {
        std::filesystem::path data_root;
        std::string extension = ".jsonl";
        size_t threads = 1;
    };

    struct ReadResult {
        std::vector<UsageRecord> records;   // sorted by timestamp ascending
        ReaderStats stats;
    };

    using RecordCallback = std::function<void(UsageRecord&&)>;

    explicit LogReader(Config config);

    /**
     * @brief <home>/.claude/projects
     */
    [[nodiscard]] static std::filesystem::path default_data_root();

    /**
     * @brief Recursively list files matching the configured extension.
     * @return Empty list if the root does not exist; IO_ERROR if the root
     *         exists but is not a readable directory
     */
    [[nodiscard]] Result<std::vector<std::filesystem::path>> find_log_files() const;

    /**
     * @brief Decode a single JSON line into a usage record.
     */
    [[nodiscard]] static LineParseResult parse_line(std::string_view line);

    /**
     * @brief Stream records from one file in file order.
     * @return false if the file could not be opened (counted as skipped)
     */
    bool read_file(const std::filesystem::path& path,
                   const RecordCallback& on_record,
                   ReaderStats& stats) const;

    /**
     * @brief Read every log file under the root and sort the records.
     */
    [[nodiscard]] Result<ReadResult> read_all() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;

    void read_files(const std::vector<std::filesystem::path>& files,
                    size_t begin, size_t end, ReadResult& out) const;
};

} // namespace tokenmeter
