#include <catch2/catch_test_macros.hpp>
#include "usage/log_reader.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace tokenmeter;
using namespace std::chrono;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    explicit TmpDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() /
               ("tokenmeter_test_" + name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::filesystem::path file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p);
        f << content;
        return p;
    }
};

std::string usage_line(const std::string& ts, const std::string& session,
                       const std::string& model, int input, int output) {
    return R"({"timestamp":")" + ts + R"(","sessionId":")" + session +
           R"(","message":{"model":")" + model +
           R"(","usage":{"input_tokens":)" + std::to_string(input) +
           R"(,"output_tokens":)" + std::to_string(output) +
           R"(,"cache_creation_input_tokens":0,"cache_read_input_tokens":0}}})";
}

} // namespace

TEST_CASE("LogReader: full record decodes", "[reader][parse]") {
    const auto result = LogReader::parse_line(R"({
        "timestamp": "2025-01-15T10:30:00Z",
        "sessionId": "abc-123",
        "type": "assistant",
        "message": {
            "model": "claude-sonnet-4-5-20250929",
            "usage": {
                "input_tokens": 100,
                "output_tokens": 250,
                "cache_creation_input_tokens": 30,
                "cache_read_input_tokens": 4000
            }
        }
    })");

    REQUIRE(result.has_record());
    const auto& r = *result.record;
    CHECK(r.timestamp == sys_days{year{2025} / 1 / 15} + hours(10) + minutes(30));
    CHECK(r.session_id == "abc-123");
    CHECK(r.model == "claude-sonnet-4-5-20250929");
    CHECK(r.usage.input_tokens == 100);
    CHECK(r.usage.output_tokens == 250);
    CHECK(r.usage.cache_creation_input_tokens == 30);
    CHECK(r.usage.cache_read_input_tokens == 4000);
    CHECK(r.usage.total_tokens() == 4380);
}

TEST_CASE("LogReader: empty or missing usage yields no record", "[reader][parse]") {
    using Status = LineParseResult::Status;

    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"model":"m","usage":{}}})").status
        == Status::NO_RECORD);
    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"model":"m"}})").status
        == Status::NO_RECORD);
    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","type":"user"})").status
        == Status::NO_RECORD);
    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":"text"})").status
        == Status::NO_RECORD);
}

TEST_CASE("LogReader: invalid JSON is a decode error", "[reader][parse]") {
    const auto result = LogReader::parse_line(R"({"timestamp": "2025-01-15T10:30:00Z", )");
    CHECK(result.status == LineParseResult::Status::DECODE_ERROR);
    CHECK_FALSE(result.record.has_value());
    CHECK_FALSE(result.reason.empty());
}

TEST_CASE("LogReader: structurally invalid records are skipped", "[reader][parse]") {
    using Status = LineParseResult::Status;

    // Unparseable timestamp
    CHECK(LogReader::parse_line(
        R"({"timestamp":"yesterday","message":{"usage":{"input_tokens":1}}})").status
        == Status::NO_RECORD);
    // Missing timestamp
    CHECK(LogReader::parse_line(
        R"({"message":{"usage":{"input_tokens":1}}})").status
        == Status::NO_RECORD);
    // Negative counter
    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"usage":{"input_tokens":-5}}})").status
        == Status::NO_RECORD);
    // Counter of the wrong type
    CHECK(LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"usage":{"input_tokens":"12"}}})").status
        == Status::NO_RECORD);
    // Top-level array
    CHECK(LogReader::parse_line("[1, 2, 3]").status == Status::NO_RECORD);
}

TEST_CASE("LogReader: oversized counters are invalid, not wrapped", "[reader][parse]") {
    const auto huge = LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"usage":{"input_tokens":18446744073709551615}}})");
    CHECK(huge.status == LineParseResult::Status::NO_RECORD);
    CHECK(huge.invalid_field);

    const auto at_limit = LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"usage":{"output_tokens":1000000000000}}})");
    REQUIRE(at_limit.has_record());
    CHECK(at_limit.record->usage.output_tokens == kMaxTokenCount);
}

TEST_CASE("LogReader: invalid fields are told apart from missing usage", "[reader][parse]") {
    const auto no_usage = LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"model":"m"}})");
    CHECK(no_usage.status == LineParseResult::Status::NO_RECORD);
    CHECK_FALSE(no_usage.invalid_field);

    const auto bad_session = LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","sessionId":42,"message":{"usage":{"input_tokens":1}}})");
    CHECK(bad_session.status == LineParseResult::Status::NO_RECORD);
    CHECK(bad_session.invalid_field);
}

TEST_CASE("LogReader: absent session and model fall back to sentinels", "[reader][parse]") {
    const auto result = LogReader::parse_line(
        R"({"timestamp":"2025-01-15T10:30:00Z","message":{"usage":{"output_tokens":7}}})");
    REQUIRE(result.has_record());
    CHECK(result.record->session_id == "unknown");
    CHECK(result.record->model == "unknown");
    CHECK(result.record->usage.input_tokens == 0);
    CHECK(result.record->usage.output_tokens == 7);
}

TEST_CASE("LogReader: missing data root is an empty result", "[reader][files]") {
    LogReader::Config cfg;
    cfg.data_root = std::filesystem::temp_directory_path() / "tokenmeter_does_not_exist_xyz";
    LogReader reader(cfg);

    const auto files = reader.find_log_files();
    REQUIRE(files.is_ok());
    CHECK(files.value().empty());

    const auto all = reader.read_all();
    REQUIRE(all.is_ok());
    CHECK(all.value().records.empty());
    CHECK(all.value().stats.files_found == 0);
}

TEST_CASE("LogReader: data root that is a file is an I/O error", "[reader][files]") {
    TmpDir tmp("root_is_file");
    const auto file = tmp.file("not_a_dir.jsonl", "");

    LogReader::Config cfg;
    cfg.data_root = file;
    LogReader reader(cfg);

    const auto result = reader.read_all();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    CHECK(result.describe().starts_with("I/O error: "));
}

TEST_CASE("LogReader: unreadable data root is an I/O error", "[reader][files]") {
    TmpDir tmp("unreadable_root");
    tmp.file("proj/a.jsonl",
        usage_line("2025-01-15T12:00:00Z", "s1", "claude-3-5-haiku-20241022", 1, 1) + "\n");
    ::chmod(tmp.path.c_str(), 0);

    // Privileged users can still list the directory; nothing to check then
    if (::access(tmp.path.c_str(), R_OK) == 0) {
        ::chmod(tmp.path.c_str(), 0700);
        WARN("data root still readable after chmod 000, skipping");
        return;
    }

    LogReader::Config cfg;
    cfg.data_root = tmp.path;
    LogReader reader(cfg);

    const auto files = reader.find_log_files();
    const auto all = reader.read_all();
    ::chmod(tmp.path.c_str(), 0700);

    REQUIRE(files.is_error());
    CHECK(files.error_category() == ErrorCategory::IO_ERROR);
    CHECK(files.error_message().find("Cannot read data directory") != std::string::npos);
    REQUIRE(all.is_error());
    CHECK(all.error_category() == ErrorCategory::IO_ERROR);
}

TEST_CASE("LogReader: empty directory has no files", "[reader][files]") {
    TmpDir tmp("empty_dir");
    LogReader::Config cfg;
    cfg.data_root = tmp.path;
    LogReader reader(cfg);

    const auto files = reader.find_log_files();
    REQUIRE(files.is_ok());
    CHECK(files.value().empty());
}

TEST_CASE("LogReader: recursive discovery matches extension only", "[reader][files]") {
    TmpDir tmp("discovery");
    tmp.file("a.jsonl", "");
    tmp.file("project-one/b.jsonl", "");
    tmp.file("project-one/deep/c.jsonl", "");
    tmp.file("project-one/notes.txt", "");
    tmp.file("d.json", "");

    LogReader::Config cfg;
    cfg.data_root = tmp.path;
    LogReader reader(cfg);

    const auto files = reader.find_log_files();
    REQUIRE(files.is_ok());
    CHECK(files.value().size() == 3);
    for (const auto& f : files.value()) {
        CHECK(f.extension() == ".jsonl");
    }
}

TEST_CASE("LogReader: malformed lines skipped and records sorted", "[reader][files]") {
    TmpDir tmp("malformed");
    tmp.file("p1/session-a.jsonl",
        usage_line("2025-01-15T12:00:00Z", "s1", "claude-3-5-haiku-20241022", 10, 20) + "\n" +
        "this is not json\n" +
        "\n" +
        "   \n" +
        R"({"timestamp":"2025-01-15T12:01:00Z","type":"user","message":{"role":"user"}})" + "\n" +
        R"({"timestamp":"noon","message":{"usage":{"input_tokens":3}}})" + "\n" +
        usage_line("2025-01-15T09:00:00Z", "s1", "claude-3-5-haiku-20241022", 1, 2) + "\n");
    tmp.file("p2/session-b.jsonl",
        usage_line("2025-01-15T10:00:00Z", "s2", "claude-opus-4-5-20251101", 5, 5) + "\n" +
        R"({"timestamp": broken)" + "\n");

    LogReader::Config cfg;
    cfg.data_root = tmp.path;
    LogReader reader(cfg);

    const auto result = reader.read_all();
    REQUIRE(result.is_ok());
    const auto& records = result.value().records;
    REQUIRE(records.size() == 3);
    CHECK(records[0].timestamp < records[1].timestamp);
    CHECK(records[1].timestamp < records[2].timestamp);
    CHECK(records[0].usage.input_tokens == 1);
    CHECK(records[1].model == "claude-opus-4-5-20251101");
    CHECK(records[2].usage.output_tokens == 20);

    const auto& stats = result.value().stats;
    CHECK(stats.files_found == 2);
    CHECK(stats.files_read == 2);
    CHECK(stats.files_skipped == 0);
    CHECK(stats.lines_read == 7);
    CHECK(stats.lines_malformed == 2);
    CHECK(stats.lines_without_usage == 1);
    CHECK(stats.lines_invalid == 1);
    CHECK(stats.records == 3);
}

TEST_CASE("LogReader: missing file is skipped, not fatal", "[reader][files]") {
    LogReader::Config cfg;
    cfg.data_root = std::filesystem::temp_directory_path();
    LogReader reader(cfg);

    ReaderStats stats;
    int seen = 0;
    const bool ok = reader.read_file(
        std::filesystem::temp_directory_path() / "tokenmeter_missing_file.jsonl",
        [&seen](UsageRecord&&) { ++seen; }, stats);

    CHECK_FALSE(ok);
    CHECK(seen == 0);
    CHECK(stats.files_skipped == 1);
    CHECK(stats.files_read == 0);
}

TEST_CASE("LogReader: parallel read matches sequential read", "[reader][files]") {
    TmpDir tmp("parallel");
    for (int f = 0; f < 7; ++f) {
        std::string content;
        for (int i = 0; i < 20; ++i) {
            const int minute = (f * 20 + i) % 60;
            const int hour = (f * 20 + i) / 60;
            content += usage_line(
                std::format("2025-02-0{}T{:02d}:{:02d}:00Z", 1 + (f % 3), hour, minute),
                "s" + std::to_string(f), "claude-sonnet-4-20250514", i, f) + "\n";
        }
        tmp.file("proj" + std::to_string(f) + "/log.jsonl", content);
    }

    LogReader::Config seq_cfg;
    seq_cfg.data_root = tmp.path;
    seq_cfg.threads = 1;
    LogReader::Config par_cfg = seq_cfg;
    par_cfg.threads = 4;

    const auto seq = LogReader(seq_cfg).read_all();
    const auto par = LogReader(par_cfg).read_all();
    REQUIRE(seq.is_ok());
    REQUIRE(par.is_ok());

    const auto& a = seq.value().records;
    const auto& b = par.value().records;
    REQUIRE(a.size() == 140);
    REQUIRE(b.size() == 140);
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].timestamp == b[i].timestamp);
    }
    for (size_t i = 1; i < b.size(); ++i) {
        CHECK(b[i - 1].timestamp <= b[i].timestamp);
    }
    CHECK(par.value().stats.files_read == 7);
}
