#include "usage/log_reader.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>
#include <thread>

namespace tokenmeter {

using json = nlohmann::json;

namespace fs = std::filesystem;

// ============================================================================
// JSON helpers
// ============================================================================

namespace {

enum class FieldState { ABSENT, OK, INVALID };

// Optional string field: absent/null -> ABSENT, non-string -> INVALID
FieldState get_string(const json& node, const char* key, std::string& out) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) return FieldState::ABSENT;
    if (!it->is_string()) return FieldState::INVALID;
    out = it->get<std::string>();
    return FieldState::OK;
}

// Optional counter in [0, kMaxTokenCount]: absent/null -> 0
FieldState get_counter(const json& usage, const char* key, uint64_t& out) {
    const auto it = usage.find(key);
    if (it == usage.end() || it->is_null()) {
        out = 0;
        return FieldState::ABSENT;
    }
    uint64_t value = 0;
    if (it->is_number_unsigned()) {
        value = it->get<uint64_t>();
    } else if (it->is_number_integer()) {
        const auto v = it->get<int64_t>();
        if (v < 0) return FieldState::INVALID;
        value = static_cast<uint64_t>(v);
    } else {
        return FieldState::INVALID;
    }
    if (value > kMaxTokenCount) return FieldState::INVALID;
    out = value;
    return FieldState::OK;
}

std::string preview(std::string_view line) {
    constexpr size_t kMaxLen = 120;
    if (line.size() <= kMaxLen) return std::string(line);
    return std::string(line.substr(0, kMaxLen)) + "...";
}

} // anonymous namespace

void ReaderStats::merge(const ReaderStats& other) {
    files_found += other.files_found;
    files_read += other.files_read;
    files_skipped += other.files_skipped;
    lines_read += other.lines_read;
    lines_malformed += other.lines_malformed;
    lines_without_usage += other.lines_without_usage;
    lines_invalid += other.lines_invalid;
    records += other.records;
}

// ============================================================================
// LogReader
// ============================================================================

LogReader::LogReader(Config config)
    : config_(std::move(config)) {
    if (config_.data_root.empty()) {
        config_.data_root = default_data_root();
    }
    if (config_.threads == 0) {
        config_.threads = 1;
    }
}

fs::path LogReader::default_data_root() {
    return utils::home_dir() / ".claude" / "projects";
}

Result<std::vector<fs::path>> LogReader::find_log_files() const {
    using R = Result<std::vector<fs::path>>;
    const auto& root = config_.data_root;

    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("Cannot access data directory {}: {}", root.string(), ec.message()));
    }
    if (status.type() == fs::file_type::not_found) {
        utils::log::debug(std::format("Data directory {} does not exist", root.string()));
        return R::ok({});
    }
    if (status.type() != fs::file_type::directory) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("Data path {} is not a directory", root.string()));
    }

    // The root itself must be readable; skip_permission_denied would turn a
    // denied root into an empty walk. It only applies to subdirectories.
    {
        const fs::directory_iterator root_check(root, ec);
        if (ec) {
            return R::error(ErrorCategory::IO_ERROR,
                std::format("Cannot read data directory {}: {}", root.string(), ec.message()));
        }
    }

    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("Cannot read data directory {}: {}", root.string(), ec.message()));
    }

    std::vector<fs::path> files;
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            utils::log::warn(std::format("Directory walk under {} stopped: {}",
                root.string(), ec.message()));
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        if (it->path().extension() != config_.extension) continue;
        files.push_back(it->path());
    }
    if (ec) {
        utils::log::warn(std::format("Directory walk under {} incomplete: {}",
            root.string(), ec.message()));
    }

    std::sort(files.begin(), files.end());
    return R::ok(std::move(files));
}

LineParseResult LogReader::parse_line(std::string_view line) {
    const std::string trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return LineParseResult::none("blank line");
    }

    json data;
    try {
        data = json::parse(trimmed);
    } catch (const json::parse_error& e) {
        return LineParseResult::decode_error(e.what());
    }

    if (!data.is_object()) {
        return LineParseResult::none("top-level value is not an object");
    }

    const auto msg_it = data.find("message");
    if (msg_it == data.end() || !msg_it->is_object()) {
        return LineParseResult::none("no message object");
    }
    const json& message = *msg_it;

    const auto usage_it = message.find("usage");
    if (usage_it == message.end() || !usage_it->is_object() || usage_it->empty()) {
        return LineParseResult::none("no usage block");
    }
    const json& usage = *usage_it;

    UsageRecord record;

    std::string ts_text;
    if (get_string(data, "timestamp", ts_text) != FieldState::OK) {
        return LineParseResult::invalid("missing timestamp");
    }
    const auto ts = parse_iso8601(ts_text);
    if (!ts) {
        return LineParseResult::invalid(std::format("unparseable timestamp '{}'", ts_text));
    }
    record.timestamp = *ts;

    if (get_string(data, "sessionId", record.session_id) == FieldState::INVALID) {
        return LineParseResult::invalid("sessionId is not a string");
    }
    if (get_string(message, "model", record.model) == FieldState::INVALID) {
        return LineParseResult::invalid("model is not a string");
    }

    auto& u = record.usage;
    if (get_counter(usage, "input_tokens", u.input_tokens) == FieldState::INVALID ||
        get_counter(usage, "output_tokens", u.output_tokens) == FieldState::INVALID ||
        get_counter(usage, "cache_creation_input_tokens",
                    u.cache_creation_input_tokens) == FieldState::INVALID ||
        get_counter(usage, "cache_read_input_tokens",
                    u.cache_read_input_tokens) == FieldState::INVALID) {
        return LineParseResult::invalid("token counter is not an integer in range");
    }

    return LineParseResult::ok(std::move(record));
}

bool LogReader::read_file(const fs::path& path,
                          const RecordCallback& on_record,
                          ReaderStats& stats) const {
    std::ifstream in(path);
    if (!in) {
        ++stats.files_skipped;
        utils::log::warn(std::format("Skipping unreadable file {}", path.string()));
        return false;
    }
    ++stats.files_read;

    std::string line;
    uint64_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;
        ++stats.lines_read;

        auto parsed = parse_line(line);
        switch (parsed.status) {
            case LineParseResult::Status::RECORD:
                ++stats.records;
                on_record(std::move(*parsed.record));
                break;
            case LineParseResult::Status::NO_RECORD:
                if (parsed.invalid_field) {
                    ++stats.lines_invalid;
                    utils::log::debug(std::format("{}:{}: invalid record skipped ({})",
                        path.string(), line_no, parsed.reason));
                } else {
                    ++stats.lines_without_usage;
                }
                break;
            case LineParseResult::Status::DECODE_ERROR:
                ++stats.lines_malformed;
                utils::log::debug(std::format("{}:{}: malformed line skipped ({}): {}",
                    path.string(), line_no, parsed.reason, preview(line)));
                break;
        }
    }

    if (in.bad()) {
        utils::log::warn(std::format("Read error in {} after line {}", path.string(), line_no));
    }
    return true;
}

void LogReader::read_files(const std::vector<fs::path>& files,
                           size_t begin, size_t end, ReadResult& out) const {
    for (size_t i = begin; i < end; ++i) {
        read_file(files[i],
                  [&out](UsageRecord&& r) { out.records.push_back(std::move(r)); },
                  out.stats);
    }
}

Result<LogReader::ReadResult> LogReader::read_all() const {
    auto found = find_log_files();
    if (found.is_error()) {
        return Result<ReadResult>::error_from(found);
    }
    const auto& files = found.value();

    utils::Timer timer;
    ReadResult result;
    result.stats.files_found = files.size();

    const size_t workers = std::min(config_.threads, std::max<size_t>(files.size(), 1));
    if (workers <= 1) {
        read_files(files, 0, files.size(), result);
    } else {
        // Each worker owns its slice and its output; merged after join
        std::vector<ReadResult> partials(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers);

        const size_t chunk = (files.size() + workers - 1) / workers;
        for (size_t w = 0; w < workers; ++w) {
            const size_t begin = std::min(w * chunk, files.size());
            const size_t end = std::min(begin + chunk, files.size());
            threads.emplace_back([this, &files, &partials, w, begin, end] {
                read_files(files, begin, end, partials[w]);
            });
        }
        for (auto& t : threads) t.join();

        for (auto& p : partials) {
            result.stats.merge(p.stats);
            result.records.insert(result.records.end(),
                std::make_move_iterator(p.records.begin()),
                std::make_move_iterator(p.records.end()));
        }
    }

    std::stable_sort(result.records.begin(), result.records.end(),
              [](const UsageRecord& a, const UsageRecord& b) {
                  return a.timestamp < b.timestamp;
              });

    const auto& s = result.stats;
    utils::log::debug(std::format(
        "Read {} records from {}/{} files ({} skipped) in {}ms: "
        "{} lines, {} malformed, {} invalid, {} without usage",
        s.records, s.files_read, s.files_found, s.files_skipped,
        timer.elapsed_ms().count(), s.lines_read, s.lines_malformed,
        s.lines_invalid, s.lines_without_usage));

    return Result<ReadResult>::ok(std::move(result));
}

} // namespace tokenmeter
