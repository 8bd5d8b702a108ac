#include "session/block_registry.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <system_error>
#include <utility>
#include "core/config/clock.hpp"
#include "core/config/session_key.hpp"
#include "core/logging/logger.hpp"
#include "session/file_lock.hpp"

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

namespace {

constexpr const char* kLockName = ".lock";

HookError io_error(const std::string& message) {
    return HookError{ErrorCategory::State, message, "state_io_failed"};
}

std::string string_or_empty(const json& payload, const char* key) {
    const auto it = payload.find(key);
    return it != payload.end() && it->is_string() ? it->get<std::string>() : "";
}

std::string record_file_name(const BlockRecord& record) {
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%016lld",
                  static_cast<long long>(record.ts_unix_ms));
    return std::string(stamp) + "-" + to_string(record.kind) + ".json";
}

// Reads every record in `dir`. Unparseable files are skipped with a warning.
std::vector<BlockRecord> read_records(const std::filesystem::path& dir) {
    std::vector<BlockRecord> records;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return records;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream in(entry.path());
        if (!in.is_open()) {
            LOG_WARN("BlockRegistry: unable to open " + entry.path().string());
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        const json payload = json::parse(buffer.str(), nullptr, false);
        auto parsed = payload.is_discarded()
                          ? core::errors::Result<BlockRecord>(io_error("invalid JSON"))
                          : block_record_from_json(payload);
        if (core::errors::is_error(parsed)) {
            LOG_WARN("BlockRegistry: skipping " + entry.path().string() + ": " +
                     core::errors::get_error(parsed).message);
            continue;
        }
        auto record = core::errors::get_value(parsed);
        record.path = entry.path();
        records.push_back(std::move(record));
    }

    std::sort(records.begin(), records.end(),
              [](const BlockRecord& a, const BlockRecord& b) {
                  if (a.ts_unix_ms != b.ts_unix_ms) {
                      return a.ts_unix_ms < b.ts_unix_ms;
                  }
                  return a.path.filename() < b.path.filename();
              });
    return records;
}

}  // namespace

BlockRegistry::BlockRegistry(std::filesystem::path state_root)
    : state_root_(std::move(state_root)) {}

std::filesystem::path BlockRegistry::session_dir(const std::string& session_id) const {
    return state_root_ / "blocks" / core::config::session_file_key(session_id);
}

core::errors::Result<BlockRecord> BlockRegistry::append(BlockRecord record) const {
    const auto dir = session_dir(record.session_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return io_error("Unable to create block directory: " + dir.string());
    }

    auto lock = FileLock::acquire(dir / kLockName, LOCK_EX);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    // Timestamps are strictly increasing per session so record order is total.
    const auto existing = read_records(dir);
    record.ts_unix_ms = core::config::now_unix_ms();
    if (!existing.empty() && existing.back().ts_unix_ms >= record.ts_unix_ms) {
        record.ts_unix_ms = existing.back().ts_unix_ms + 1;
    }

    record.path = dir / record_file_name(record);
    const auto temp_path =
        dir / (record.path.filename().string() + "." + core::config::generate_token() +
               ".tmp");
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return io_error("Unable to open block record: " + temp_path.string());
        }
        out << to_json(record).dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            std::error_code ignore;
            std::filesystem::remove(temp_path, ignore);
            return io_error("Unable to write block record: " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, record.path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(temp_path, ignore);
        return io_error("Unable to publish block record " + record.path.string() + ": " +
                        ec.message());
    }
    return record;
}

core::errors::Result<BlockRecord> BlockRegistry::latch(
    const std::string& session_id, const std::string& gate, const std::string& reason,
    const std::optional<std::string>& citation) const {
    BlockRecord record;
    record.kind = BlockKind::Block;
    record.session_id = session_id;
    record.gate = gate;
    record.reason = reason;
    record.citation = citation;
    record.actor = gate;
    auto written = append(std::move(record));
    if (!core::errors::is_error(written)) {
        LOG_WARN("BlockRegistry: session " + session_id + " latched by " + gate);
    }
    return written;
}

core::errors::Result<BlockRecord> BlockRegistry::clear(const StateStore& store,
                                                       const std::string& session_id,
                                                       const std::string& reason,
                                                       const std::string& actor) const {
    BlockRecord record;
    record.kind = BlockKind::Clear;
    record.session_id = session_id;
    record.gate = "clear-block";
    record.reason = reason;
    record.actor = actor;
    auto written = append(std::move(record));
    if (core::errors::is_error(written)) {
        return written;
    }

    auto applied = store.apply(
        session_id, {protocol::StateMutation{flags::kCustodietBlockActive, false}});
    if (core::errors::is_error(applied)) {
        return core::errors::get_error(applied);
    }
    LOG_INFO("BlockRegistry: session " + session_id + " cleared by " + actor);
    return written;
}

core::errors::Result<BlockRecord> BlockRegistry::record_corruption(
    const std::string& session_id, const std::string& detail) const {
    BlockRecord record;
    record.kind = BlockKind::StateCorruption;
    record.session_id = session_id;
    record.gate = "state_store";
    record.reason = detail;
    record.actor = "hookguard";
    return append(std::move(record));
}

core::errors::Result<std::vector<BlockRecord>> BlockRegistry::list(
    const std::string& session_id) const {
    const auto dir = session_dir(session_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return std::vector<BlockRecord>{};
    }
    auto lock = FileLock::acquire(dir / kLockName, LOCK_SH);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }
    return read_records(dir);
}

core::errors::Result<std::optional<BlockRecord>> BlockRegistry::active_block(
    const std::string& session_id) const {
    auto records = list(session_id);
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }
    const auto& all = core::errors::get_value(records);
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (it->kind == BlockKind::Clear) {
            return std::optional<BlockRecord>{};
        }
        if (it->kind == BlockKind::Block) {
            return std::optional<BlockRecord>{*it};
        }
    }
    return std::optional<BlockRecord>{};
}

std::string to_string(const BlockKind kind) {
    switch (kind) {
        case BlockKind::Block:
            return "block";
        case BlockKind::Clear:
            return "clear";
        case BlockKind::StateCorruption:
            return "state_corruption";
        default:
            return "unknown";
    }
}

std::optional<BlockKind> parse_block_kind(const std::string& text) {
    if (text == "block") return BlockKind::Block;
    if (text == "clear") return BlockKind::Clear;
    if (text == "state_corruption") return BlockKind::StateCorruption;
    return std::nullopt;
}

json to_json(const BlockRecord& record) {
    json payload = {
        {"kind", to_string(record.kind)},
        {"session_id", record.session_id},
        {"ts_unix_ms", record.ts_unix_ms},
        {"gate", record.gate},
        {"reason", record.reason},
        {"actor", record.actor},
    };
    payload["citation"] = record.citation.has_value() ? json(record.citation.value())
                                                      : json(nullptr);
    return payload;
}

core::errors::Result<BlockRecord> block_record_from_json(const json& payload) {
    if (!payload.is_object()) {
        return io_error("Block record is not an object.");
    }
    const auto kind_it = payload.find("kind");
    const auto ts_it = payload.find("ts_unix_ms");
    if (kind_it == payload.end() || !kind_it->is_string() || ts_it == payload.end() ||
        !ts_it->is_number_integer()) {
        return io_error("Block record lacks kind or ts_unix_ms.");
    }
    const auto kind = parse_block_kind(kind_it->get<std::string>());
    if (!kind.has_value()) {
        return io_error("Unknown block record kind: " + kind_it->get<std::string>());
    }

    BlockRecord record;
    record.kind = kind.value();
    record.ts_unix_ms = ts_it->get<std::int64_t>();
    record.session_id = string_or_empty(payload, "session_id");
    record.gate = string_or_empty(payload, "gate");
    record.reason = string_or_empty(payload, "reason");
    record.actor = string_or_empty(payload, "actor");
    const auto citation_it = payload.find("citation");
    if (citation_it != payload.end() && citation_it->is_string()) {
        record.citation = citation_it->get<std::string>();
    }
    return record;
}

}  // namespace hookguard::session
