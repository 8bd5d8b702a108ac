#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hook_errors.hpp"
#include "session/state_store.hpp"

namespace hookguard::session {

enum class BlockKind {
    Block,
    Clear,
    StateCorruption
};

struct BlockRecord {
    BlockKind kind = BlockKind::Block;
    std::string session_id;
    std::int64_t ts_unix_ms = 0;
    std::string gate;
    std::string reason;
    std::optional<std::string> citation;
    std::string actor;
    std::filesystem::path path;
};

// Append-only history of sticky blocks under <state_root>/blocks/<ns>/.
// A session is blocked while its newest block/clear record is a block, or
// while the custodiet_block_active flag is set.
class BlockRegistry {
public:
    explicit BlockRegistry(std::filesystem::path state_root);

    core::errors::Result<BlockRecord> latch(const std::string& session_id,
                                            const std::string& gate,
                                            const std::string& reason,
                                            const std::optional<std::string>& citation) const;

    // Writes a clear record, then resets custodiet_block_active through the store.
    core::errors::Result<BlockRecord> clear(const StateStore& store,
                                            const std::string& session_id,
                                            const std::string& reason,
                                            const std::string& actor) const;

    // Audit-only record for a state file that had to be reinitialized.
    core::errors::Result<BlockRecord> record_corruption(const std::string& session_id,
                                                        const std::string& detail) const;

    // Oldest first.
    core::errors::Result<std::vector<BlockRecord>> list(
        const std::string& session_id) const;

    // The unresolved block record, if any. Ignores the state flag.
    core::errors::Result<std::optional<BlockRecord>> active_block(
        const std::string& session_id) const;

    std::filesystem::path session_dir(const std::string& session_id) const;

private:
    core::errors::Result<BlockRecord> append(BlockRecord record) const;

    std::filesystem::path state_root_;
};

std::string to_string(BlockKind kind);
std::optional<BlockKind> parse_block_kind(const std::string& text);

nlohmann::json to_json(const BlockRecord& record);
core::errors::Result<BlockRecord> block_record_from_json(const nlohmann::json& payload);

}  // namespace hookguard::session
