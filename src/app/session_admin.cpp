#include "app/session_admin.hpp"

#include <utility>
#include "session/block_registry.hpp"
#include "session/state_store.hpp"

namespace hookguard::app {

using nlohmann::json;

SessionAdmin::SessionAdmin(std::filesystem::path state_root)
    : state_root_(std::move(state_root)) {}

core::errors::Result<json> SessionAdmin::status(const std::string& session_id) const {
    const session::StateStore store(state_root_);
    const session::BlockRegistry blocks(state_root_);

    auto loaded = store.get(session_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto history = blocks.list(session_id);
    if (core::errors::is_error(history)) {
        return core::errors::get_error(history);
    }
    auto active = blocks.active_block(session_id);
    if (core::errors::is_error(active)) {
        return core::errors::get_error(active);
    }

    const auto& state = core::errors::get_value(loaded);
    const auto& block = core::errors::get_value(active);
    json records = json::array();
    for (const auto& record : core::errors::get_value(history)) {
        records.push_back(session::to_json(record));
    }

    json out;
    out["session_id"] = session_id;
    out["state_file"] = store.state_path(session_id).string();
    out["exists"] = state.existed;
    out["recovered_from_corruption"] = state.recovered_from_corruption;
    out["state"] = session::to_json(state.state);
    out["blocked"] = block.has_value() ||
                     state.state.flag_bool(session::flags::kCustodietBlockActive);
    out["active_block"] = block.has_value() ? session::to_json(block.value()) : json(nullptr);
    out["block_records"] = records;
    return out;
}

core::errors::Result<json> SessionAdmin::clear_block(const std::string& session_id,
                                                     const std::string& reason,
                                                     const std::string& actor) const {
    const session::StateStore store(state_root_);
    const session::BlockRegistry blocks(state_root_);
    auto cleared = blocks.clear(store, session_id, reason, actor);
    if (core::errors::is_error(cleared)) {
        return core::errors::get_error(cleared);
    }
    return json{{"cleared", true},
                {"record", session::to_json(core::errors::get_value(cleared))}};
}

core::errors::Result<json> SessionAdmin::reset(const std::string& session_id) const {
    const session::StateStore store(state_root_);
    auto removed = store.reset(session_id);
    if (core::errors::is_error(removed)) {
        return core::errors::get_error(removed);
    }
    return json{{"session_id", session_id}, {"removed", core::errors::get_value(removed)}};
}

}  // namespace hookguard::app
