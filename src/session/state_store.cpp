#include "session/state_store.hpp"

#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/clock.hpp"
#include "core/config/session_key.hpp"
#include "core/logging/logger.hpp"
#include "session/file_lock.hpp"

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

StateStore::StateStore(std::filesystem::path state_root)
    : state_root_(std::move(state_root)) {}

std::filesystem::path StateStore::state_path(const std::string& session_id) const {
    return state_root_ / "state" / (core::config::session_file_key(session_id) + ".json");
}

std::filesystem::path StateStore::lock_path(const std::string& session_id) const {
    return state_root_ / "state" / (core::config::session_file_key(session_id) + ".lock");
}

core::errors::Result<std::filesystem::path> StateStore::ensure_state_dir() const {
    const auto dir = state_root_ / "state";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return HookError{ErrorCategory::State,
                         "Unable to create state directory: " + dir.string(),
                         "state_io_failed"};
    }
    return dir;
}

LoadedState StateStore::read_unlocked(const std::string& session_id) const {
    LoadedState loaded;
    loaded.state = make_default_state(session_id);

    const auto path = state_path(session_id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return loaded;
    }
    loaded.existed = true;

    std::ifstream in(path);
    if (!in.is_open()) {
        loaded.recovered_from_corruption = true;
        loaded.corruption_detail = "Unable to open state file: " + path.string();
        return loaded;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    const json payload = json::parse(buffer.str(), nullptr, false);
    if (payload.is_discarded()) {
        loaded.recovered_from_corruption = true;
        loaded.corruption_detail = "State file is not valid JSON: " + path.string();
        return loaded;
    }

    auto parsed = from_json(payload);
    if (core::errors::is_error(parsed)) {
        loaded.recovered_from_corruption = true;
        loaded.corruption_detail = core::errors::get_error(parsed).message;
        return loaded;
    }

    auto& state = core::errors::get_value(parsed);
    if (state.session_id != session_id) {
        loaded.recovered_from_corruption = true;
        loaded.corruption_detail = "State file belongs to session " + state.session_id;
        return loaded;
    }

    loaded.state = std::move(state);
    return loaded;
}

core::errors::Result<std::filesystem::path> StateStore::write_unlocked(
    const SessionState& state) const {
    const auto path = state_path(state.session_id);
    const auto temp_path =
        path.parent_path() /
        (path.filename().string() + "." + core::config::generate_token() + ".tmp");

    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return HookError{ErrorCategory::State,
                             "Unable to open temp state file: " + temp_path.string(),
                             "state_io_failed"};
        }
        out << to_json(state).dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            std::error_code ignore;
            std::filesystem::remove(temp_path, ignore);
            return HookError{ErrorCategory::State,
                             "Unable to write temp state file: " + temp_path.string(),
                             "state_io_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(temp_path, ignore);
        return HookError{ErrorCategory::State,
                         "Unable to replace state file " + path.string() + ": " +
                             ec.message(),
                         "state_io_failed"};
    }
    return path;
}

core::errors::Result<LoadedState> StateStore::get(const std::string& session_id) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    auto lock = FileLock::acquire(lock_path(session_id), LOCK_SH);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }
    return read_unlocked(session_id);
}

core::errors::Result<LoadedState> StateStore::update(
    const std::string& session_id, const StateTransaction& transaction) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    auto lock = FileLock::acquire(lock_path(session_id), LOCK_EX);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    LoadedState loaded = read_unlocked(session_id);
    if (loaded.recovered_from_corruption) {
        LOG_WARN("StateStore: reinitializing session " + session_id + ": " +
                 loaded.corruption_detail);
    }

    transaction(loaded.state);

    const auto now = core::config::now_unix_ms();
    if (loaded.state.created_at_ms == 0) {
        loaded.state.created_at_ms = now;
    }
    loaded.state.updated_at_ms = now;
    loaded.state.session_id = session_id;

    auto written = write_unlocked(loaded.state);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return loaded;
}

core::errors::Result<SessionState> StateStore::apply(
    const std::string& session_id,
    const std::vector<protocol::StateMutation>& mutations) const {
    auto updated = update(session_id, [&mutations](SessionState& state) {
        state = apply_mutations(std::move(state), mutations);
    });
    if (core::errors::is_error(updated)) {
        return core::errors::get_error(updated);
    }
    return core::errors::get_value(updated).state;
}

core::errors::Result<bool> StateStore::reset(const std::string& session_id) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    auto lock = FileLock::acquire(lock_path(session_id), LOCK_EX);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    std::error_code ec;
    const bool removed = std::filesystem::remove(state_path(session_id), ec);
    if (ec) {
        return HookError{ErrorCategory::State,
                         "Unable to remove state file: " + ec.message(),
                         "state_io_failed"};
    }
    if (removed) {
        LOG_INFO("StateStore: session " + session_id + " reset");
    }
    return removed;
}

}  // namespace hookguard::session
