#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"
#include "protocol/gate_contract.hpp"
#include "session/session_state.hpp"

namespace hookguard::session {

struct LoadedState {
    SessionState state;
    bool existed = false;
    bool recovered_from_corruption = false;
    std::string corruption_detail;
};

using StateTransaction = std::function<void(SessionState& state)>;

// Durable per-session state. The only component allowed to touch the state
// files. Every read-modify-write holds an exclusive flock on a sidecar lock
// file from the read until the rename of the new file.
class StateStore {
public:
    explicit StateStore(std::filesystem::path state_root);

    // Unknown ids yield documented defaults, not an error.
    core::errors::Result<LoadedState> get(const std::string& session_id) const;

    core::errors::Result<SessionState> apply(
        const std::string& session_id,
        const std::vector<protocol::StateMutation>& mutations) const;

    // Runs `transaction` on the current state under the lock, then persists
    // whatever it left behind in one write.
    core::errors::Result<LoadedState> update(const std::string& session_id,
                                             const StateTransaction& transaction) const;

    // Removes the session's state file. Returns whether one existed.
    core::errors::Result<bool> reset(const std::string& session_id) const;

    std::filesystem::path state_path(const std::string& session_id) const;
    const std::filesystem::path& root() const { return state_root_; }

private:
    std::filesystem::path lock_path(const std::string& session_id) const;
    core::errors::Result<std::filesystem::path> ensure_state_dir() const;
    LoadedState read_unlocked(const std::string& session_id) const;
    core::errors::Result<std::filesystem::path> write_unlocked(
        const SessionState& state) const;

    std::filesystem::path state_root_;
};

}  // namespace hookguard::session
