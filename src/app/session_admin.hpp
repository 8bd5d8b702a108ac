#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/hook_errors.hpp"

namespace hookguard::app {

// Operator commands run outside the hook path.
class SessionAdmin {
public:
    explicit SessionAdmin(std::filesystem::path state_root);

    // State, active block and block history for one session.
    core::errors::Result<nlohmann::json> status(const std::string& session_id) const;

    core::errors::Result<nlohmann::json> clear_block(const std::string& session_id,
                                                     const std::string& reason,
                                                     const std::string& actor) const;

    core::errors::Result<nlohmann::json> reset(const std::string& session_id) const;

private:
    std::filesystem::path state_root_;
};

}  // namespace hookguard::app
