#pragma once
#include <cctype>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace hookguard::core::config {

    // 64-bit FNV-1a, rendered as 16 lowercase hex characters.
    // Stable across builds and platforms, which std::hash is not.
    inline std::string stable_hash(const std::string& text) {
        std::uint64_t hash = 1469598103934665603ULL;
        for (const char c : text) {
            hash ^= static_cast<unsigned char>(c);
            hash *= 1099511628211ULL;
        }

        std::stringstream ss;
        ss << std::hex;
        ss.width(16);
        ss.fill('0');
        ss << hash;
        return ss.str();
    }

    // Maps a session id to a file-system safe namespace. Ids that needed
    // rewriting get a hash suffix so two distinct ids never collide.
    inline std::string session_file_key(const std::string& session_id) {
        std::string key;
        key.reserve(session_id.size());
        bool rewritten = false;
        for (const char c : session_id) {
            if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
                c == '_') {
                key.push_back(c);
            } else {
                key.push_back('_');
                rewritten = true;
            }
        }
        constexpr std::size_t kMaxKeyLength = 96;
        if (key.size() > kMaxKeyLength) {
            key.resize(kMaxKeyLength);
            rewritten = true;
        }
        if (rewritten || key.empty()) {
            key += "-" + stable_hash(session_id).substr(0, 8);
        }
        return key;
    }

    // Generates a simple 8-character hex token, used for temp file names.
    inline std::string generate_token(const std::string& prefix = "tmp-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace hookguard::core::config
