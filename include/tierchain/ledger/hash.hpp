#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace tierchain::ledger {

    /// SHA-256 of the input, lowercase hex
    dp::Result<std::string, dp::Error> sha256Hex(const std::string &data);

    /// "0" repeated `difficulty` times
    std::string difficultyTarget(int difficulty);

    bool meetsDifficulty(const std::string &hash, int difficulty);

    inline std::string shortHash(const std::string &hash, size_t length = 16) {
        return hash.size() <= length ? hash : hash.substr(0, length) + "...";
    }

} // namespace tierchain::ledger
