#include <tierchain/common/error.hpp>
#include <tierchain/ledger/hash.hpp>

#include <keylock/keylock.hpp>
#include <vector>

namespace tierchain::ledger {

    dp::Result<std::string, dp::Error> sha256Hex(const std::string &data) {
        // Mining hashes in a tight loop; one hasher per thread
        thread_local keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> data_vec(data.begin(), data.end());
        auto hash_result = crypto.hash(data_vec);
        if (!hash_result.success)
            return dp::Result<std::string, dp::Error>::err(hash_failed("Failed to calculate block hash"));
        return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(hash_result.data));
    }

    std::string difficultyTarget(int difficulty) {
        return difficulty > 0 ? std::string(static_cast<size_t>(difficulty), '0') : std::string();
    }

    bool meetsDifficulty(const std::string &hash, int difficulty) {
        if (difficulty <= 0)
            return true;
        if (hash.size() < static_cast<size_t>(difficulty))
            return false;
        return hash.compare(0, static_cast<size_t>(difficulty), difficultyTarget(difficulty)) == 0;
    }

} // namespace tierchain::ledger
