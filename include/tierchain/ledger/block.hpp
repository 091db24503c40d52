#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "payload.hpp"

namespace tierchain::ledger {

    class Block {
      public:
        dp::u64 index_{0};
        dp::i64 timestamp_{0};
        std::vector<PayloadEntry> payload_{};
        std::string previous_hash_{};
        dp::u64 nonce_{0};
        std::string hash_{};

        Block() = default;

        /// Stamps the creation time and computes the initial (unmined) hash
        Block(dp::u64 index, std::vector<PayloadEntry> payload, std::string previous_hash);

        /// SHA256(index ++ previous_hash ++ timestamp ++ canonical(payload) ++ nonce)
        dp::Result<std::string, dp::Error> calculateHash() const;

        /// Increments the nonce until the hash carries `difficulty` leading hex zeros.
        /// Unbounded; callers keep difficulty within LedgerOptions::MAX_DIFFICULTY
        dp::Result<void, dp::Error> mine(int difficulty);

        /// Stored hash equals the recomputed one
        bool isValid() const;

        bool meetsDifficulty(int difficulty) const;
    };

} // namespace tierchain::ledger
