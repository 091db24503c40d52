#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include "error.hpp"

namespace tierchain {

    /// Ledger-wide options, fixed when the registry is built
    struct LedgerOptions {
        static constexpr dp::i32 MAX_DIFFICULTY = 6;

        dp::i32 difficulty = 4;             // Leading hex zeros required on every new block
        std::string storage_path{};         // Empty keeps the registry in memory only
        dp::u32 mining_workers = 2;         // Worker pool size for async mining
        dp::u32 compaction_threshold = 256; // Journal entries before a snapshot is written
        bool verbose = true;                // Status lines on std::cout

        dp::Result<void, dp::Error> validate() const;

        /// Reads TIERCHAIN_DIFFICULTY, TIERCHAIN_STORAGE_PATH, TIERCHAIN_MINING_WORKERS,
        /// TIERCHAIN_COMPACTION_THRESHOLD and TIERCHAIN_VERBOSE; unset variables keep their defaults
        static dp::Result<LedgerOptions, dp::Error> fromEnvironment();

        inline bool persistent() const { return !storage_path.empty(); }
    };

} // namespace tierchain
