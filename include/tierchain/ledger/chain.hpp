#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "block.hpp"

namespace tierchain::ledger {

    enum class ChainFailure : dp::u8 {
        None = 0,
        Empty = 1,
        IndexGap = 2,
        HashMismatch = 3,
        BrokenLink = 4,
        ProofOfWork = 5,
    };

    std::string chainFailureToString(ChainFailure failure);

    /// Outcome of Chain::verify(); on failure names the first offending block
    struct ChainVerification {
        bool ok{true};
        size_t failed_index{0};
        ChainFailure failure{ChainFailure::None};
        std::string reason{};

        static ChainVerification success() { return ChainVerification{}; }
        static ChainVerification failed(size_t index, ChainFailure failure, std::string reason) {
            return ChainVerification{false, index, failure, std::move(reason)};
        }
    };

    /// Append-only block sequence sharing one difficulty target
    class Chain {
      public:
        /// prev_hash of a genesis block that has no parent
        static constexpr const char *ROOT_MARKER = "0";

        std::vector<Block> blocks_;
        int difficulty_{0};

        Chain() = default;
        explicit Chain(int difficulty) : difficulty_(difficulty) {}

        /// Mined genesis block with `parent_hash` as prev_hash; not appended
        dp::Result<Block, dp::Error> prepareGenesis(std::vector<PayloadEntry> payload,
                                                    const std::string &parent_hash) const;

        /// Mined next block linked to latest(); not appended
        dp::Result<Block, dp::Error> prepareNext(std::vector<PayloadEntry> payload) const;

        /// Appends a block produced by prepareGenesis/prepareNext. Rejects blocks whose index or link
        /// no longer matches the tip
        dp::Result<void, dp::Error> commit(const Block &block);

        dp::Result<void, dp::Error> pushGenesis(std::vector<PayloadEntry> payload, const std::string &parent_hash);
        dp::Result<Block, dp::Error> append(std::vector<PayloadEntry> payload);

        /// Hash, link and proof-of-work check of every block. Genesis is exempt from the link check only
        ChainVerification verify() const;
        inline bool isValid() const { return verify().ok; }

        inline bool empty() const { return blocks_.empty(); }
        inline size_t length() const { return blocks_.size(); }
        inline int difficulty() const { return difficulty_; }

        const Block &genesis() const;
        const Block &latest() const;
        dp::Result<Block, dp::Error> getBlock(size_t index) const;
    };

} // namespace tierchain::ledger
