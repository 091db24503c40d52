#include <tierchain/common/error.hpp>
#include <tierchain/ledger/chain.hpp>

#include <stdexcept>

namespace tierchain::ledger {

    std::string chainFailureToString(ChainFailure failure) {
        switch (failure) {
        case ChainFailure::None:
            return "none";
        case ChainFailure::Empty:
            return "empty";
        case ChainFailure::IndexGap:
            return "index_gap";
        case ChainFailure::HashMismatch:
            return "hash_mismatch";
        case ChainFailure::BrokenLink:
            return "broken_link";
        case ChainFailure::ProofOfWork:
            return "proof_of_work";
        default:
            return "unknown";
        }
    }

    dp::Result<Block, dp::Error> Chain::prepareGenesis(std::vector<PayloadEntry> payload,
                                                       const std::string &parent_hash) const {
        if (!blocks_.empty())
            return dp::Result<Block, dp::Error>::err(conflict("Chain already has a genesis block"));
        if (parent_hash.empty())
            return dp::Result<Block, dp::Error>::err(input_error("Genesis parent hash is empty"));

        Block genesis(0, std::move(payload), parent_hash);
        auto mined = genesis.mine(difficulty_);
        if (!mined.is_ok())
            return dp::Result<Block, dp::Error>::err(mined.error());
        return dp::Result<Block, dp::Error>::ok(std::move(genesis));
    }

    dp::Result<Block, dp::Error> Chain::prepareNext(std::vector<PayloadEntry> payload) const {
        if (blocks_.empty())
            return dp::Result<Block, dp::Error>::err(not_found_error("Chain has no genesis block"));

        Block next(static_cast<dp::u64>(blocks_.size()), std::move(payload), blocks_.back().hash_);
        auto mined = next.mine(difficulty_);
        if (!mined.is_ok())
            return dp::Result<Block, dp::Error>::err(mined.error());
        return dp::Result<Block, dp::Error>::ok(std::move(next));
    }

    dp::Result<void, dp::Error> Chain::commit(const Block &block) {
        if (block.index_ != static_cast<dp::u64>(blocks_.size())) {
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument(
                dp::String(("Block index " + std::to_string(block.index_) + " does not extend chain of length " +
                            std::to_string(blocks_.size()))
                               .c_str())));
        }
        if (!blocks_.empty() && block.previous_hash_ != blocks_.back().hash_)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Block does not link to chain tip"));
        if (!block.meetsDifficulty(difficulty_))
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Block is not mined"));

        blocks_.push_back(block);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Chain::pushGenesis(std::vector<PayloadEntry> payload, const std::string &parent_hash) {
        auto genesis = prepareGenesis(std::move(payload), parent_hash);
        if (!genesis.is_ok())
            return dp::Result<void, dp::Error>::err(genesis.error());
        return commit(genesis.value());
    }

    dp::Result<Block, dp::Error> Chain::append(std::vector<PayloadEntry> payload) {
        auto next = prepareNext(std::move(payload));
        if (!next.is_ok())
            return next;
        auto committed = commit(next.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());
        return next;
    }

    ChainVerification Chain::verify() const {
        if (blocks_.empty())
            return ChainVerification::failed(0, ChainFailure::Empty, "Chain is empty");

        for (size_t i = 0; i < blocks_.size(); ++i) {
            const Block &current = blocks_[i];
            if (current.index_ != static_cast<dp::u64>(i)) {
                return ChainVerification::failed(i, ChainFailure::IndexGap,
                                                 "Block " + std::to_string(i) + " has index " +
                                                     std::to_string(current.index_));
            }
            if (!current.isValid()) {
                return ChainVerification::failed(i, ChainFailure::HashMismatch,
                                                 "Block " + std::to_string(i) + " has invalid hash");
            }
            if (i > 0 && current.previous_hash_ != blocks_[i - 1].hash_) {
                return ChainVerification::failed(i, ChainFailure::BrokenLink,
                                                 "Block " + std::to_string(i) + " has broken chain link");
            }
            if (!current.meetsDifficulty(difficulty_)) {
                return ChainVerification::failed(i, ChainFailure::ProofOfWork,
                                                 "Block " + std::to_string(i) +
                                                     " doesn't satisfy Proof of Work");
            }
        }
        return ChainVerification::success();
    }

    const Block &Chain::genesis() const {
        if (blocks_.empty())
            throw std::runtime_error("Chain is empty");
        return blocks_.front();
    }

    const Block &Chain::latest() const {
        if (blocks_.empty())
            throw std::runtime_error("Chain is empty");
        return blocks_.back();
    }

    dp::Result<Block, dp::Error> Chain::getBlock(size_t index) const {
        if (index >= blocks_.size())
            return dp::Result<Block, dp::Error>::err(dp::Error::out_of_range("Block index out of range"));
        return dp::Result<Block, dp::Error>::ok(blocks_[index]);
    }

} // namespace tierchain::ledger
