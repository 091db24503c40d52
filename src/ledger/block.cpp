#include <tierchain/common/error.hpp>
#include <tierchain/ledger/block.hpp>
#include <tierchain/ledger/hash.hpp>

#include <sstream>

namespace tierchain::ledger {

    Block::Block(dp::u64 index, std::vector<PayloadEntry> payload, std::string previous_hash)
        : index_(index), timestamp_(currentTimeMillis()), payload_(std::move(payload)),
          previous_hash_(std::move(previous_hash)) {
        auto hash_result = calculateHash();
        if (hash_result.is_ok())
            hash_ = hash_result.value();
    }

    dp::Result<std::string, dp::Error> Block::calculateHash() const {
        std::stringstream ss;
        ss << index_ << previous_hash_ << timestamp_ << canonicalize(payload_) << nonce_;
        return sha256Hex(ss.str());
    }

    dp::Result<void, dp::Error> Block::mine(int difficulty) {
        if (difficulty < 0)
            return dp::Result<void, dp::Error>::err(input_error("Difficulty must not be negative"));

        auto hash_result = calculateHash();
        if (!hash_result.is_ok())
            return dp::Result<void, dp::Error>::err(hash_result.error());
        hash_ = hash_result.value();

        while (!ledger::meetsDifficulty(hash_, difficulty)) {
            ++nonce_;
            hash_result = calculateHash();
            if (!hash_result.is_ok())
                return dp::Result<void, dp::Error>::err(hash_result.error());
            hash_ = hash_result.value();
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool Block::isValid() const {
        if (hash_.empty())
            return false;
        auto calc_hash = calculateHash();
        if (!calc_hash.is_ok())
            return false;
        return calc_hash.value() == hash_;
    }

    bool Block::meetsDifficulty(int difficulty) const { return ledger::meetsDifficulty(hash_, difficulty); }

} // namespace tierchain::ledger
