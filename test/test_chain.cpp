#include <doctest/doctest.h>

#include <tierchain/common/error.hpp>
#include <tierchain/ledger/ledger.hpp>

#include <stdexcept>

using namespace tierchain;
using namespace tierchain::ledger;

namespace {

    std::vector<PayloadEntry> entry(const std::string &value) {
        return {PayloadEntry::update({{"value", value}})};
    }

    Chain buildChain(int difficulty, size_t extra_blocks) {
        Chain chain(difficulty);
        auto genesis = chain.pushGenesis({PayloadEntry::create(EntityKind::Root, {{"id", "r"}})}, Chain::ROOT_MARKER);
        REQUIRE(genesis.is_ok());
        for (size_t i = 0; i < extra_blocks; ++i)
            REQUIRE(chain.append(entry(std::to_string(i))).is_ok());
        return chain;
    }

} // namespace

TEST_SUITE("Chain Tests") {
    TEST_CASE("Genesis block") {
        Chain chain = buildChain(1, 0);

        CHECK(chain.length() == 1);
        CHECK(chain.genesis().index_ == 0);
        CHECK(chain.genesis().previous_hash_ == "0");
        CHECK(chain.genesis().hash_.substr(0, 1) == "0");
        CHECK(chain.isValid());
        CHECK(&chain.genesis() == &chain.latest());
    }

    TEST_CASE("A chain has one genesis") {
        Chain chain = buildChain(0, 0);
        auto second = chain.prepareGenesis(entry("again"), "0");
        REQUIRE(second.is_err());
        CHECK(errorKind(second.error()) == ErrorKind::Conflict);
    }

    TEST_CASE("Genesis needs a parent hash") {
        Chain chain(0);
        auto genesis = chain.prepareGenesis(entry("x"), "");
        REQUIRE(genesis.is_err());
        CHECK(errorKind(genesis.error()) == ErrorKind::InputError);
    }

    TEST_CASE("Appending to an empty chain fails") {
        Chain chain(0);
        auto next = chain.prepareNext(entry("x"));
        REQUIRE(next.is_err());
        CHECK(errorKind(next.error()) == ErrorKind::NotFound);
        CHECK_THROWS_AS(chain.latest(), std::runtime_error);
    }

    TEST_CASE("Blocks are linked and indexed") {
        Chain chain = buildChain(1, 3);

        REQUIRE(chain.length() == 4);
        for (size_t i = 1; i < chain.length(); ++i) {
            CHECK(chain.blocks_[i].index_ == i);
            CHECK(chain.blocks_[i].previous_hash_ == chain.blocks_[i - 1].hash_);
        }
        CHECK(chain.verify().ok);
    }

    TEST_CASE("Every block meets the chain difficulty") {
        Chain chain = buildChain(2, 2);
        for (const auto &block : chain.blocks_)
            CHECK(block.hash_.substr(0, 2) == "00");
        CHECK(chain.difficulty() == 2);
    }

    TEST_CASE("Prepared blocks are not appended") {
        Chain chain = buildChain(0, 0);
        auto next = chain.prepareNext(entry("pending"));
        REQUIRE(next.is_ok());
        CHECK(chain.length() == 1);

        REQUIRE(chain.commit(next.value()).is_ok());
        CHECK(chain.length() == 2);
    }

    TEST_CASE("Stale blocks are rejected on commit") {
        Chain chain = buildChain(0, 0);
        auto first = chain.prepareNext(entry("a"));
        auto second = chain.prepareNext(entry("b"));
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());

        REQUIRE(chain.commit(first.value()).is_ok());
        CHECK(chain.commit(second.value()).is_err());
        CHECK(chain.length() == 2);
    }

    TEST_CASE("Unmined blocks are rejected on commit") {
        Chain chain = buildChain(4, 0);
        Block unmined(1, entry("lazy"), chain.latest().hash_);
        // 1 in 65536 chance the unmined hash already qualifies
        if (!unmined.meetsDifficulty(4))
            CHECK(chain.commit(unmined).is_err());
    }

    TEST_CASE("Tampered payload is detected at its index") {
        Chain chain = buildChain(1, 2);
        chain.blocks_[1].payload_[0].data["value"] = "forged";

        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failed_index == 1);
        CHECK(verification.failure == ChainFailure::HashMismatch);
    }

    TEST_CASE("Tampered genesis is detected") {
        Chain chain = buildChain(0, 1);
        chain.blocks_[0].payload_[0].data["id"] = "other";

        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failed_index == 0);
    }

    TEST_CASE("Re-mined block still breaks the link") {
        Chain chain = buildChain(1, 2);
        chain.blocks_[1].previous_hash_ = std::string(64, 'f');
        REQUIRE(chain.blocks_[1].mine(1).is_ok());

        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failed_index == 1);
        CHECK(verification.failure == ChainFailure::BrokenLink);
    }

    TEST_CASE("Proof of work is checked at the chain difficulty") {
        Chain chain = buildChain(0, 1);
        chain.difficulty_ = 6;

        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failure == ChainFailure::ProofOfWork);
        CHECK(verification.reason.find("Proof of Work") != std::string::npos);
    }

    TEST_CASE("Index gaps are detected") {
        Chain chain = buildChain(0, 2);
        chain.blocks_.erase(chain.blocks_.begin() + 1);

        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failure == ChainFailure::IndexGap);
    }

    TEST_CASE("Empty chain does not verify") {
        Chain chain(0);
        auto verification = chain.verify();
        CHECK_FALSE(verification.ok);
        CHECK(verification.failure == ChainFailure::Empty);
    }

    TEST_CASE("Block lookup") {
        Chain chain = buildChain(0, 1);
        CHECK(chain.getBlock(1).is_ok());
        auto missing = chain.getBlock(5);
        CHECK(missing.is_err());
    }
}
