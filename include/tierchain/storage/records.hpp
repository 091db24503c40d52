#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include <tierchain/ledger/entity_chain.hpp>

namespace tierchain::storage {

    // ===========================================
    // Persisted records - POD structs with members()
    // ===========================================

    /// One key/value pair of a payload's data
    struct FieldRecord {
        dp::String key;
        dp::String value;

        auto members() { return std::tie(key, value); }
        auto members() const { return std::tie(key, value); }
    };

    /// Payload entry as stored; `type` is the payload label ("root", "update", "attendance", ...)
    struct TransactionRecord {
        dp::String type;
        dp::Vector<FieldRecord> data;
        dp::i64 timestamp = 0;

        auto members() { return std::tie(type, data, timestamp); }
        auto members() const { return std::tie(type, data, timestamp); }

        std::string toJson() const;
    };

    struct BlockRecord {
        dp::u64 index = 0;
        dp::i64 timestamp = 0;
        dp::String prev_hash;
        dp::u64 nonce = 0;
        dp::String hash;
        dp::Vector<TransactionRecord> transactions;

        auto members() { return std::tie(index, timestamp, prev_hash, nonce, hash, transactions); }
        auto members() const { return std::tie(index, timestamp, prev_hash, nonce, hash, transactions); }

        std::string toJson() const;
    };

    /// An entity chain as stored. Roots leave root_id/group_id empty and has_parent_link 0
    struct EntityRecord {
        dp::u8 kind = 0;
        dp::String id;
        dp::String display_name;
        dp::String root_id;
        dp::String group_id;
        dp::String parent_link_hash;
        dp::u8 has_parent_link = 0;
        dp::i32 difficulty = 0;
        dp::Vector<BlockRecord> chain;

        auto members() {
            return std::tie(kind, id, display_name, root_id, group_id, parent_link_hash, has_parent_link, difficulty,
                            chain);
        }
        auto members() const {
            return std::tie(kind, id, display_name, root_id, group_id, parent_link_hash, has_parent_link, difficulty,
                            chain);
        }

        std::string toJson() const;
    };

    /// One appended block plus the metadata needed to create its chain on replay
    struct JournalEntry {
        dp::u64 sequence = 0;
        EntityRecord entity; // chain left empty
        BlockRecord block;

        auto members() { return std::tie(sequence, entity, block); }
        auto members() const { return std::tie(sequence, entity, block); }
    };

    /// Full registry image written on compaction
    struct SnapshotRecord {
        static constexpr dp::u32 CURRENT_VERSION = 1;

        dp::u32 version = CURRENT_VERSION;
        dp::u64 last_sequence = 0;
        dp::Vector<EntityRecord> roots;
        dp::Vector<EntityRecord> groups;
        dp::Vector<EntityRecord> leaves;

        auto members() { return std::tie(version, last_sequence, roots, groups, leaves); }
        auto members() const { return std::tie(version, last_sequence, roots, groups, leaves); }

        inline size_t entityCount() const { return roots.size() + groups.size() + leaves.size(); }
    };

    // ===========================================
    // Conversions between ledger types and records
    // ===========================================

    dp::Vector<FieldRecord> toFieldRecords(const ledger::Fields &fields);
    ledger::Fields toFields(const dp::Vector<FieldRecord> &records);

    BlockRecord toBlockRecord(const ledger::Block &block);

    /// Rebuilds the block verbatim; stored hash and nonce are kept even if they no longer match
    dp::Result<ledger::Block, dp::Error> toBlock(const BlockRecord &record);

    /// Identity and parent link only
    EntityRecord toMetadataRecord(const ledger::EntityChain &entity);
    EntityRecord toEntityRecord(const ledger::EntityChain &entity);

    JournalEntry makeJournalEntry(const ledger::EntityChain &entity, const ledger::Block &block);

    dp::Result<ledger::RootChain, dp::Error> restoreRoot(const EntityRecord &record);
    dp::Result<ledger::GroupChain, dp::Error> restoreGroup(const EntityRecord &record);
    dp::Result<ledger::LeafChain, dp::Error> restoreLeaf(const EntityRecord &record);

    /// JSON array of the records, one entity per line
    std::string toJsonArray(const dp::Vector<EntityRecord> &records);

} // namespace tierchain::storage
