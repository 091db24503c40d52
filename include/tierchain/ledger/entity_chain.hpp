#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "attendance.hpp"
#include "chain.hpp"

namespace tierchain::ledger {

    /// A Chain plus entity identity and the parent link captured at creation.
    /// Current state is never stored; it is replayed from the payloads.
    class EntityChain {
      public:
        EntityKind kind() const { return kind_; }
        const std::string &id() const { return id_; }
        const std::string &displayName() const { return display_name_; }

        /// Root id for groups, group id for leaves, empty for roots
        const std::string &parentId() const { return parent_id_; }

        /// Parent's latest hash at creation time; none for roots
        const std::optional<std::string> &parentLinkHash() const { return parent_link_hash_; }

        /// Ids of every ancestor ("rootId", "groupId"), as stamped into the genesis data
        const Fields &parentFields() const { return parent_fields_; }

        const Chain &chain() const { return chain_; }
        Chain &chain() { return chain_; }

        inline size_t length() const { return chain_.length(); }
        inline int difficulty() const { return chain_.difficulty(); }
        const std::string &latestHash() const { return chain_.latest().hash_; }

        /// prev_hash the genesis block must carry
        std::string expectedGenesisPrevHash() const;

        dp::Result<Block, dp::Error> prepareGenesis(const Fields &fields) const;
        dp::Result<Block, dp::Error> prepareUpdate(const Fields &patch) const;
        dp::Result<Block, dp::Error> prepareDelete() const;
        dp::Result<void, dp::Error> commit(const Block &block);

        dp::Result<void, dp::Error> initialize(const Fields &fields);
        dp::Result<Block, dp::Error> appendUpdate(const Fields &patch);
        dp::Result<Block, dp::Error> appendDelete();

        /// Create data merged with every later update; a delete forces status to "deleted"
        Fields currentState() const;
        bool isDeleted() const;

        /// True iff the genesis prev_hash equals the stored parent link. A parent that has grown since
        /// (current_parent_hash differs) is informational only
        bool validateParentLink(const std::string &current_parent_hash) const;
        bool parentHasGrown(const std::string &current_parent_hash) const;

      protected:
        EntityChain(EntityKind kind, std::string id, std::string display_name, int difficulty);

        Fields genesisData(const Fields &fields) const;

        EntityKind kind_;
        std::string id_;
        std::string display_name_;
        std::string parent_id_;
        std::optional<std::string> parent_link_hash_;
        Fields parent_fields_;
        Chain chain_;
    };

    class RootChain : public EntityChain {
      public:
        RootChain(std::string id, std::string display_name, int difficulty);
    };

    class GroupChain : public EntityChain {
      public:
        GroupChain(std::string id, std::string display_name, std::string root_id, std::string parent_link_hash,
                   int difficulty);

        const std::string &rootId() const { return parent_id_; }
    };

    class LeafChain : public EntityChain {
      public:
        LeafChain(std::string id, std::string display_name, std::string group_id, std::string root_id,
                  std::string parent_link_hash, int difficulty);

        const std::string &groupId() const { return parent_id_; }
        const std::string &rootId() const { return root_id_; }

        /// Validates and mines a record block; rejects a date already recorded and a deleted leaf
        dp::Result<Block, dp::Error> prepareRecord(const AttendanceEntry &entry) const;
        dp::Result<Block, dp::Error> appendRecord(const AttendanceEntry &entry);

        /// Readable records in chain order; unreadable ones are skipped and logged
        std::vector<AttendanceRecord> history() const;
        /// Record entries whose date or status no longer parses
        size_t unreadableRecords() const;
        std::optional<AttendanceRecord> recordByDate(const std::string &date) const;
        AttendanceStats stats() const;

      private:
        std::string root_id_;
    };

} // namespace tierchain::ledger
