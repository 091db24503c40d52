#pragma once

#include <datapod/datapod.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <tierchain/common/config.hpp>
#include <tierchain/ledger/entity_chain.hpp>
#include <tierchain/storage/journal_store.hpp>

#include "worker_pool.hpp"

namespace tierchain::registry {

    using ledger::Fields;

    struct BulkRecordRequest {
        std::string leaf_id;
        ledger::AttendanceEntry entry;
    };

    struct BulkItemOutcome {
        std::string leaf_id;
        std::string date;
        bool ok = false;
        dp::u64 block_index = 0;
        std::string error;
    };

    /// Outcomes are in request order
    struct BulkAppendReport {
        size_t successful = 0;
        size_t failed = 0;
        std::vector<BulkItemOutcome> items;

        std::string toJson() const;
    };

    /// One leaf's record for a given date; `record` is empty when nothing was marked
    struct DailyRecord {
        std::string leaf_id;
        std::string leaf_name;
        std::optional<ledger::AttendanceRecord> record;
    };

    struct RegistryStats {
        size_t roots = 0;
        size_t groups = 0;
        size_t leaves = 0;
        size_t total_blocks = 0;
        size_t records = 0;

        std::string toJson() const;
    };

    // ===========================================
    // ChainRegistry - owns every entity chain
    // ===========================================

    /// Mutations on one chain are serialized; mutations on different chains mine in parallel.
    /// Every committed block is journaled before it becomes visible. Accessors return copies
    class ChainRegistry {
      public:
        explicit ChainRegistry(LedgerOptions options = LedgerOptions{});
        ~ChainRegistry();

        ChainRegistry(const ChainRegistry &) = delete;
        ChainRegistry &operator=(const ChainRegistry &) = delete;

        /// Validates the options and, when a storage path is set, loads the snapshot and journal
        dp::Result<void, dp::Error> open();
        inline bool isOpen() const { return is_open_; }
        inline const LedgerOptions &options() const { return options_; }

        // ===========================================
        // Creation
        // ===========================================

        dp::Result<ledger::RootChain, dp::Error> createRoot(const std::string &id, const std::string &name,
                                                            const Fields &fields = {});
        dp::Result<ledger::GroupChain, dp::Error> createGroup(const std::string &id, const std::string &name,
                                                              const std::string &root_id, const Fields &fields = {});
        dp::Result<ledger::LeafChain, dp::Error> createLeaf(const std::string &id, const std::string &name,
                                                            const std::string &group_id, const Fields &fields = {});

        // ===========================================
        // Lookup
        // ===========================================

        dp::Result<ledger::RootChain, dp::Error> getRoot(const std::string &id) const;
        dp::Result<ledger::GroupChain, dp::Error> getGroup(const std::string &id) const;
        dp::Result<ledger::LeafChain, dp::Error> getLeaf(const std::string &id) const;
        bool contains(ledger::EntityKind kind, const std::string &id) const;

        /// Sorted by id; soft-deleted entities are included
        std::vector<ledger::RootChain> listRoots() const;
        std::vector<ledger::GroupChain> listGroups() const;
        std::vector<ledger::LeafChain> listLeaves() const;
        std::vector<ledger::GroupChain> listGroupsByRoot(const std::string &root_id) const;
        std::vector<ledger::LeafChain> listLeavesByGroup(const std::string &group_id) const;
        std::vector<ledger::LeafChain> listLeavesByRoot(const std::string &root_id) const;

        // ===========================================
        // Update and soft delete
        // ===========================================

        inline dp::Result<ledger::Block, dp::Error> updateRoot(const std::string &id, const Fields &patch) {
            return update(ledger::EntityKind::Root, id, patch);
        }
        inline dp::Result<ledger::Block, dp::Error> updateGroup(const std::string &id, const Fields &patch) {
            return update(ledger::EntityKind::Group, id, patch);
        }
        inline dp::Result<ledger::Block, dp::Error> updateLeaf(const std::string &id, const Fields &patch) {
            return update(ledger::EntityKind::Leaf, id, patch);
        }
        inline dp::Result<ledger::Block, dp::Error> deleteRoot(const std::string &id) {
            return remove(ledger::EntityKind::Root, id);
        }
        inline dp::Result<ledger::Block, dp::Error> deleteGroup(const std::string &id) {
            return remove(ledger::EntityKind::Group, id);
        }
        inline dp::Result<ledger::Block, dp::Error> deleteLeaf(const std::string &id) {
            return remove(ledger::EntityKind::Leaf, id);
        }

        dp::Result<ledger::Block, dp::Error> update(ledger::EntityKind kind, const std::string &id,
                                                    const Fields &patch);
        dp::Result<ledger::Block, dp::Error> remove(ledger::EntityKind kind, const std::string &id);

        // ===========================================
        // Leaf records
        // ===========================================

        dp::Result<ledger::Block, dp::Error> appendRecord(const std::string &leaf_id,
                                                          const ledger::AttendanceEntry &entry);

        /// Mines on the worker pool instead of the caller's thread
        std::future<dp::Result<ledger::Block, dp::Error>> appendRecordAsync(const std::string &leaf_id,
                                                                            const ledger::AttendanceEntry &entry);

        /// Each item succeeds or fails on its own; different leaves are mined in parallel
        BulkAppendReport appendRecords(const std::vector<BulkRecordRequest> &requests);

        /// not_found when the leaf is unknown or has no record on `date`
        dp::Result<ledger::AttendanceRecord, dp::Error> recordByDate(const std::string &leaf_id,
                                                                     const std::string &date) const;
        dp::Result<std::vector<ledger::AttendanceRecord>, dp::Error> history(const std::string &leaf_id) const;
        dp::Result<ledger::AttendanceStats, dp::Error> leafStats(const std::string &leaf_id) const;

        /// Every non-deleted leaf under the group or root, with its record for `date` if any
        dp::Result<std::vector<DailyRecord>, dp::Error> recordsForGroupOnDate(const std::string &group_id,
                                                                              const std::string &date) const;
        dp::Result<std::vector<DailyRecord>, dp::Error> recordsForRootOnDate(const std::string &root_id,
                                                                             const std::string &date) const;

        // ===========================================
        // Maintenance
        // ===========================================

        RegistryStats stats() const;

        /// Rewrites block 1's payload in memory without re-mining. Never persisted
        dp::Result<void, dp::Error> simulateTampering(ledger::EntityKind kind, const std::string &id);

        /// Registry image as it would be written by compaction
        storage::SnapshotRecord snapshot() const;

        /// Writes the snapshot and truncates the journal now, regardless of the threshold
        dp::Result<void, dp::Error> compact();

        /// roots.json, groups.json and leaves.json in `dir`
        dp::Result<void, dp::Error> exportJson(const std::string &dir) const;

      private:
        template <typename C> struct Slot {
            std::mutex write_mutex;             // Held for a whole mutation, mining included
            mutable std::shared_mutex data_mutex; // Guards the fields below
            bool ready = false;
            std::optional<C> chain;
            std::optional<ledger::Block> untampered; // Original block 1 after a tamper drill
        };

        template <typename C> using SlotMap = std::unordered_map<std::string, std::shared_ptr<Slot<C>>>;

        template <typename C> SlotMap<C> &slots();
        template <typename C> const SlotMap<C> &slots() const;

        template <typename C> std::shared_ptr<Slot<C>> findSlot(const std::string &id) const;
        template <typename C> dp::Result<C, dp::Error> getChain(const std::string &id) const;
        template <typename C> std::vector<C> listChains() const;

        template <typename C>
        dp::Result<C, dp::Error> createChain(C chain, const Fields &fields);

        template <typename C, typename Prepare>
        dp::Result<ledger::Block, dp::Error> mutate(const std::string &id, Prepare &&prepare);

        template <typename C> dp::Result<void, dp::Error> tamper(const std::string &id);

        template <typename C> void collectRecords(dp::Vector<storage::EntityRecord> &out) const;

        /// Journals `block` and, only if that succeeds, runs `apply` (the in-memory commit) while still
        /// holding the shared commit lock
        template <typename Apply>
        dp::Result<void, dp::Error> persistAndCommit(const ledger::EntityChain &entity, const ledger::Block &block,
                                                     Apply &&apply);

        void maybeCompact();
        dp::Result<void, dp::Error> requireOpen() const;
        dp::Result<void, dp::Error> restore(const storage::SnapshotRecord &state);

        std::vector<DailyRecord> dailyRecords(const std::vector<ledger::LeafChain> &leaves,
                                              const std::string &date) const;

        LedgerOptions options_;
        bool is_open_ = false;
        std::unique_ptr<storage::JournalStore> store_;
        std::unique_ptr<WorkerPool> pool_;

        SlotMap<ledger::RootChain> roots_;
        SlotMap<ledger::GroupChain> groups_;
        SlotMap<ledger::LeafChain> leaves_;
        mutable std::shared_mutex map_mutex_;

        // Shared by every commit; taken exclusively by compaction so the snapshot is consistent
        mutable std::shared_mutex commit_mutex_;
    };

} // namespace tierchain::registry
