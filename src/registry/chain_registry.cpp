#include <tierchain/common/error.hpp>
#include <tierchain/registry/chain_registry.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>
#include <type_traits>

namespace tierchain::registry {

    using ledger::Block;
    using ledger::EntityKind;
    using ledger::GroupChain;
    using ledger::JsonSerializer;
    using ledger::LeafChain;
    using ledger::RootChain;

    namespace {

        template <typename C> constexpr const char *levelName() {
            if constexpr (std::is_same_v<C, RootChain>)
                return "Root";
            else if constexpr (std::is_same_v<C, GroupChain>)
                return "Group";
            else
                return "Leaf";
        }

    } // namespace

    // ===========================================
    // Report rendering
    // ===========================================

    std::string BulkAppendReport::toJson() const {
        std::stringstream ss;
        ss << "{\"successful\":" << successful << ",\"failed\":" << failed << ",\"items\":[";
        for (size_t i = 0; i < items.size(); ++i) {
            const auto &item = items[i];
            if (i > 0)
                ss << ",";
            ss << "{\"leafId\":" << JsonSerializer::quote(item.leaf_id)
               << ",\"date\":" << JsonSerializer::quote(item.date) << ",\"ok\":" << JsonSerializer::boolean(item.ok);
            if (item.ok)
                ss << ",\"blockIndex\":" << item.block_index;
            else
                ss << ",\"error\":" << JsonSerializer::quote(item.error);
            ss << "}";
        }
        ss << "]}";
        return ss.str();
    }

    std::string RegistryStats::toJson() const {
        std::stringstream ss;
        ss << "{\"roots\":" << roots << ",\"groups\":" << groups << ",\"leaves\":" << leaves
           << ",\"totalBlocks\":" << total_blocks << ",\"records\":" << records << "}";
        return ss.str();
    }

    // ===========================================
    // Slot helpers
    // ===========================================

    template <typename C> ChainRegistry::SlotMap<C> &ChainRegistry::slots() {
        if constexpr (std::is_same_v<C, RootChain>)
            return roots_;
        else if constexpr (std::is_same_v<C, GroupChain>)
            return groups_;
        else
            return leaves_;
    }

    template <typename C> const ChainRegistry::SlotMap<C> &ChainRegistry::slots() const {
        if constexpr (std::is_same_v<C, RootChain>)
            return roots_;
        else if constexpr (std::is_same_v<C, GroupChain>)
            return groups_;
        else
            return leaves_;
    }

    template <typename C> std::shared_ptr<ChainRegistry::Slot<C>> ChainRegistry::findSlot(const std::string &id) const {
        std::shared_lock lock(map_mutex_);
        const auto &map = slots<C>();
        auto it = map.find(id);
        if (it == map.end())
            return nullptr;
        return it->second;
    }

    template <typename C> dp::Result<C, dp::Error> ChainRegistry::getChain(const std::string &id) const {
        auto slot = findSlot<C>(id);
        if (slot) {
            std::shared_lock data(slot->data_mutex);
            if (slot->ready)
                return dp::Result<C, dp::Error>::ok(*slot->chain);
        }
        return dp::Result<C, dp::Error>::err(not_found_error(std::string(levelName<C>()) + " chain " + id +
                                                             " not found"));
    }

    template <typename C> std::vector<C> ChainRegistry::listChains() const {
        std::vector<std::shared_ptr<Slot<C>>> candidates;
        {
            std::shared_lock lock(map_mutex_);
            for (const auto &[id, slot] : slots<C>())
                candidates.push_back(slot);
        }

        std::vector<C> chains;
        for (const auto &slot : candidates) {
            std::shared_lock data(slot->data_mutex);
            if (slot->ready)
                chains.push_back(*slot->chain);
        }
        std::sort(chains.begin(), chains.end(), [](const C &a, const C &b) { return a.id() < b.id(); });
        return chains;
    }

    template <typename Apply>
    dp::Result<void, dp::Error> ChainRegistry::persistAndCommit(const ledger::EntityChain &entity, const Block &block,
                                                                Apply &&apply) {
        std::shared_lock commit(commit_mutex_);
        if (store_) {
            auto written = store_->append(storage::makeJournalEntry(entity, block));
            if (!written.is_ok()) {
                std::cerr << "Failed to journal block " << block.index_ << " of " << entity.id() << ": "
                          << errorMessage(written.error()) << std::endl;
                return written;
            }
        }
        return apply();
    }

    template <typename C> dp::Result<C, dp::Error> ChainRegistry::createChain(C chain, const Fields &fields) {
        auto open = requireOpen();
        if (!open.is_ok())
            return dp::Result<C, dp::Error>::err(open.error());
        if (chain.id().empty())
            return dp::Result<C, dp::Error>::err(input_error("Entity id must not be empty"));

        const std::string id = chain.id();
        auto slot = std::make_shared<Slot<C>>();
        std::unique_lock<std::mutex> write(slot->write_mutex);
        {
            std::unique_lock lock(map_mutex_);
            auto &map = slots<C>();
            if (map.find(id) != map.end()) {
                return dp::Result<C, dp::Error>::err(
                    conflict(std::string(levelName<C>()) + " chain " + id + " already exists"));
            }
            map.emplace(id, slot);
        }

        auto release = [&] {
            std::unique_lock lock(map_mutex_);
            slots<C>().erase(id);
        };

        auto genesis = chain.prepareGenesis(fields);
        if (!genesis.is_ok()) {
            release();
            return dp::Result<C, dp::Error>::err(genesis.error());
        }

        auto committed = persistAndCommit(chain, genesis.value(), [&] {
            std::unique_lock data(slot->data_mutex);
            auto result = chain.commit(genesis.value());
            if (result.is_ok()) {
                slot->chain = chain;
                slot->ready = true;
            }
            return result;
        });
        if (!committed.is_ok()) {
            release();
            return dp::Result<C, dp::Error>::err(committed.error());
        }

        if (options_.verbose) {
            std::cout << levelName<C>() << " chain " << id << " created (genesis "
                      << ledger::shortHash(chain.latestHash()) << ")" << std::endl;
        }
        write.unlock();
        maybeCompact();
        return dp::Result<C, dp::Error>::ok(chain);
    }

    template <typename C, typename Prepare>
    dp::Result<Block, dp::Error> ChainRegistry::mutate(const std::string &id, Prepare &&prepare) {
        auto open = requireOpen();
        if (!open.is_ok())
            return dp::Result<Block, dp::Error>::err(open.error());

        auto slot = findSlot<C>(id);
        auto missing = [&] {
            return dp::Result<Block, dp::Error>::err(
                not_found_error(std::string(levelName<C>()) + " chain " + id + " not found"));
        };
        if (!slot)
            return missing();

        auto result = [&]() -> dp::Result<Block, dp::Error> {
            std::lock_guard<std::mutex> write(slot->write_mutex);
            {
                std::shared_lock data(slot->data_mutex);
                if (!slot->ready)
                    return missing();
            }

            // The chain only changes under write_mutex, so mining may read it without the data lock
            C &chain = *slot->chain;
            auto block = prepare(static_cast<const C &>(chain));
            if (!block.is_ok())
                return block;

            auto committed = persistAndCommit(chain, block.value(), [&] {
                std::unique_lock data(slot->data_mutex);
                return chain.commit(block.value());
            });
            if (!committed.is_ok())
                return dp::Result<Block, dp::Error>::err(committed.error());
            return block;
        }();

        if (result.is_ok())
            maybeCompact();
        return result;
    }

    template <typename C> dp::Result<void, dp::Error> ChainRegistry::tamper(const std::string &id) {
        auto slot = findSlot<C>(id);
        if (!slot) {
            return dp::Result<void, dp::Error>::err(
                not_found_error(std::string(levelName<C>()) + " chain " + id + " not found"));
        }

        std::lock_guard<std::mutex> write(slot->write_mutex);
        std::shared_lock commit(commit_mutex_);
        std::unique_lock data(slot->data_mutex);
        if (!slot->ready) {
            return dp::Result<void, dp::Error>::err(
                not_found_error(std::string(levelName<C>()) + " chain " + id + " not found"));
        }

        auto &blocks = slot->chain->chain().blocks_;
        if (blocks.size() < 2)
            return dp::Result<void, dp::Error>::err(input_error("Need at least 2 blocks to simulate tampering"));

        if (!slot->untampered.has_value())
            slot->untampered = blocks[1];

        auto &payload = blocks[1].payload_;
        if (payload.empty())
            payload.push_back(ledger::PayloadEntry::update({{"tampered", "true"}}));
        else
            payload.front().data["tampered"] = "true";

        std::cout << "Tampering simulated on " << levelName<C>() << " chain " << id << " block 1" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    template <typename C> void ChainRegistry::collectRecords(dp::Vector<storage::EntityRecord> &out) const {
        std::vector<std::pair<std::string, std::shared_ptr<Slot<C>>>> entries(slots<C>().begin(), slots<C>().end());
        std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) { return a.first < b.first; });

        for (const auto &[id, slot] : entries) {
            std::shared_lock data(slot->data_mutex);
            if (!slot->ready)
                continue;
            auto record = storage::toEntityRecord(*slot->chain);
            // Tamper drills stay in memory
            if (slot->untampered.has_value() && record.chain.size() > 1)
                record.chain[1] = storage::toBlockRecord(*slot->untampered);
            out.push_back(record);
        }
    }

    // ===========================================
    // Lifecycle
    // ===========================================

    ChainRegistry::ChainRegistry(LedgerOptions options) : options_(std::move(options)) {}

    ChainRegistry::~ChainRegistry() {
        // Queued tasks call back into the registry
        if (pool_)
            pool_->stop();
        if (store_)
            store_->close();
    }

    dp::Result<void, dp::Error> ChainRegistry::open() {
        if (is_open_)
            return dp::Result<void, dp::Error>::ok();

        auto valid = options_.validate();
        if (!valid.is_ok())
            return valid;

        if (options_.persistent()) {
            auto store = std::make_unique<storage::JournalStore>();
            auto opened = store->open(options_.storage_path, options_.verbose);
            if (!opened.is_ok())
                return opened;

            auto state = store->load();
            if (!state.is_ok())
                return dp::Result<void, dp::Error>::err(state.error());

            auto restored = restore(state.value());
            if (!restored.is_ok())
                return restored;
            store_ = std::move(store);
        }

        pool_ = std::make_unique<WorkerPool>(options_.mining_workers);
        is_open_ = true;

        if (options_.verbose) {
            std::cout << "Registry opened (difficulty " << options_.difficulty << ", "
                      << (store_ ? "storage " + options_.storage_path : std::string("in memory")) << ")"
                      << std::endl;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ChainRegistry::requireOpen() const {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Registry not open"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ChainRegistry::restore(const storage::SnapshotRecord &state) {
        std::unique_lock lock(map_mutex_);

        for (const auto &record : state.roots) {
            auto root = storage::restoreRoot(record);
            if (!root.is_ok())
                return dp::Result<void, dp::Error>::err(root.error());
            auto slot = std::make_shared<Slot<RootChain>>();
            slot->chain = root.value();
            slot->ready = true;
            roots_[root.value().id()] = slot;
        }
        for (const auto &record : state.groups) {
            auto group = storage::restoreGroup(record);
            if (!group.is_ok())
                return dp::Result<void, dp::Error>::err(group.error());
            auto slot = std::make_shared<Slot<GroupChain>>();
            slot->chain = group.value();
            slot->ready = true;
            groups_[group.value().id()] = slot;
        }
        for (const auto &record : state.leaves) {
            auto leaf = storage::restoreLeaf(record);
            if (!leaf.is_ok())
                return dp::Result<void, dp::Error>::err(leaf.error());
            auto slot = std::make_shared<Slot<LeafChain>>();
            slot->chain = leaf.value();
            slot->ready = true;
            leaves_[leaf.value().id()] = slot;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Creation
    // ===========================================

    dp::Result<RootChain, dp::Error> ChainRegistry::createRoot(const std::string &id, const std::string &name,
                                                               const Fields &fields) {
        return createChain(RootChain(id, name, options_.difficulty), fields);
    }

    dp::Result<GroupChain, dp::Error> ChainRegistry::createGroup(const std::string &id, const std::string &name,
                                                                 const std::string &root_id, const Fields &fields) {
        auto root = getChain<RootChain>(root_id);
        if (!root.is_ok())
            return dp::Result<GroupChain, dp::Error>::err(root.error());

        return createChain(GroupChain(id, name, root_id, root.value().latestHash(), options_.difficulty), fields);
    }

    dp::Result<LeafChain, dp::Error> ChainRegistry::createLeaf(const std::string &id, const std::string &name,
                                                               const std::string &group_id, const Fields &fields) {
        auto group = getChain<GroupChain>(group_id);
        if (!group.is_ok())
            return dp::Result<LeafChain, dp::Error>::err(group.error());

        const auto &parent = group.value();
        return createChain(LeafChain(id, name, group_id, parent.rootId(), parent.latestHash(), options_.difficulty),
                           fields);
    }

    // ===========================================
    // Lookup
    // ===========================================

    dp::Result<RootChain, dp::Error> ChainRegistry::getRoot(const std::string &id) const {
        return getChain<RootChain>(id);
    }

    dp::Result<GroupChain, dp::Error> ChainRegistry::getGroup(const std::string &id) const {
        return getChain<GroupChain>(id);
    }

    dp::Result<LeafChain, dp::Error> ChainRegistry::getLeaf(const std::string &id) const {
        return getChain<LeafChain>(id);
    }

    bool ChainRegistry::contains(EntityKind kind, const std::string &id) const {
        switch (kind) {
        case EntityKind::Root:
            return getChain<RootChain>(id).is_ok();
        case EntityKind::Group:
            return getChain<GroupChain>(id).is_ok();
        case EntityKind::Leaf:
            return getChain<LeafChain>(id).is_ok();
        default:
            return false;
        }
    }

    std::vector<RootChain> ChainRegistry::listRoots() const { return listChains<RootChain>(); }
    std::vector<GroupChain> ChainRegistry::listGroups() const { return listChains<GroupChain>(); }
    std::vector<LeafChain> ChainRegistry::listLeaves() const { return listChains<LeafChain>(); }

    std::vector<GroupChain> ChainRegistry::listGroupsByRoot(const std::string &root_id) const {
        auto groups = listChains<GroupChain>();
        groups.erase(std::remove_if(groups.begin(), groups.end(),
                                    [&](const GroupChain &g) { return g.rootId() != root_id; }),
                     groups.end());
        return groups;
    }

    std::vector<LeafChain> ChainRegistry::listLeavesByGroup(const std::string &group_id) const {
        auto leaves = listChains<LeafChain>();
        leaves.erase(std::remove_if(leaves.begin(), leaves.end(),
                                    [&](const LeafChain &l) { return l.groupId() != group_id; }),
                     leaves.end());
        return leaves;
    }

    std::vector<LeafChain> ChainRegistry::listLeavesByRoot(const std::string &root_id) const {
        auto leaves = listChains<LeafChain>();
        leaves.erase(std::remove_if(leaves.begin(), leaves.end(),
                                    [&](const LeafChain &l) { return l.rootId() != root_id; }),
                     leaves.end());
        return leaves;
    }

    // ===========================================
    // Update and soft delete
    // ===========================================

    dp::Result<Block, dp::Error> ChainRegistry::update(EntityKind kind, const std::string &id, const Fields &patch) {
        auto prepare = [&](const auto &chain) { return chain.prepareUpdate(patch); };
        auto result = [&]() {
            switch (kind) {
            case EntityKind::Root:
                return mutate<RootChain>(id, prepare);
            case EntityKind::Group:
                return mutate<GroupChain>(id, prepare);
            case EntityKind::Leaf:
                return mutate<LeafChain>(id, prepare);
            default:
                return dp::Result<Block, dp::Error>::err(input_error("Unknown entity kind"));
            }
        }();
        if (result.is_ok() && options_.verbose) {
            std::cout << "Updated " << ledger::entityKindToString(kind) << " " << id << " (block "
                      << result.value().index_ << ")" << std::endl;
        }
        return result;
    }

    dp::Result<Block, dp::Error> ChainRegistry::remove(EntityKind kind, const std::string &id) {
        auto prepare = [](const auto &chain) { return chain.prepareDelete(); };
        auto result = [&]() {
            switch (kind) {
            case EntityKind::Root:
                return mutate<RootChain>(id, prepare);
            case EntityKind::Group:
                return mutate<GroupChain>(id, prepare);
            case EntityKind::Leaf:
                return mutate<LeafChain>(id, prepare);
            default:
                return dp::Result<Block, dp::Error>::err(input_error("Unknown entity kind"));
            }
        }();
        if (result.is_ok() && options_.verbose) {
            std::cout << "Soft-deleted " << ledger::entityKindToString(kind) << " " << id << " (block "
                      << result.value().index_ << ")" << std::endl;
        }
        return result;
    }

    // ===========================================
    // Leaf records
    // ===========================================

    dp::Result<Block, dp::Error> ChainRegistry::appendRecord(const std::string &leaf_id,
                                                             const ledger::AttendanceEntry &entry) {
        auto result = mutate<LeafChain>(leaf_id, [&](const LeafChain &leaf) { return leaf.prepareRecord(entry); });
        if (result.is_ok() && options_.verbose) {
            const auto &data = result.value().payload_.front().data;
            std::cout << "Recorded " << data.at("status") << " for " << leaf_id << " on " << data.at("date")
                      << " (block " << result.value().index_ << ")" << std::endl;
        }
        return result;
    }

    std::future<dp::Result<Block, dp::Error>> ChainRegistry::appendRecordAsync(const std::string &leaf_id,
                                                                               const ledger::AttendanceEntry &entry) {
        if (!pool_) {
            std::promise<dp::Result<Block, dp::Error>> failed;
            failed.set_value(dp::Result<Block, dp::Error>::err(storage_error("Registry not open")));
            return failed.get_future();
        }
        return pool_->submit([this, leaf_id, entry] { return appendRecord(leaf_id, entry); });
    }

    BulkAppendReport ChainRegistry::appendRecords(const std::vector<BulkRecordRequest> &requests) {
        BulkAppendReport report;
        report.items.resize(requests.size());

        std::map<std::string, std::vector<size_t>> by_leaf;
        for (size_t i = 0; i < requests.size(); ++i) {
            report.items[i].leaf_id = requests[i].leaf_id;
            report.items[i].date = requests[i].entry.date;
            by_leaf[requests[i].leaf_id].push_back(i);
        }

        auto run = [this, &requests, &report](const std::vector<size_t> &indices) {
            for (size_t i : indices) {
                auto result = appendRecord(requests[i].leaf_id, requests[i].entry);
                auto &item = report.items[i];
                item.ok = result.is_ok();
                if (result.is_ok()) {
                    item.block_index = result.value().index_;
                    item.date = result.value().payload_.front().data.at("date");
                } else {
                    item.error = errorMessage(result.error());
                }
            }
        };

        if (pool_) {
            std::vector<std::future<void>> pending;
            for (const auto &[leaf_id, indices] : by_leaf)
                pending.push_back(pool_->submit([&run, indices = indices] { run(indices); }));
            for (auto &f : pending)
                f.get();
        } else {
            for (const auto &[leaf_id, indices] : by_leaf)
                run(indices);
        }

        for (const auto &item : report.items) {
            if (item.ok)
                report.successful++;
            else
                report.failed++;
        }
        if (options_.verbose) {
            std::cout << "Bulk append: " << report.successful << " succeeded, " << report.failed << " failed"
                      << std::endl;
        }
        return report;
    }

    dp::Result<ledger::AttendanceRecord, dp::Error> ChainRegistry::recordByDate(const std::string &leaf_id,
                                                                                const std::string &date) const {
        auto leaf = getLeaf(leaf_id);
        if (!leaf.is_ok())
            return dp::Result<ledger::AttendanceRecord, dp::Error>::err(leaf.error());

        auto record = leaf.value().recordByDate(date);
        if (!record.has_value()) {
            return dp::Result<ledger::AttendanceRecord, dp::Error>::err(
                not_found_error("No record for " + leaf_id + " on " + date));
        }
        return dp::Result<ledger::AttendanceRecord, dp::Error>::ok(*record);
    }

    dp::Result<std::vector<ledger::AttendanceRecord>, dp::Error>
    ChainRegistry::history(const std::string &leaf_id) const {
        auto leaf = getLeaf(leaf_id);
        if (!leaf.is_ok())
            return dp::Result<std::vector<ledger::AttendanceRecord>, dp::Error>::err(leaf.error());
        return dp::Result<std::vector<ledger::AttendanceRecord>, dp::Error>::ok(leaf.value().history());
    }

    dp::Result<ledger::AttendanceStats, dp::Error> ChainRegistry::leafStats(const std::string &leaf_id) const {
        auto leaf = getLeaf(leaf_id);
        if (!leaf.is_ok())
            return dp::Result<ledger::AttendanceStats, dp::Error>::err(leaf.error());
        return dp::Result<ledger::AttendanceStats, dp::Error>::ok(leaf.value().stats());
    }

    std::vector<DailyRecord> ChainRegistry::dailyRecords(const std::vector<LeafChain> &leaves,
                                                         const std::string &date) const {
        std::vector<DailyRecord> daily;
        for (const auto &leaf : leaves) {
            if (leaf.isDeleted())
                continue;
            daily.push_back(DailyRecord{leaf.id(), leaf.displayName(), leaf.recordByDate(date)});
        }
        return daily;
    }

    dp::Result<std::vector<DailyRecord>, dp::Error> ChainRegistry::recordsForGroupOnDate(const std::string &group_id,
                                                                                         const std::string &date) const {
        if (!ledger::isValidDate(date))
            return dp::Result<std::vector<DailyRecord>, dp::Error>::err(input_error("Invalid date: " + date));
        auto group = getGroup(group_id);
        if (!group.is_ok())
            return dp::Result<std::vector<DailyRecord>, dp::Error>::err(group.error());
        return dp::Result<std::vector<DailyRecord>, dp::Error>::ok(dailyRecords(listLeavesByGroup(group_id), date));
    }

    dp::Result<std::vector<DailyRecord>, dp::Error> ChainRegistry::recordsForRootOnDate(const std::string &root_id,
                                                                                        const std::string &date) const {
        if (!ledger::isValidDate(date))
            return dp::Result<std::vector<DailyRecord>, dp::Error>::err(input_error("Invalid date: " + date));
        auto root = getRoot(root_id);
        if (!root.is_ok())
            return dp::Result<std::vector<DailyRecord>, dp::Error>::err(root.error());
        return dp::Result<std::vector<DailyRecord>, dp::Error>::ok(dailyRecords(listLeavesByRoot(root_id), date));
    }

    // ===========================================
    // Maintenance
    // ===========================================

    RegistryStats ChainRegistry::stats() const {
        RegistryStats stats;
        for (const auto &root : listRoots()) {
            stats.roots++;
            stats.total_blocks += root.length();
        }
        for (const auto &group : listGroups()) {
            stats.groups++;
            stats.total_blocks += group.length();
        }
        for (const auto &leaf : listLeaves()) {
            stats.leaves++;
            stats.total_blocks += leaf.length();
            stats.records += leaf.history().size();
        }
        return stats;
    }

    dp::Result<void, dp::Error> ChainRegistry::simulateTampering(EntityKind kind, const std::string &id) {
        switch (kind) {
        case EntityKind::Root:
            return tamper<RootChain>(id);
        case EntityKind::Group:
            return tamper<GroupChain>(id);
        case EntityKind::Leaf:
            return tamper<LeafChain>(id);
        default:
            return dp::Result<void, dp::Error>::err(input_error("Unknown entity kind"));
        }
    }

    storage::SnapshotRecord ChainRegistry::snapshot() const {
        storage::SnapshotRecord state;
        std::shared_lock lock(map_mutex_);
        collectRecords<RootChain>(state.roots);
        collectRecords<GroupChain>(state.groups);
        collectRecords<LeafChain>(state.leaves);
        return state;
    }

    dp::Result<void, dp::Error> ChainRegistry::compact() {
        auto open = requireOpen();
        if (!open.is_ok())
            return open;
        if (!store_)
            return dp::Result<void, dp::Error>::err(storage_error("Registry has no storage path"));

        std::unique_lock commit(commit_mutex_);
        return store_->compact(snapshot());
    }

    void ChainRegistry::maybeCompact() {
        if (!store_ || !store_->needsCompaction(options_.compaction_threshold))
            return;

        std::unique_lock commit(commit_mutex_);
        // Another writer may have compacted while this one waited
        if (!store_->needsCompaction(options_.compaction_threshold))
            return;
        auto compacted = store_->compact(snapshot());
        if (!compacted.is_ok())
            std::cerr << "Compaction failed: " << errorMessage(compacted.error()) << std::endl;
    }

    dp::Result<void, dp::Error> ChainRegistry::exportJson(const std::string &dir) const {
        return storage::JournalStore::exportJson(snapshot(), dir);
    }

} // namespace tierchain::registry
