#include <tierchain/common/error.hpp>
#include <tierchain/ledger/entity_chain.hpp>

#include <iostream>

namespace tierchain::ledger {

    // ===========================================
    // EntityChain
    // ===========================================

    EntityChain::EntityChain(EntityKind kind, std::string id, std::string display_name, int difficulty)
        : kind_(kind), id_(std::move(id)), display_name_(std::move(display_name)), chain_(difficulty) {}

    std::string EntityChain::expectedGenesisPrevHash() const {
        return parent_link_hash_.has_value() ? *parent_link_hash_ : std::string(Chain::ROOT_MARKER);
    }

    Fields EntityChain::genesisData(const Fields &fields) const {
        Fields data = fields;
        for (const auto &[key, value] : parent_fields_)
            data[key] = value;
        data["id"] = id_;
        data["name"] = display_name_;
        data["status"] = "active";
        data["createdAt"] = std::to_string(currentTimeMillis());
        return data;
    }

    dp::Result<Block, dp::Error> EntityChain::prepareGenesis(const Fields &fields) const {
        if (id_.empty())
            return dp::Result<Block, dp::Error>::err(input_error("Entity id must not be empty"));
        std::vector<PayloadEntry> payload{PayloadEntry::create(kind_, genesisData(fields))};
        return chain_.prepareGenesis(std::move(payload), expectedGenesisPrevHash());
    }

    dp::Result<Block, dp::Error> EntityChain::prepareUpdate(const Fields &patch) const {
        if (patch.empty())
            return dp::Result<Block, dp::Error>::err(input_error("Update patch is empty"));
        for (const auto &[key, value] : patch) {
            if (key.empty())
                return dp::Result<Block, dp::Error>::err(input_error("Update patch has an empty field name"));
            if (key == "id")
                return dp::Result<Block, dp::Error>::err(input_error("Entity id cannot be updated"));
            if (key == "status")
                return dp::Result<Block, dp::Error>::err(input_error("Status only changes through deletion"));
        }
        std::vector<PayloadEntry> payload{PayloadEntry::update(patch)};
        return chain_.prepareNext(std::move(payload));
    }

    dp::Result<Block, dp::Error> EntityChain::prepareDelete() const {
        std::vector<PayloadEntry> payload{PayloadEntry::remove()};
        return chain_.prepareNext(std::move(payload));
    }

    dp::Result<void, dp::Error> EntityChain::commit(const Block &block) { return chain_.commit(block); }

    dp::Result<void, dp::Error> EntityChain::initialize(const Fields &fields) {
        auto genesis = prepareGenesis(fields);
        if (!genesis.is_ok())
            return dp::Result<void, dp::Error>::err(genesis.error());
        return commit(genesis.value());
    }

    dp::Result<Block, dp::Error> EntityChain::appendUpdate(const Fields &patch) {
        auto block = prepareUpdate(patch);
        if (!block.is_ok())
            return block;
        auto committed = commit(block.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());
        return block;
    }

    dp::Result<Block, dp::Error> EntityChain::appendDelete() {
        auto block = prepareDelete();
        if (!block.is_ok())
            return block;
        auto committed = commit(block.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());
        return block;
    }

    Fields EntityChain::currentState() const {
        Fields state;
        bool created = false;
        for (const auto &block : chain_.blocks_) {
            for (const auto &entry : block.payload_) {
                switch (entry.kind) {
                case PayloadKind::Create:
                    if (!created) {
                        state = entry.data;
                        created = true;
                    }
                    break;
                case PayloadKind::Update:
                    for (const auto &[key, value] : entry.data)
                        state[key] = value;
                    break;
                case PayloadKind::Delete:
                    state["status"] = "deleted";
                    break;
                case PayloadKind::Record:
                    break;
                }
            }
        }
        return state;
    }

    bool EntityChain::isDeleted() const {
        auto state = currentState();
        auto it = state.find("status");
        return it != state.end() && it->second == "deleted";
    }

    bool EntityChain::validateParentLink(const std::string &current_parent_hash) const {
        (void)current_parent_hash; // Growth is reported by parentHasGrown(), never as a failure
        if (chain_.empty())
            return false;
        return chain_.genesis().previous_hash_ == expectedGenesisPrevHash();
    }

    bool EntityChain::parentHasGrown(const std::string &current_parent_hash) const {
        return parent_link_hash_.has_value() && current_parent_hash != *parent_link_hash_;
    }

    // ===========================================
    // Variants
    // ===========================================

    RootChain::RootChain(std::string id, std::string display_name, int difficulty)
        : EntityChain(EntityKind::Root, std::move(id), std::move(display_name), difficulty) {}

    GroupChain::GroupChain(std::string id, std::string display_name, std::string root_id,
                           std::string parent_link_hash, int difficulty)
        : EntityChain(EntityKind::Group, std::move(id), std::move(display_name), difficulty) {
        parent_id_ = std::move(root_id);
        parent_link_hash_ = std::move(parent_link_hash);
        parent_fields_["rootId"] = parent_id_;
    }

    LeafChain::LeafChain(std::string id, std::string display_name, std::string group_id, std::string root_id,
                         std::string parent_link_hash, int difficulty)
        : EntityChain(EntityKind::Leaf, std::move(id), std::move(display_name), difficulty),
          root_id_(std::move(root_id)) {
        parent_id_ = std::move(group_id);
        parent_link_hash_ = std::move(parent_link_hash);
        parent_fields_["groupId"] = parent_id_;
        parent_fields_["rootId"] = root_id_;
    }

    dp::Result<Block, dp::Error> LeafChain::prepareRecord(const AttendanceEntry &entry) const {
        if (isDeleted())
            return dp::Result<Block, dp::Error>::err(input_error("Cannot record attendance for deleted leaf " + id_));

        std::string date = entry.date.empty() ? formatDate() : entry.date;
        if (!isValidDate(date))
            return dp::Result<Block, dp::Error>::err(input_error("Invalid date format. Use YYYY-MM-DD: " + date));

        if (recordByDate(date).has_value())
            return dp::Result<Block, dp::Error>::err(conflict("Attendance already marked for " + date));

        Fields data = entry.extra;
        data["leafId"] = id_;
        data["leafName"] = display_name_;
        data["groupId"] = parent_id_;
        data["rootId"] = root_id_;
        data["date"] = date;
        data["status"] = attendanceStatusToString(entry.status);
        data["markedAt"] = std::to_string(currentTimeMillis());
        if (!entry.marked_by.empty())
            data["markedBy"] = entry.marked_by;

        std::vector<PayloadEntry> payload{PayloadEntry::record(std::move(data))};
        return chain_.prepareNext(std::move(payload));
    }

    dp::Result<Block, dp::Error> LeafChain::appendRecord(const AttendanceEntry &entry) {
        auto block = prepareRecord(entry);
        if (!block.is_ok())
            return block;
        auto committed = commit(block.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());
        return block;
    }

    std::vector<AttendanceRecord> LeafChain::history() const {
        std::vector<AttendanceRecord> records;
        for (const auto &block : chain_.blocks_) {
            for (const auto &entry : block.payload_) {
                if (entry.kind != PayloadKind::Record)
                    continue;
                auto record = AttendanceRecord::fromPayload(entry, block.index_);
                if (record.is_ok())
                    records.push_back(record.value());
                else
                    std::cerr << "Leaf " << id_ << " block " << block.index_
                              << ": unreadable record skipped: " << errorMessage(record.error()) << std::endl;
            }
        }
        return records;
    }

    size_t LeafChain::unreadableRecords() const {
        size_t count = 0;
        for (const auto &block : chain_.blocks_) {
            for (const auto &entry : block.payload_) {
                if (entry.kind == PayloadKind::Record && !AttendanceRecord::fromPayload(entry, block.index_).is_ok())
                    count++;
            }
        }
        return count;
    }

    std::optional<AttendanceRecord> LeafChain::recordByDate(const std::string &date) const {
        for (const auto &block : chain_.blocks_) {
            for (const auto &entry : block.payload_) {
                if (entry.kind != PayloadKind::Record)
                    continue;
                auto it = entry.data.find("date");
                if (it == entry.data.end() || it->second != date)
                    continue;
                auto record = AttendanceRecord::fromPayload(entry, block.index_);
                if (record.is_ok())
                    return record.value();
            }
        }
        return std::nullopt;
    }

    AttendanceStats LeafChain::stats() const { return computeStats(history()); }

} // namespace tierchain::ledger
