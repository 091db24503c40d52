#include <tierchain/common/error.hpp>
#include <tierchain/storage/records.hpp>

#include <sstream>

namespace tierchain::storage {

    using ledger::JsonSerializer;

    namespace {

        std::string str(const dp::String &value) { return std::string(value.c_str()); }

        dp::String dstr(const std::string &value) { return dp::String(value.c_str()); }

        dp::Result<void, dp::Error> restoreBlocks(ledger::EntityChain &entity, const EntityRecord &record) {
            if (record.chain.size() == 0)
                return dp::Result<void, dp::Error>::err(storage_error("Record " + str(record.id) + " has no blocks"));
            for (const auto &block_record : record.chain) {
                auto block = toBlock(block_record);
                if (!block.is_ok())
                    return dp::Result<void, dp::Error>::err(block.error());
                if (block.value().index_ != entity.chain().length()) {
                    return dp::Result<void, dp::Error>::err(
                        storage_error("Block " + std::to_string(block.value().index_) + " of " + str(record.id) +
                                      " is out of sequence"));
                }
                entity.chain().blocks_.push_back(block.value());
            }
            return dp::Result<void, dp::Error>::ok();
        }

        dp::Result<void, dp::Error> expectKind(const EntityRecord &record, ledger::EntityKind kind) {
            if (record.kind != static_cast<dp::u8>(kind)) {
                return dp::Result<void, dp::Error>::err(storage_error("Record " + str(record.id) + " is not a " +
                                                                      ledger::entityKindToString(kind)));
            }
            if (kind != ledger::EntityKind::Root && record.has_parent_link == 0) {
                return dp::Result<void, dp::Error>::err(
                    storage_error("Record " + str(record.id) + " is missing its parent link"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    // ===========================================
    // JSON rendering
    // ===========================================

    std::string TransactionRecord::toJson() const {
        std::stringstream ss;
        ss << "{\"type\":" << JsonSerializer::quote(str(type))
           << ",\"data\":" << JsonSerializer::serializeFields(toFields(data)) << ",\"timestamp\":" << timestamp
           << "}";
        return ss.str();
    }

    std::string BlockRecord::toJson() const {
        std::stringstream ss;
        ss << "{\"index\":" << index << ",\"timestamp\":" << timestamp
           << ",\"prev_hash\":" << JsonSerializer::quote(str(prev_hash)) << ",\"nonce\":" << nonce
           << ",\"hash\":" << JsonSerializer::quote(str(hash)) << ",\"transactions\":[";
        bool first = true;
        for (const auto &tx : transactions) {
            if (!first)
                ss << ",";
            ss << tx.toJson();
            first = false;
        }
        ss << "]}";
        return ss.str();
    }

    std::string EntityRecord::toJson() const {
        std::stringstream ss;
        ss << "{\"id\":" << JsonSerializer::quote(str(id))
           << ",\"display_name\":" << JsonSerializer::quote(str(display_name));
        if (!str(root_id).empty())
            ss << ",\"rootId\":" << JsonSerializer::quote(str(root_id));
        if (!str(group_id).empty())
            ss << ",\"groupId\":" << JsonSerializer::quote(str(group_id));
        if (has_parent_link != 0)
            ss << ",\"parent_link_hash\":" << JsonSerializer::quote(str(parent_link_hash));
        ss << ",\"difficulty\":" << difficulty << ",\"chain\":[";
        bool first = true;
        for (const auto &block : chain) {
            if (!first)
                ss << ",";
            ss << block.toJson();
            first = false;
        }
        ss << "]}";
        return ss.str();
    }

    std::string toJsonArray(const dp::Vector<EntityRecord> &records) {
        std::stringstream ss;
        ss << "[";
        bool first = true;
        for (const auto &record : records) {
            ss << (first ? "\n  " : ",\n  ") << record.toJson();
            first = false;
        }
        ss << (records.size() == 0 ? "]" : "\n]") << "\n";
        return ss.str();
    }

    // ===========================================
    // Conversions
    // ===========================================

    dp::Vector<FieldRecord> toFieldRecords(const ledger::Fields &fields) {
        dp::Vector<FieldRecord> records;
        for (const auto &[key, value] : fields) {
            FieldRecord record;
            record.key = dstr(key);
            record.value = dstr(value);
            records.push_back(record);
        }
        return records;
    }

    ledger::Fields toFields(const dp::Vector<FieldRecord> &records) {
        ledger::Fields fields;
        for (const auto &record : records)
            fields[str(record.key)] = str(record.value);
        return fields;
    }

    BlockRecord toBlockRecord(const ledger::Block &block) {
        BlockRecord record;
        record.index = block.index_;
        record.timestamp = block.timestamp_;
        record.prev_hash = dstr(block.previous_hash_);
        record.nonce = block.nonce_;
        record.hash = dstr(block.hash_);
        for (const auto &entry : block.payload_) {
            TransactionRecord tx;
            tx.type = dstr(entry.type);
            tx.data = toFieldRecords(entry.data);
            tx.timestamp = entry.timestamp;
            record.transactions.push_back(tx);
        }
        return record;
    }

    dp::Result<ledger::Block, dp::Error> toBlock(const BlockRecord &record) {
        ledger::Block block;
        block.index_ = record.index;
        block.timestamp_ = record.timestamp;
        block.previous_hash_ = str(record.prev_hash);
        block.nonce_ = record.nonce;
        block.hash_ = str(record.hash);
        for (const auto &tx : record.transactions) {
            auto kind = ledger::parsePayloadLabel(str(tx.type));
            if (!kind.is_ok())
                return dp::Result<ledger::Block, dp::Error>::err(storage_error(errorMessage(kind.error())));
            block.payload_.emplace_back(kind.value(), str(tx.type), toFields(tx.data), tx.timestamp);
        }
        return dp::Result<ledger::Block, dp::Error>::ok(block);
    }

    EntityRecord toMetadataRecord(const ledger::EntityChain &entity) {
        EntityRecord record;
        record.kind = static_cast<dp::u8>(entity.kind());
        record.id = dstr(entity.id());
        record.display_name = dstr(entity.displayName());
        auto root = entity.parentFields().find("rootId");
        if (root != entity.parentFields().end())
            record.root_id = dstr(root->second);
        auto group = entity.parentFields().find("groupId");
        if (group != entity.parentFields().end())
            record.group_id = dstr(group->second);
        if (entity.parentLinkHash().has_value()) {
            record.has_parent_link = 1;
            record.parent_link_hash = dstr(*entity.parentLinkHash());
        }
        record.difficulty = entity.difficulty();
        return record;
    }

    EntityRecord toEntityRecord(const ledger::EntityChain &entity) {
        EntityRecord record = toMetadataRecord(entity);
        for (const auto &block : entity.chain().blocks_)
            record.chain.push_back(toBlockRecord(block));
        return record;
    }

    JournalEntry makeJournalEntry(const ledger::EntityChain &entity, const ledger::Block &block) {
        JournalEntry entry;
        entry.entity = toMetadataRecord(entity);
        entry.block = toBlockRecord(block);
        return entry;
    }

    // ===========================================
    // Restoring entity chains
    // ===========================================

    dp::Result<ledger::RootChain, dp::Error> restoreRoot(const EntityRecord &record) {
        auto kind = expectKind(record, ledger::EntityKind::Root);
        if (!kind.is_ok())
            return dp::Result<ledger::RootChain, dp::Error>::err(kind.error());

        ledger::RootChain root(str(record.id), str(record.display_name), record.difficulty);
        auto restored = restoreBlocks(root, record);
        if (!restored.is_ok())
            return dp::Result<ledger::RootChain, dp::Error>::err(restored.error());
        return dp::Result<ledger::RootChain, dp::Error>::ok(root);
    }

    dp::Result<ledger::GroupChain, dp::Error> restoreGroup(const EntityRecord &record) {
        auto kind = expectKind(record, ledger::EntityKind::Group);
        if (!kind.is_ok())
            return dp::Result<ledger::GroupChain, dp::Error>::err(kind.error());

        ledger::GroupChain group(str(record.id), str(record.display_name), str(record.root_id),
                                 str(record.parent_link_hash), record.difficulty);
        auto restored = restoreBlocks(group, record);
        if (!restored.is_ok())
            return dp::Result<ledger::GroupChain, dp::Error>::err(restored.error());
        return dp::Result<ledger::GroupChain, dp::Error>::ok(group);
    }

    dp::Result<ledger::LeafChain, dp::Error> restoreLeaf(const EntityRecord &record) {
        auto kind = expectKind(record, ledger::EntityKind::Leaf);
        if (!kind.is_ok())
            return dp::Result<ledger::LeafChain, dp::Error>::err(kind.error());

        ledger::LeafChain leaf(str(record.id), str(record.display_name), str(record.group_id), str(record.root_id),
                               str(record.parent_link_hash), record.difficulty);
        auto restored = restoreBlocks(leaf, record);
        if (!restored.is_ok())
            return dp::Result<ledger::LeafChain, dp::Error>::err(restored.error());
        return dp::Result<ledger::LeafChain, dp::Error>::ok(leaf);
    }

} // namespace tierchain::storage
