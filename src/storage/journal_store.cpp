#include <tierchain/common/error.hpp>
#include <tierchain/storage/journal_store.hpp>

#include <fstream>
#include <iostream>
#include <unordered_map>

namespace tierchain::storage {

    namespace {

        std::string str(const dp::String &value) { return std::string(value.c_str()); }

        dp::Vector<EntityRecord> &collectionFor(SnapshotRecord &state, dp::u8 kind) {
            switch (static_cast<ledger::EntityKind>(kind)) {
            case ledger::EntityKind::Root:
                return state.roots;
            case ledger::EntityKind::Group:
                return state.groups;
            default:
                return state.leaves;
            }
        }

        /// Position of every entity in its collection, keyed by kind and id
        struct ReplayIndex {
            std::unordered_map<std::string, size_t> positions[3];

            void build(const SnapshotRecord &state) {
                for (size_t i = 0; i < state.roots.size(); ++i)
                    positions[0][str(state.roots[i].id)] = i;
                for (size_t i = 0; i < state.groups.size(); ++i)
                    positions[1][str(state.groups[i].id)] = i;
                for (size_t i = 0; i < state.leaves.size(); ++i)
                    positions[2][str(state.leaves[i].id)] = i;
            }
        };

        dp::Result<void, dp::Error> replayEntry(SnapshotRecord &state, ReplayIndex &index, const JournalEntry &entry) {
            if (entry.entity.kind > static_cast<dp::u8>(ledger::EntityKind::Leaf)) {
                return dp::Result<void, dp::Error>::err(
                    storage_error("Journal entry " + std::to_string(entry.sequence) + " has an unknown entity kind"));
            }

            auto &collection = collectionFor(state, entry.entity.kind);
            auto &positions = index.positions[entry.entity.kind];
            std::string id = str(entry.entity.id);
            auto it = positions.find(id);

            if (entry.block.index == 0) {
                if (it != positions.end()) {
                    return dp::Result<void, dp::Error>::err(
                        storage_error("Journal entry " + std::to_string(entry.sequence) + " recreates " + id));
                }
                EntityRecord record = entry.entity;
                record.chain.push_back(entry.block);
                positions[id] = collection.size();
                collection.push_back(record);
                return dp::Result<void, dp::Error>::ok();
            }

            if (it == positions.end()) {
                return dp::Result<void, dp::Error>::err(storage_error(
                    "Journal entry " + std::to_string(entry.sequence) + " references unknown entity " + id));
            }

            auto &record = collection[it->second];
            if (entry.block.index != record.chain.size()) {
                return dp::Result<void, dp::Error>::err(
                    storage_error("Journal entry " + std::to_string(entry.sequence) + " for " + id + " has index " +
                                  std::to_string(entry.block.index) + ", expected " +
                                  std::to_string(record.chain.size())));
            }
            record.chain.push_back(entry.block);
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    dp::Result<void, dp::Error> JournalStore::open(const std::string &path, bool verbose) {
        try {
            base_path_ = path;
            verbose_ = verbose;
            std::filesystem::create_directories(base_path_);

            auto journal_path = base_path_ / JOURNAL_FILE;
            if (!std::filesystem::exists(journal_path))
                std::ofstream(journal_path, std::ios::binary).close();

            is_open_ = true;
            return dp::Result<void, dp::Error>::ok();
        } catch (const std::exception &e) {
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_error(e.what()));
        }
    }

    void JournalStore::close() { is_open_ = false; }

    dp::Result<SnapshotRecord, dp::Error> JournalStore::load() {
        if (!is_open_)
            return dp::Result<SnapshotRecord, dp::Error>::err(storage_error("Store not open"));

        std::lock_guard<std::mutex> lock(mutex_);
        SnapshotRecord state;

        try {
            auto snapshot_path = base_path_ / SNAPSHOT_FILE;
            if (std::filesystem::exists(snapshot_path)) {
                std::ifstream in(snapshot_path, std::ios::binary);
                auto size = std::filesystem::file_size(snapshot_path);
                dp::ByteBuf data(size);
                in.read(reinterpret_cast<char *>(data.data()), size);
                if (!in)
                    return dp::Result<SnapshotRecord, dp::Error>::err(storage_error("Failed to read snapshot"));
                state = dp::deserialize<dp::Mode::NONE, SnapshotRecord>(data);
                if (state.version != SnapshotRecord::CURRENT_VERSION) {
                    return dp::Result<SnapshotRecord, dp::Error>::err(
                        storage_error("Unsupported snapshot version " + std::to_string(state.version)));
                }
            }

            ReplayIndex index;
            index.build(state);
            last_sequence_ = state.last_sequence;
            journal_entries_ = 0;

            auto journal_path = base_path_ / JOURNAL_FILE;
            std::ifstream in(journal_path, std::ios::binary);
            dp::u64 good_offset = 0;
            size_t replayed = 0;
            bool torn = false;

            while (in) {
                dp::u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (in.gcount() == 0)
                    break;
                if (!in) {
                    torn = true;
                    break;
                }

                dp::ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in) {
                    torn = true;
                    break;
                }

                auto entry = dp::deserialize<dp::Mode::NONE, JournalEntry>(data);
                good_offset += sizeof(len) + len;
                journal_entries_++;

                // Already folded into the snapshot; compaction stopped before truncating
                if (entry.sequence <= state.last_sequence)
                    continue;

                auto applied = replayEntry(state, index, entry);
                if (!applied.is_ok())
                    return dp::Result<SnapshotRecord, dp::Error>::err(applied.error());
                last_sequence_ = entry.sequence;
                replayed++;
            }
            in.close();

            if (torn) {
                std::cerr << "Ignoring torn journal record at offset " << good_offset << std::endl;
                std::filesystem::resize_file(journal_path, good_offset);
            }

            state.last_sequence = last_sequence_;
            if (verbose_) {
                std::cout << "Loaded " << state.entityCount() << " chains (" << replayed
                          << " journal entries replayed)" << std::endl;
            }
            return dp::Result<SnapshotRecord, dp::Error>::ok(state);
        } catch (const std::exception &e) {
            return dp::Result<SnapshotRecord, dp::Error>::err(storage_error(e.what()));
        }
    }

    dp::Result<void, dp::Error> JournalStore::append(JournalEntry entry) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Store not open"));

        std::lock_guard<std::mutex> lock(mutex_);
        if (failed_)
            return dp::Result<void, dp::Error>::err(storage_error("Journal is damaged; refusing further appends"));

        auto journal_path = base_path_ / JOURNAL_FILE;
        std::error_code ec;
        auto size_before = std::filesystem::file_size(journal_path, ec);
        if (ec)
            return dp::Result<void, dp::Error>::err(storage_error("Cannot stat journal: " + ec.message()));

        try {
            entry.sequence = last_sequence_ + 1;
            auto buffer = dp::serialize(entry);
            auto written = writeFrame(journal_path, buffer);
            if (!written.is_ok()) {
                rollback(journal_path, size_before);
                return written;
            }

            last_sequence_ = entry.sequence;
            journal_entries_++;
            return dp::Result<void, dp::Error>::ok();
        } catch (const std::exception &e) {
            rollback(journal_path, size_before);
            return dp::Result<void, dp::Error>::err(storage_error(e.what()));
        }
    }

    dp::Result<void, dp::Error> JournalStore::writeFrame(const std::filesystem::path &journal,
                                                         const dp::ByteBuf &buffer) {
        dp::u32 len = static_cast<dp::u32>(buffer.size());
        std::ofstream out(journal, std::ios::binary | std::ios::app);
        if (!out)
            return dp::Result<void, dp::Error>::err(storage_error("Failed to open journal for writing"));
        out.write(reinterpret_cast<const char *>(&len), sizeof(len));
        out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
        out.flush();
        if (!out)
            return dp::Result<void, dp::Error>::err(storage_error("Failed to write journal entry"));
        return dp::Result<void, dp::Error>::ok();
    }

    void JournalStore::rollback(const std::filesystem::path &journal, std::uintmax_t size) {
        std::error_code ec;
        auto current = std::filesystem::file_size(journal, ec);
        if (!ec && current == size)
            return;
        std::filesystem::resize_file(journal, size, ec);
        if (ec) {
            failed_ = true;
            std::cerr << "Could not cut partial record off " << journal << ": " << ec.message() << std::endl;
        }
    }

    dp::Result<void, dp::Error> JournalStore::compact(SnapshotRecord snapshot) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Store not open"));

        std::lock_guard<std::mutex> lock(mutex_);
        try {
            snapshot.version = SnapshotRecord::CURRENT_VERSION;
            snapshot.last_sequence = last_sequence_;
            auto buffer = dp::serialize(snapshot);

            auto snapshot_path = base_path_ / SNAPSHOT_FILE;
            auto tmp_path = base_path_ / (std::string(SNAPSHOT_FILE) + ".tmp");
            {
                std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
                if (!out)
                    return dp::Result<void, dp::Error>::err(storage_error("Failed to open snapshot for writing"));
                out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                out.flush();
                if (!out)
                    return dp::Result<void, dp::Error>::err(storage_error("Failed to write snapshot"));
            }
            std::filesystem::rename(tmp_path, snapshot_path);

            std::filesystem::resize_file(base_path_ / JOURNAL_FILE, 0);
            failed_ = false;
            size_t folded = journal_entries_;
            journal_entries_ = 0;

            if (verbose_) {
                std::cout << "Compacted " << folded << " journal entries into snapshot (" << snapshot.entityCount()
                          << " chains)" << std::endl;
            }
            return dp::Result<void, dp::Error>::ok();
        } catch (const std::exception &e) {
            return dp::Result<void, dp::Error>::err(storage_error(e.what()));
        }
    }

    dp::Result<void, dp::Error> JournalStore::exportJson(const SnapshotRecord &snapshot, const std::string &dir) {
        try {
            std::filesystem::path out_dir(dir);
            std::filesystem::create_directories(out_dir);

            const std::pair<const char *, const dp::Vector<EntityRecord> *> files[] = {
                {"roots.json", &snapshot.roots},
                {"groups.json", &snapshot.groups},
                {"leaves.json", &snapshot.leaves},
            };
            for (const auto &[name, records] : files) {
                std::ofstream out(out_dir / name, std::ios::trunc);
                if (!out)
                    return dp::Result<void, dp::Error>::err(storage_error(std::string("Failed to open ") + name));
                out << toJsonArray(*records);
                if (!out)
                    return dp::Result<void, dp::Error>::err(storage_error(std::string("Failed to write ") + name));
            }
            return dp::Result<void, dp::Error>::ok();
        } catch (const std::exception &e) {
            return dp::Result<void, dp::Error>::err(storage_error(e.what()));
        }
    }

} // namespace tierchain::storage
