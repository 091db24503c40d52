#pragma once

#include <datapod/datapod.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "records.hpp"

namespace tierchain::storage {

    // ===========================================
    // JournalStore - append-only journal plus compacted snapshot
    // ===========================================

    /// Layout under the storage directory:
    ///   journal.dat   length-prefixed JournalEntry records, one per committed block
    ///   snapshot.dat  one SnapshotRecord, replaced atomically on compaction
    class JournalStore {
      public:
        static constexpr const char *JOURNAL_FILE = "journal.dat";
        static constexpr const char *SNAPSHOT_FILE = "snapshot.dat";

        JournalStore() = default;
        virtual ~JournalStore() { close(); }

        JournalStore(const JournalStore &) = delete;
        JournalStore &operator=(const JournalStore &) = delete;

        /// Creates the directory if needed. Does not read anything yet
        dp::Result<void, dp::Error> open(const std::string &path, bool verbose = true);
        void close();
        inline bool isOpen() const { return is_open_; }

        /// Snapshot with the journal replayed on top. A torn trailing record is dropped and the
        /// journal truncated to the last complete entry
        dp::Result<SnapshotRecord, dp::Error> load();

        /// Appends and flushes one entry; assigns its sequence number. A failed write is cut back off the
        /// journal; if that cut fails too the store refuses every later append
        dp::Result<void, dp::Error> append(JournalEntry entry);

        inline bool failed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return failed_;
        }

        /// Writes `snapshot` through a temp file and rename, then truncates the journal
        dp::Result<void, dp::Error> compact(SnapshotRecord snapshot);

        inline bool needsCompaction(dp::u32 threshold) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return threshold > 0 && journal_entries_ >= threshold;
        }

        inline size_t journalEntries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return journal_entries_;
        }

        inline dp::u64 lastSequence() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return last_sequence_;
        }

        inline const std::filesystem::path &path() const { return base_path_; }

        /// Writes roots.json, groups.json and leaves.json into `dir`
        static dp::Result<void, dp::Error> exportJson(const SnapshotRecord &snapshot, const std::string &dir);

      protected:
        /// Writes one length-prefixed frame at the end of `journal`
        virtual dp::Result<void, dp::Error> writeFrame(const std::filesystem::path &journal,
                                                       const dp::ByteBuf &buffer);

      private:
        void rollback(const std::filesystem::path &journal, std::uintmax_t size);

        std::filesystem::path base_path_;
        bool is_open_ = false;
        bool verbose_ = true;
        bool failed_ = false;
        size_t journal_entries_ = 0;
        dp::u64 last_sequence_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace tierchain::storage
