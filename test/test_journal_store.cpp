#include <doctest/doctest.h>

#include <tierchain/common/error.hpp>
#include <tierchain/registry/chain_registry.hpp>
#include <tierchain/storage/journal_store.hpp>
#include <tierchain/validation/validation_service.hpp>

#include <filesystem>
#include <fstream>

using namespace tierchain;
using namespace tierchain::ledger;
using namespace tierchain::registry;
using namespace tierchain::storage;

namespace {

    AttendanceEntry entry(const std::string &date, AttendanceStatus status = AttendanceStatus::Present) {
        AttendanceEntry e;
        e.date = date;
        e.status = status;
        return e;
    }

    std::string str(const dp::String &value) { return std::string(value.c_str()); }

} // namespace

// Test helper: a journal whose next write lands only the length prefix, like a disk filling up
class FlakyJournal : public JournalStore {
  public:
    bool fail_next = false;

  protected:
    dp::Result<void, dp::Error> writeFrame(const std::filesystem::path &journal,
                                           const dp::ByteBuf &buffer) override {
        if (!fail_next)
            return JournalStore::writeFrame(journal, buffer);

        fail_next = false;
        std::ofstream out(journal, std::ios::binary | std::ios::app);
        dp::u32 len = static_cast<dp::u32>(buffer.size());
        out.write(reinterpret_cast<const char *>(&len), sizeof(len));
        return dp::Result<void, dp::Error>::err(storage_error("No space left on device"));
    }
};

// Test helper: storage directory removed before and after each test
struct TestStore {
    std::string test_dir = "journal_store_test";

    TestStore() { std::filesystem::remove_all(test_dir); }
    ~TestStore() { std::filesystem::remove_all(test_dir); }

    LedgerOptions options(dp::u32 compaction_threshold = 256) const {
        LedgerOptions opts;
        opts.difficulty = 1;
        opts.storage_path = test_dir;
        opts.compaction_threshold = compaction_threshold;
        opts.verbose = false;
        return opts;
    }

    void populate(ChainRegistry &registry) const {
        REQUIRE(registry.createRoot("dept-1", "Physics", {{"code", "PHY"}}).is_ok());
        REQUIRE(registry.createGroup("class-1", "Year 1", "dept-1").is_ok());
        REQUIRE(registry.createLeaf("student-1", "Ada", "class-1").is_ok());
        REQUIRE(registry.appendRecord("student-1", entry("2024-11-16")).is_ok());
        REQUIRE(registry.appendRecord("student-1", entry("2024-11-17", AttendanceStatus::Leave)).is_ok());
    }

    std::filesystem::path journal() const { return std::filesystem::path(test_dir) / JournalStore::JOURNAL_FILE; }
    std::filesystem::path snapshot() const { return std::filesystem::path(test_dir) / JournalStore::SNAPSHOT_FILE; }
};

TEST_SUITE("JournalStore Tests") {
    TEST_CASE("Open creates the journal") {
        TestStore t;
        JournalStore store;
        REQUIRE(store.open(t.test_dir, false).is_ok());
        CHECK(store.isOpen());
        CHECK(std::filesystem::exists(t.journal()));
        CHECK_FALSE(std::filesystem::exists(t.snapshot()));

        auto state = store.load();
        REQUIRE(state.is_ok());
        CHECK(state.value().entityCount() == 0);
        CHECK(store.lastSequence() == 0);
    }

    TEST_CASE("Operations on a closed store fail") {
        JournalStore store;
        CHECK(errorKind(store.load().error()) == ErrorKind::StorageError);
        CHECK(store.append(JournalEntry{}).is_err());
        CHECK(store.compact(SnapshotRecord{}).is_err());
    }

    TEST_CASE("Appends are assigned increasing sequences") {
        TestStore t;
        JournalStore store;
        REQUIRE(store.open(t.test_dir, false).is_ok());

        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        REQUIRE(root.appendUpdate({{"head", "Curie"}}).is_ok());

        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[0])).is_ok());
        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[1])).is_ok());
        CHECK(store.lastSequence() == 2);
        CHECK(store.journalEntries() == 2);
        CHECK(store.needsCompaction(2));
        CHECK_FALSE(store.needsCompaction(3));

        auto state = store.load();
        REQUIRE(state.is_ok());
        REQUIRE(state.value().roots.size() == 1);
        CHECK(state.value().roots[0].chain.size() == 2);
        CHECK(state.value().last_sequence == 2);
    }

    TEST_CASE("Replay rejects an index that does not extend the chain") {
        TestStore t;
        JournalStore store;
        REQUIRE(store.open(t.test_dir, false).is_ok());

        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        REQUIRE(root.appendUpdate({{"a", "1"}}).is_ok());
        REQUIRE(root.appendUpdate({{"b", "2"}}).is_ok());

        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[0])).is_ok());
        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[2])).is_ok());

        auto state = store.load();
        REQUIRE(state.is_err());
        CHECK(errorKind(state.error()) == ErrorKind::StorageError);
    }

    TEST_CASE("Replay rejects blocks for an unknown entity") {
        TestStore t;
        JournalStore store;
        REQUIRE(store.open(t.test_dir, false).is_ok());

        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        REQUIRE(root.appendUpdate({{"a", "1"}}).is_ok());
        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[1])).is_ok());

        auto state = store.load();
        REQUIRE(state.is_err());
        CHECK(errorKind(state.error()) == ErrorKind::StorageError);
    }

    TEST_CASE("Replay rejects a second genesis") {
        TestStore t;
        JournalStore store;
        REQUIRE(store.open(t.test_dir, false).is_ok());

        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[0])).is_ok());
        REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[0])).is_ok());

        CHECK(store.load().is_err());
    }

    TEST_CASE("A failed append leaves no partial record behind") {
        TestStore t;
        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        REQUIRE(root.appendUpdate({{"a", "1"}}).is_ok());
        {
            FlakyJournal store;
            REQUIRE(store.open(t.test_dir, false).is_ok());
            REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[0])).is_ok());
            auto size_after_genesis = std::filesystem::file_size(t.journal());

            store.fail_next = true;
            auto failed = store.append(makeJournalEntry(root, root.chain().blocks_[1]));
            REQUIRE(failed.is_err());
            CHECK(errorKind(failed.error()) == ErrorKind::StorageError);
            CHECK(std::filesystem::file_size(t.journal()) == size_after_genesis);
            CHECK(store.lastSequence() == 1);
            CHECK_FALSE(store.failed());

            REQUIRE(store.append(makeJournalEntry(root, root.chain().blocks_[1])).is_ok());
            CHECK(store.lastSequence() == 2);
        }

        JournalStore reopened;
        REQUIRE(reopened.open(t.test_dir, false).is_ok());
        auto state = reopened.load();
        REQUIRE(state.is_ok());
        REQUIRE(state.value().roots.size() == 1);
        CHECK(state.value().roots[0].chain.size() == 2);
        CHECK(str(state.value().roots[0].chain[1].hash) == root.chain().blocks_[1].hash_);
    }

    TEST_CASE("Records without blocks are rejected") {
        RootChain root("dept-1", "Physics", 0);
        REQUIRE(root.initialize({}).is_ok());
        auto record = toEntityRecord(root);
        record.chain = dp::Vector<BlockRecord>{};

        auto restored = restoreRoot(record);
        REQUIRE(restored.is_err());
        CHECK(errorKind(restored.error()) == ErrorKind::StorageError);
    }
}

TEST_SUITE("Registry persistence") {
    TEST_CASE("A snapshot holding an empty chain does not open") {
        TestStore t;
        {
            JournalStore store;
            REQUIRE(store.open(t.test_dir, false).is_ok());
            RootChain root("dept-1", "Physics", 0);
            REQUIRE(root.initialize({}).is_ok());
            SnapshotRecord snapshot;
            auto record = toEntityRecord(root);
            record.chain = dp::Vector<BlockRecord>{};
            snapshot.roots.push_back(record);
            REQUIRE(store.compact(snapshot).is_ok());
        }

        ChainRegistry registry(t.options());
        auto opened = registry.open();
        REQUIRE(opened.is_err());
        CHECK(errorKind(opened.error()) == ErrorKind::StorageError);
        CHECK_FALSE(registry.isOpen());
    }

    TEST_CASE("Journal entries already in the snapshot are not replayed twice") {
        TestStore t;
        auto saved_journal = std::filesystem::path(t.test_dir) / "journal.saved";
        {
            ChainRegistry registry(t.options());
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
            std::filesystem::copy_file(t.journal(), saved_journal);
            REQUIRE(registry.compact().is_ok());
        }
        // Compaction stopped after the rename, before the journal was truncated
        std::filesystem::copy_file(saved_journal, t.journal(), std::filesystem::copy_options::overwrite_existing);
        CHECK(std::filesystem::file_size(t.journal()) > 0);

        ChainRegistry reopened(t.options());
        REQUIRE(reopened.open().is_ok());
        CHECK(reopened.getRoot("dept-1").value().length() == 1);
        CHECK(reopened.getGroup("class-1").value().length() == 1);
        CHECK(reopened.getLeaf("student-1").value().length() == 3);
        CHECK(reopened.history("student-1").value().size() == 2);

        validation::ValidationService validator(reopened, false);
        CHECK(validator.validateSystem().is_valid);

        auto next = reopened.appendRecord("student-1", entry("2024-11-18"));
        REQUIRE(next.is_ok());
        CHECK(next.value().index_ == 3);
    }

    TEST_CASE("Blocks edited on disk load as written and fail validation") {
        TestStore t;
        std::string original_hash;
        {
            ChainRegistry registry(t.options());
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
            original_hash = registry.getLeaf("student-1").value().chain().blocks_[1].hash_;
        }
        {
            JournalStore store;
            REQUIRE(store.open(t.test_dir, false).is_ok());
            auto state = store.load();
            REQUIRE(state.is_ok());
            auto edited = state.value();
            REQUIRE(edited.leaves.size() == 1);
            bool changed = false;
            for (auto &field : edited.leaves[0].chain[1].transactions[0].data) {
                if (str(field.key) == "status") {
                    field.value = dp::String("Absent");
                    changed = true;
                }
            }
            REQUIRE(changed);
            REQUIRE(store.compact(edited).is_ok());
        }

        ChainRegistry reopened(t.options());
        REQUIRE(reopened.open().is_ok());
        auto leaf = reopened.getLeaf("student-1").value();
        CHECK(leaf.length() == 3);
        CHECK(leaf.chain().blocks_[1].hash_ == original_hash);
        CHECK(reopened.recordByDate("student-1", "2024-11-16").value().status == AttendanceStatus::Absent);

        validation::ValidationService validator(reopened, false);
        auto report = validator.validateLeaf("student-1");
        REQUIRE(report.is_ok());
        CHECK_FALSE(report.value().is_valid);
        CHECK_FALSE(report.value().details.chain_integrity);
        CHECK(report.value().details.chain_failure == ChainFailure::HashMismatch);
        CHECK(validator.validateGroup("class-1").value().is_valid);
    }

    TEST_CASE("Chains survive reopen unchanged") {
        TestStore t;
        std::string root_hash;
        std::string leaf_hash;
        {
            ChainRegistry registry(t.options());
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
            root_hash = registry.getRoot("dept-1").value().latestHash();
            leaf_hash = registry.getLeaf("student-1").value().latestHash();
        }

        ChainRegistry reopened(t.options());
        REQUIRE(reopened.open().is_ok());
        auto root = reopened.getRoot("dept-1");
        auto leaf = reopened.getLeaf("student-1");
        REQUIRE(root.is_ok());
        REQUIRE(leaf.is_ok());
        CHECK(root.value().latestHash() == root_hash);
        CHECK(root.value().currentState().at("code") == "PHY");
        CHECK(leaf.value().latestHash() == leaf_hash);
        CHECK(leaf.value().length() == 3);
        CHECK(leaf.value().groupId() == "class-1");
        CHECK(leaf.value().rootId() == "dept-1");
        CHECK(reopened.recordByDate("student-1", "2024-11-17").value().status == AttendanceStatus::Leave);

        validation::ValidationService validator(reopened, false);
        CHECK(validator.validateSystem().is_valid);

        // Appending after reopen continues the chain
        auto next = reopened.appendRecord("student-1", entry("2024-11-18"));
        REQUIRE(next.is_ok());
        CHECK(next.value().index_ == 3);
        CHECK(next.value().previous_hash_ == leaf_hash);
    }

    TEST_CASE("A torn trailing record is ignored") {
        TestStore t;
        {
            ChainRegistry registry(t.options());
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
        }
        auto intact_size = std::filesystem::file_size(t.journal());
        {
            std::ofstream out(t.journal(), std::ios::binary | std::ios::app);
            dp::u32 len = 4096;
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write("partial", 7);
        }

        ChainRegistry reopened(t.options());
        REQUIRE(reopened.open().is_ok());
        CHECK(reopened.getLeaf("student-1").value().length() == 3);
        CHECK(std::filesystem::file_size(t.journal()) == intact_size);

        // The repaired journal accepts new entries
        REQUIRE(reopened.appendRecord("student-1", entry("2024-11-18")).is_ok());
    }

    TEST_CASE("Compaction writes a snapshot and truncates the journal") {
        TestStore t;
        {
            ChainRegistry registry(t.options(3));
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
            CHECK(std::filesystem::exists(t.snapshot()));
        }

        ChainRegistry reopened(t.options(3));
        REQUIRE(reopened.open().is_ok());
        CHECK(reopened.listRoots().size() == 1);
        CHECK(reopened.listGroups().size() == 1);
        REQUIRE(reopened.getLeaf("student-1").is_ok());
        CHECK(reopened.getLeaf("student-1").value().length() == 3);
        CHECK(reopened.history("student-1").value().size() == 2);
    }

    TEST_CASE("Explicit compaction") {
        TestStore t;
        ChainRegistry registry(t.options());
        REQUIRE(registry.open().is_ok());
        t.populate(registry);

        REQUIRE(registry.compact().is_ok());
        CHECK(std::filesystem::exists(t.snapshot()));
        CHECK(std::filesystem::file_size(t.journal()) == 0);
    }

    TEST_CASE("Tamper drills are never persisted") {
        TestStore t;
        std::string leaf_hash;
        {
            ChainRegistry registry(t.options());
            REQUIRE(registry.open().is_ok());
            t.populate(registry);
            leaf_hash = registry.getLeaf("student-1").value().chain().blocks_[1].hash_;

            REQUIRE(registry.simulateTampering(EntityKind::Leaf, "student-1").is_ok());
            CHECK_FALSE(registry.getLeaf("student-1").value().chain().isValid());
            REQUIRE(registry.compact().is_ok());
        }

        ChainRegistry reopened(t.options());
        REQUIRE(reopened.open().is_ok());
        auto leaf = reopened.getLeaf("student-1").value();
        CHECK(leaf.chain().isValid());
        CHECK(leaf.chain().blocks_[1].hash_ == leaf_hash);
        CHECK(leaf.chain().blocks_[1].payload_[0].data.count("tampered") == 0);
    }

    TEST_CASE("Storage failure leaves the chain unchanged") {
        TestStore t;
        ChainRegistry registry(t.options());
        REQUIRE(registry.open().is_ok());
        t.populate(registry);

        std::filesystem::remove(t.journal());
        std::filesystem::create_directory(t.journal());

        auto appended = registry.appendRecord("student-1", entry("2024-11-18"));
        REQUIRE(appended.is_err());
        CHECK(errorKind(appended.error()) == ErrorKind::StorageError);
        CHECK(registry.getLeaf("student-1").value().length() == 3);
        CHECK(errorKind(registry.recordByDate("student-1", "2024-11-18").error()) == ErrorKind::NotFound);

        auto created = registry.createRoot("dept-2", "Biology");
        REQUIRE(created.is_err());
        CHECK_FALSE(registry.contains(EntityKind::Root, "dept-2"));
    }

    TEST_CASE("JSON export of a persisted registry") {
        TestStore t;
        ChainRegistry registry(t.options());
        REQUIRE(registry.open().is_ok());
        t.populate(registry);

        std::string export_dir = t.test_dir + "/export";
        REQUIRE(registry.exportJson(export_dir).is_ok());

        std::ifstream in(export_dir + "/leaves.json");
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(content.find("\"student-1\"") != std::string::npos);
        CHECK(content.find("\"attendance\"") != std::string::npos);
        CHECK(content.find("2024-11-17") != std::string::npos);
    }
}
