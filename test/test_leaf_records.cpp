#include <doctest/doctest.h>

#include <tierchain/common/error.hpp>
#include <tierchain/ledger/ledger.hpp>

using namespace tierchain;
using namespace tierchain::ledger;

// Test helper: a leaf two levels below a fresh root
struct TestLeaf {
    RootChain root;
    GroupChain group;
    LeafChain leaf;

    TestLeaf()
        : root(makeRoot()), group(makeGroup(root)),
          leaf("student-1", "Ada Lovelace", "class-1", "dept-1", group.latestHash(), 0) {
        REQUIRE(leaf.initialize({}).is_ok());
    }

    static RootChain makeRoot() {
        RootChain r("dept-1", "Physics", 0);
        REQUIRE(r.initialize({}).is_ok());
        return r;
    }

    static GroupChain makeGroup(const RootChain &root) {
        GroupChain g("class-1", "Year 1", "dept-1", root.latestHash(), 0);
        REQUIRE(g.initialize({}).is_ok());
        return g;
    }

    static AttendanceEntry entry(const std::string &date, AttendanceStatus status) {
        AttendanceEntry e;
        e.date = date;
        e.status = status;
        return e;
    }
};

TEST_SUITE("Date validation") {
    TEST_CASE("Accepted dates") {
        CHECK(isValidDate("2024-11-16"));
        CHECK(isValidDate("2024-02-29"));
        CHECK(isValidDate("2000-02-29"));
        CHECK(isValidDate("2023-12-31"));
    }

    TEST_CASE("Rejected dates") {
        CHECK_FALSE(isValidDate("2023-02-29"));
        CHECK_FALSE(isValidDate("1900-02-29"));
        CHECK_FALSE(isValidDate("2024-13-01"));
        CHECK_FALSE(isValidDate("2024-04-31"));
        CHECK_FALSE(isValidDate("2024-00-10"));
        CHECK_FALSE(isValidDate("2024-1-16"));
        CHECK_FALSE(isValidDate("16-11-2024"));
        CHECK_FALSE(isValidDate("2024/11/16"));
        CHECK_FALSE(isValidDate(""));
    }

    TEST_CASE("Today is a valid date") { CHECK(isValidDate(formatDate())); }
}

TEST_SUITE("Attendance status") {
    TEST_CASE("Round trip through labels") {
        for (auto status : {AttendanceStatus::Present, AttendanceStatus::Absent, AttendanceStatus::Leave}) {
            auto parsed = parseAttendanceStatus(attendanceStatusToString(status));
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == status);
        }
    }

    TEST_CASE("Unknown labels are input errors") {
        auto parsed = parseAttendanceStatus("Late");
        REQUIRE(parsed.is_err());
        CHECK(errorKind(parsed.error()) == ErrorKind::InputError);
        CHECK(parseAttendanceStatus("present").is_err());
    }
}

TEST_SUITE("Leaf records") {
    TEST_CASE("Appending a record") {
        TestLeaf t;
        auto entry = TestLeaf::entry("2024-11-16", AttendanceStatus::Present);
        entry.marked_by = "staff-9";
        entry.extra["remarks"] = "on time";

        auto block = t.leaf.appendRecord(entry);
        REQUIRE(block.is_ok());
        CHECK(block.value().index_ == 1);
        CHECK(t.leaf.length() == 2);

        auto record = t.leaf.recordByDate("2024-11-16");
        REQUIRE(record.has_value());
        CHECK(record->status == AttendanceStatus::Present);
        CHECK(record->block_index == 1);
        CHECK(record->data.at("leafId") == "student-1");
        CHECK(record->data.at("leafName") == "Ada Lovelace");
        CHECK(record->data.at("groupId") == "class-1");
        CHECK(record->data.at("rootId") == "dept-1");
        CHECK(record->data.at("markedBy") == "staff-9");
        CHECK(record->data.at("remarks") == "on time");
        CHECK(record->data.count("markedAt") == 1);

        CHECK(block.value().payload_.at(0).type == "attendance");
    }

    TEST_CASE("Duplicate dates are rejected without mining") {
        TestLeaf t;
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Present)).is_ok());

        auto duplicate = t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Absent));
        REQUIRE(duplicate.is_err());
        CHECK(errorKind(duplicate.error()) == ErrorKind::Conflict);
        CHECK(t.leaf.length() == 2);
        CHECK(t.leaf.recordByDate("2024-11-16")->status == AttendanceStatus::Present);
    }

    TEST_CASE("Malformed dates are input errors") {
        TestLeaf t;
        auto result = t.leaf.appendRecord(TestLeaf::entry("2024-02-30", AttendanceStatus::Present));
        REQUIRE(result.is_err());
        CHECK(errorKind(result.error()) == ErrorKind::InputError);
        CHECK(t.leaf.length() == 1);
    }

    TEST_CASE("An empty date means today") {
        TestLeaf t;
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("", AttendanceStatus::Leave)).is_ok());
        CHECK(t.leaf.history().size() == 1);
        CHECK(isValidDate(t.leaf.history().front().date));
    }

    TEST_CASE("Deleted leaves take no records") {
        TestLeaf t;
        REQUIRE(t.leaf.appendDelete().is_ok());

        auto result = t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Present));
        REQUIRE(result.is_err());
        CHECK(errorKind(result.error()) == ErrorKind::InputError);
        CHECK(t.leaf.length() == 2);
    }

    TEST_CASE("Records do not change current state") {
        TestLeaf t;
        auto before = t.leaf.currentState();
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Absent)).is_ok());
        CHECK(t.leaf.currentState() == before);
    }

    TEST_CASE("History is in chain order") {
        TestLeaf t;
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-18", AttendanceStatus::Present)).is_ok());
        REQUIRE(t.leaf.appendUpdate({{"email", "ada@example.org"}}).is_ok());
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Absent)).is_ok());

        auto history = t.leaf.history();
        REQUIRE(history.size() == 2);
        CHECK(history[0].date == "2024-11-18");
        CHECK(history[1].date == "2024-11-16");
        CHECK(history[1].block_index == 3);
        CHECK_FALSE(t.leaf.recordByDate("2024-11-17").has_value());
    }

    TEST_CASE("Statistics") {
        TestLeaf t;
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-11", AttendanceStatus::Present)).is_ok());
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-12", AttendanceStatus::Present)).is_ok());
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-13", AttendanceStatus::Absent)).is_ok());
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-14", AttendanceStatus::Leave)).is_ok());

        auto stats = t.leaf.stats();
        CHECK(stats.total == 4);
        CHECK(stats.present == 2);
        CHECK(stats.absent == 1);
        CHECK(stats.leave == 1);
        CHECK(stats.percentage == doctest::Approx(50.0));
        CHECK(stats.toJson() == "{\"total\":4,\"present\":2,\"absent\":1,\"leave\":1,\"percentage\":50.00}");
    }

    TEST_CASE("Statistics of an empty history") {
        auto stats = computeStats({});
        CHECK(stats.total == 0);
        CHECK(stats.percentage == doctest::Approx(0.0));
    }

    TEST_CASE("Unreadable records are counted, not hidden") {
        TestLeaf t;
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-16", AttendanceStatus::Present)).is_ok());
        REQUIRE(t.leaf.appendRecord(TestLeaf::entry("2024-11-17", AttendanceStatus::Absent)).is_ok());
        CHECK(t.leaf.unreadableRecords() == 0);

        t.leaf.chain().blocks_[1].payload_[0].data["status"] = "Sick";

        CHECK(t.leaf.unreadableRecords() == 1);
        auto history = t.leaf.history();
        REQUIRE(history.size() == 1);
        CHECK(history[0].date == "2024-11-17");
        CHECK(t.leaf.stats().total == 1);
    }

    TEST_CASE("Only record entries become records") {
        auto update = PayloadEntry::update({{"date", "2024-11-16"}, {"status", "Present"}});
        CHECK(AttendanceRecord::fromPayload(update, 1).is_err());

        auto incomplete = PayloadEntry::record({{"date", "2024-11-16"}});
        CHECK(AttendanceRecord::fromPayload(incomplete, 1).is_err());
    }
}
