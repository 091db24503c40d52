#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "payload.hpp"

namespace tierchain::ledger {

    enum class AttendanceStatus : dp::u8 {
        Present = 0,
        Absent = 1,
        Leave = 2,
    };

    std::string attendanceStatusToString(AttendanceStatus status);
    dp::Result<AttendanceStatus, dp::Error> parseAttendanceStatus(const std::string &label);

    /// Strict YYYY-MM-DD with a real calendar day
    bool isValidDate(const std::string &date);

    /// Today's local date as YYYY-MM-DD
    std::string formatDate();
    std::string formatDate(dp::i64 epoch_millis);

    /// Caller-supplied record; an empty date means today
    struct AttendanceEntry {
        std::string date{};
        AttendanceStatus status{AttendanceStatus::Present};
        std::string marked_by{};
        Fields extra{};
    };

    /// A record as read back from a leaf chain
    struct AttendanceRecord {
        std::string date{};
        AttendanceStatus status{AttendanceStatus::Present};
        Fields data{};
        dp::u64 block_index{0};
        dp::i64 recorded_at{0};

        static dp::Result<AttendanceRecord, dp::Error> fromPayload(const PayloadEntry &entry, dp::u64 block_index);
        std::string toJson() const;
    };

    struct AttendanceStats {
        size_t total{0};
        size_t present{0};
        size_t absent{0};
        size_t leave{0};
        double percentage{0.0};

        std::string toJson() const;
    };

    AttendanceStats computeStats(const std::vector<AttendanceRecord> &records);

} // namespace tierchain::ledger
