#include <tierchain/common/error.hpp>
#include <tierchain/ledger/attendance.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tierchain::ledger {

    std::string attendanceStatusToString(AttendanceStatus status) {
        switch (status) {
        case AttendanceStatus::Present:
            return "Present";
        case AttendanceStatus::Absent:
            return "Absent";
        case AttendanceStatus::Leave:
            return "Leave";
        default:
            return "Unknown";
        }
    }

    dp::Result<AttendanceStatus, dp::Error> parseAttendanceStatus(const std::string &label) {
        if (label == "Present")
            return dp::Result<AttendanceStatus, dp::Error>::ok(AttendanceStatus::Present);
        if (label == "Absent")
            return dp::Result<AttendanceStatus, dp::Error>::ok(AttendanceStatus::Absent);
        if (label == "Leave")
            return dp::Result<AttendanceStatus, dp::Error>::ok(AttendanceStatus::Leave);
        return dp::Result<AttendanceStatus, dp::Error>::err(
            input_error("Status must be Present, Absent, or Leave, got: " + label));
    }

    bool isValidDate(const std::string &date) {
        if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            return false;
        for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }
        int year = std::stoi(date.substr(0, 4));
        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        if (month < 1 || month > 12 || day < 1)
            return false;

        static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        int max_day = days_in_month[month - 1] + ((month == 2 && leap) ? 1 : 0);
        return day <= max_day;
    }

    std::string formatDate() { return formatDate(currentTimeMillis()); }

    std::string formatDate(dp::i64 epoch_millis) {
        std::time_t seconds = static_cast<std::time_t>(epoch_millis / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d");
        return ss.str();
    }

    dp::Result<AttendanceRecord, dp::Error> AttendanceRecord::fromPayload(const PayloadEntry &entry,
                                                                          dp::u64 block_index) {
        if (entry.kind != PayloadKind::Record)
            return dp::Result<AttendanceRecord, dp::Error>::err(input_error("Payload entry is not a record"));

        auto date_it = entry.data.find("date");
        auto status_it = entry.data.find("status");
        if (date_it == entry.data.end() || status_it == entry.data.end())
            return dp::Result<AttendanceRecord, dp::Error>::err(input_error("Record is missing date or status"));

        auto status = parseAttendanceStatus(status_it->second);
        if (!status.is_ok())
            return dp::Result<AttendanceRecord, dp::Error>::err(status.error());

        AttendanceRecord record;
        record.date = date_it->second;
        record.status = status.value();
        record.data = entry.data;
        record.block_index = block_index;
        record.recorded_at = entry.timestamp;
        return dp::Result<AttendanceRecord, dp::Error>::ok(std::move(record));
    }

    std::string AttendanceRecord::toJson() const {
        std::stringstream ss;
        ss << "{\"date\":" << JsonSerializer::quote(date)
           << ",\"status\":" << JsonSerializer::quote(attendanceStatusToString(status))
           << ",\"block_index\":" << block_index << ",\"recorded_at\":" << recorded_at
           << ",\"data\":" << JsonSerializer::serializeFields(data) << '}';
        return ss.str();
    }

    std::string AttendanceStats::toJson() const {
        std::stringstream ss;
        ss << "{\"total\":" << total << ",\"present\":" << present << ",\"absent\":" << absent
           << ",\"leave\":" << leave << ",\"percentage\":" << std::fixed << std::setprecision(2) << percentage
           << '}';
        return ss.str();
    }

    AttendanceStats computeStats(const std::vector<AttendanceRecord> &records) {
        AttendanceStats stats;
        stats.total = records.size();
        for (const auto &record : records) {
            switch (record.status) {
            case AttendanceStatus::Present:
                ++stats.present;
                break;
            case AttendanceStatus::Absent:
                ++stats.absent;
                break;
            case AttendanceStatus::Leave:
                ++stats.leave;
                break;
            }
        }
        if (stats.total > 0)
            stats.percentage = static_cast<double>(stats.present) / static_cast<double>(stats.total) * 100.0;
        return stats;
    }

} // namespace tierchain::ledger
