#include "tierchain.hpp"
#include <iostream>

using namespace tierchain;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

bool check(const char *what, const dp::Result<void, dp::Error> &result) {
    if (!result.is_ok()) {
        std::cerr << what << " failed: " << errorMessage(result.error()) << std::endl;
        return false;
    }
    return true;
}

int main() {
    auto options = LedgerOptions::fromEnvironment();
    if (!options.is_ok()) {
        std::cerr << "Invalid configuration: " << errorMessage(options.error()) << std::endl;
        return 1;
    }

    registry::ChainRegistry registry(options.value());
    if (!check("Opening registry", registry.open()))
        return 1;

    printSeparator("HIERARCHY");

    auto dept = registry.createRoot("dept-1", "Computer Science", {{"code", "CS"}, {"head", "Dr. Rao"}});
    if (!dept.is_ok() && errorKind(dept.error()) != ErrorKind::Conflict) {
        std::cerr << "Creating department failed: " << errorMessage(dept.error()) << std::endl;
        return 1;
    }

    auto cls = registry.createGroup("class-1", "CS Year 1", "dept-1", {{"year", "1"}, {"section", "A"}});
    if (!cls.is_ok() && errorKind(cls.error()) != ErrorKind::Conflict) {
        std::cerr << "Creating class failed: " << errorMessage(cls.error()) << std::endl;
        return 1;
    }

    for (const auto &[id, name] : std::vector<std::pair<std::string, std::string>>{
             {"student-1", "Asha Patel"}, {"student-2", "Ben Ortiz"}, {"student-3", "Chen Wei"}}) {
        auto student = registry.createLeaf(id, name, "class-1", {{"rollNumber", id.substr(8)}});
        if (!student.is_ok() && errorKind(student.error()) != ErrorKind::Conflict) {
            std::cerr << "Creating " << id << " failed: " << errorMessage(student.error()) << std::endl;
            return 1;
        }
    }

    printSeparator("ATTENDANCE");

    std::vector<registry::BulkRecordRequest> requests = {
        {"student-1", {"2024-11-16", ledger::AttendanceStatus::Present, "staff-1", {}}},
        {"student-2", {"2024-11-16", ledger::AttendanceStatus::Absent, "staff-1", {}}},
        {"student-3", {"2024-11-16", ledger::AttendanceStatus::Leave, "staff-1", {{"reason", "medical"}}}},
    };
    auto report = registry.appendRecords(requests);
    std::cout << report.toJson() << std::endl;

    auto duplicate = registry.appendRecord("student-1", {"2024-11-16", ledger::AttendanceStatus::Absent, "", {}});
    if (!duplicate.is_ok())
        std::cout << "Duplicate rejected: " << errorMessage(duplicate.error()) << std::endl;

    auto daily = registry.recordsForGroupOnDate("class-1", "2024-11-16");
    if (daily.is_ok()) {
        for (const auto &entry : daily.value()) {
            std::cout << entry.leaf_id << " (" << entry.leaf_name << "): "
                      << (entry.record ? ledger::attendanceStatusToString(entry.record->status) : "not marked")
                      << std::endl;
        }
    }

    auto stats = registry.leafStats("student-1");
    if (stats.is_ok())
        std::cout << "student-1 stats: " << stats.value().toJson() << std::endl;

    printSeparator("VALIDATION");

    validation::ValidationService validator(registry, options.value().verbose);
    auto leaf_report = validator.validateLeaf("student-1");
    if (leaf_report.is_ok())
        std::cout << leaf_report.value().toJson() << std::endl;

    auto system = validator.validateSystem();
    std::cout << system.toJson() << std::endl;
    std::cout << "Registry: " << registry.stats().toJson() << std::endl;

    return system.is_valid ? 0 : 2;
}
