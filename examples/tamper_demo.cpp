#include "tierchain.hpp"
#include <iostream>

using namespace tierchain;

void printReport(const validation::ValidationResult &report) {
    std::cout << ledger::entityKindToString(report.kind) << " " << report.entity_id << ": "
              << (report.is_valid ? "VALID" : "INVALID") << std::endl;
    for (const auto &error : report.errors)
        std::cout << "  error: " << error << std::endl;
    for (const auto &warning : report.warnings)
        std::cout << "  warning: " << warning << std::endl;
}

template <typename T> bool succeeded(const char *what, const dp::Result<T, dp::Error> &result) {
    if (!result.is_ok())
        std::cerr << what << " failed: " << errorMessage(result.error()) << std::endl;
    return result.is_ok();
}

int main() {
    LedgerOptions options;
    options.difficulty = 2;
    options.verbose = false;

    registry::ChainRegistry registry(options);
    auto opened = registry.open();
    if (!opened.is_ok()) {
        std::cerr << "Opening registry failed: " << errorMessage(opened.error()) << std::endl;
        return 1;
    }

    if (!succeeded("Create root", registry.createRoot("dept-1", "Physics")) ||
        !succeeded("Create group", registry.createGroup("class-1", "Physics Year 2", "dept-1")) ||
        !succeeded("Create leaf", registry.createLeaf("student-1", "Dana Kim", "class-1")) ||
        !succeeded("Record",
                   registry.appendRecord("student-1", {"2024-11-16", ledger::AttendanceStatus::Present, "", {}})))
        return 1;

    // The root needs a second block before it can be tampered with
    if (!succeeded("Update root", registry.updateRoot("dept-1", {{"name", "Applied Physics"}})))
        return 1;

    validation::ValidationService validator(registry);
    std::cout << "Before tampering:" << std::endl;
    auto before = validator.validateSystem();

    if (!succeeded("Tamper drill", registry.simulateTampering(ledger::EntityKind::Root, "dept-1")))
        return 1;

    std::cout << "\nAfter tampering:" << std::endl;
    auto after = validator.validateSystem();
    for (const auto &report : after.details)
        printReport(report);

    auto leaf = validator.validateLeaf("student-1");
    if (leaf.is_ok()) {
        auto required = validation::ValidationService::require(leaf.value());
        if (!required.is_ok())
            std::cout << "\nRefusing to trust student-1: " << errorMessage(required.error()) << std::endl;
    }

    // Cascade: the root is broken, so everything below it is reported invalid
    return before.is_valid && !after.is_valid ? 0 : 1;
}
