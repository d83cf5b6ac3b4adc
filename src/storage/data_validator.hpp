#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace sparkle::storage {

/**
 * ValidationReport - Findings of one integrity audit.
 * Issues break an invariant; warnings are informational.
 */
struct ValidationReport {
    int total_themes = 0;
    int total_inspirations = 0;
    int orphaned_inspirations = 0;
    std::vector<std::string> issues;
    std::vector<std::string> warnings;

    [[nodiscard]] bool is_valid() const { return issues.empty(); }
};

/**
 * DataValidator - Read-only integrity auditor.
 *
 * All checks run against one consistent snapshot. Nothing is repaired here;
 * see IntegrityCoordinator::repair_orphans and refresh_all_counts.
 */
class DataValidator {
public:
    explicit DataValidator(Database& db) : db_(db) {}

    [[nodiscard]] Result<ValidationReport, Error> check();

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> check_totals(ValidationReport& report);
    [[nodiscard]] Result<void, Error> check_orphans(ValidationReport& report);
    [[nodiscard]] Result<void, Error> check_duplicates(ValidationReport& report);
    [[nodiscard]] Result<void, Error> check_blank_content(ValidationReport& report);
    [[nodiscard]] Result<void, Error> check_aggregates(ValidationReport& report);
};

/**
 * Render a report for humans. Only the first `max_warnings` warnings are
 * listed, followed by the number left out.
 */
[[nodiscard]] std::string format_report(const ValidationReport& report, size_t max_warnings = 5);

} // namespace sparkle::storage
