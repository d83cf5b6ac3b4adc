#include "storage/data_validator.hpp"
#include "storage/logging.hpp"
#include "core/inspiration.hpp"
#include <algorithm>
#include <sstream>

namespace sparkle::storage {

namespace {

constexpr size_t kPreviewLength = 30;

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // namespace

Result<ValidationReport, Error> DataValidator::check() {
    ValidationReport report;

    // One read snapshot for every check; no write lock.
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto step = check_totals(report);
        if (step.is_err()) return step;
        step = check_orphans(report);
        if (step.is_err()) return step;
        step = check_duplicates(report);
        if (step.is_err()) return step;
        step = check_blank_content(report);
        if (step.is_err()) return step;
        return check_aggregates(report);
    }, Database::TransactionMode::Deferred);
    if (result.is_err()) {
        return Result<ValidationReport, Error>::err(result.unwrap_err());
    }

    qCInfo(sparkleValidatorLog) << "audit: themes=" << report.total_themes
                                << "inspirations=" << report.total_inspirations
                                << "orphans=" << report.orphaned_inspirations
                                << "issues=" << report.issues.size()
                                << "warnings=" << report.warnings.size();
    return Result<ValidationReport, Error>::ok(std::move(report));
}

Result<void, Error> DataValidator::check_totals(ValidationReport& report) {
    return db_.query(
        "SELECT (SELECT COUNT(*) FROM themes), (SELECT COUNT(*) FROM inspirations);",
        [&](Statement& stmt) {
            report.total_themes = stmt.column_int(0);
            report.total_inspirations = stmt.column_int(1);
        });
}

Result<void, Error> DataValidator::check_orphans(ValidationReport& report) {
    std::vector<std::string> orphan_warnings;
    auto result = db_.query(R"SQL(
        SELECT content, theme_name FROM inspirations
        WHERE theme_name NOT IN (SELECT name FROM themes)
        ORDER BY id ASC;
    )SQL", [&](Statement& stmt) {
        orphan_warnings.push_back("Orphaned inspiration: '" +
                                  preview(stmt.column_text(0), kPreviewLength) +
                                  "...' (theme: '" + stmt.column_text(1) + "')");
    });
    if (result.is_err()) return result;

    report.orphaned_inspirations = static_cast<int>(orphan_warnings.size());
    if (!orphan_warnings.empty()) {
        report.issues.push_back("Found " + std::to_string(orphan_warnings.size()) +
                                " orphaned inspirations (theme does not exist)");
        report.warnings.insert(report.warnings.end(),
                               orphan_warnings.begin(), orphan_warnings.end());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DataValidator::check_duplicates(ValidationReport& report) {
    std::vector<std::string> duplicates;
    auto result = db_.query(
        "SELECT name FROM themes GROUP BY name HAVING COUNT(*) > 1 ORDER BY name;",
        [&](Statement& stmt) { duplicates.push_back(stmt.column_text(0)); });
    if (result.is_err()) return result;

    if (!duplicates.empty()) {
        report.issues.push_back("Found duplicate themes: " + join(duplicates, ", "));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DataValidator::check_blank_content(ValidationReport& report) {
    int blank = 0;
    auto result = db_.query("SELECT content FROM inspirations;", [&](Statement& stmt) {
        if (is_blank(stmt.column_text(0))) ++blank;
    });
    if (result.is_err()) return result;

    if (blank > 0) {
        report.issues.push_back("Found " + std::to_string(blank) +
                                " inspirations with empty content");
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DataValidator::check_aggregates(ValidationReport& report) {
    return db_.query(R"SQL(
        SELECT t.name, t.inspirationCount,
               (SELECT COUNT(*) FROM inspirations i WHERE i.theme_name = t.name)
        FROM themes t
        ORDER BY t.name ASC;
    )SQL", [&](Statement& stmt) {
        auto name = stmt.column_text(0);
        int cached = stmt.column_int(1);
        int actual = stmt.column_int(2);
        if (actual == 0) {
            report.warnings.push_back("Theme '" + name + "' has no inspirations");
        }
        if (cached != actual) {
            report.warnings.push_back("Theme '" + name + "' caches " + std::to_string(cached) +
                                      " inspirations but has " + std::to_string(actual));
        }
    });
}

std::string format_report(const ValidationReport& report, size_t max_warnings) {
    std::ostringstream out;
    out << "Data integrity report\n";
    out << std::string(30, '=') << "\n";
    out << "Themes: " << report.total_themes << "\n";
    out << "Inspirations: " << report.total_inspirations << "\n";
    out << "Orphaned inspirations: " << report.orphaned_inspirations << "\n";
    out << "Status: " << (report.is_valid() ? "valid" : "problems found") << "\n";

    if (!report.issues.empty()) {
        out << "\nIssues:\n";
        for (const auto& issue : report.issues) {
            out << "  - " << issue << "\n";
        }
    }

    if (!report.warnings.empty()) {
        out << "\nWarnings:\n";
        size_t shown = std::min(max_warnings, report.warnings.size());
        for (size_t i = 0; i < shown; ++i) {
            out << "  - " << report.warnings[i] << "\n";
        }
        if (report.warnings.size() > shown) {
            out << "  ... " << (report.warnings.size() - shown) << " more warnings\n";
        }
    }

    if (report.is_valid() && report.warnings.empty()) {
        out << "\nAll checks passed.\n";
    }
    return out.str();
}

} // namespace sparkle::storage
