// src/features/integrity_checker.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../core/cache_config.hpp"

class VectorCacheStore;

/**
 * Integrity Checker
 *
 * Read-only scan of a store. Reports what it finds and leaves remediation
 * (drop-and-refetch vs. full rebuild) to the lifecycle controller.
 */
class IntegrityChecker {
public:
    enum class FindingKind {
        DIMENSION_MISMATCH,
        CHECKSUM_MISMATCH,
        NON_FINITE_COMPONENT,
        SIZE_ACCOUNTING_MISMATCH,
        CORRUPTION_RATE_EXCEEDED
    };

    struct Finding {
        FindingKind kind;
        std::string entry_id;  // empty for store-wide findings
        bool recoverable;
        std::string detail;
    };

    struct Report {
        size_t total_entries{0};
        size_t affected_entries{0};
        double corruption_rate{0.0};  // affected / total
        bool checksums_verified{false};
        std::vector<Finding> findings;

        bool clean() const { return findings.empty(); }
        bool hasUnrecoverable() const;
        // Distinct ids of entries that can be dropped and refetched.
        std::vector<std::string> recoverableIds() const;
    };

    struct Options {
        bool verify_checksums = true;
        double max_recoverable_corruption_rate = 0.25;
    };

    IntegrityChecker() = default;
    explicit IntegrityChecker(const Options& options) : options_(options) {}
    explicit IntegrityChecker(const CacheConfig& config);

    // Holds the store's shared lock for the whole scan.
    Report scan(const VectorCacheStore& store) const;

private:
    Options options_;
};

using IntegrityReport = IntegrityChecker::Report;

const char* to_string(IntegrityChecker::FindingKind kind);

void to_json(json& j, const IntegrityChecker::Finding& f);
void to_json(json& j, const IntegrityChecker::Report& r);
