#include "integrity_checker.hpp"

#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>

#include "../core/vector_cache_store.hpp"

IntegrityChecker::IntegrityChecker(const CacheConfig& config) {
    options_.verify_checksums = config.integrity_check_enabled;
    options_.max_recoverable_corruption_rate = config.max_recoverable_corruption_rate;
}

const char* to_string(IntegrityChecker::FindingKind kind) {
    using K = IntegrityChecker::FindingKind;
    switch (kind) {
        case K::DIMENSION_MISMATCH:       return "DIMENSION_MISMATCH";
        case K::CHECKSUM_MISMATCH:        return "CHECKSUM_MISMATCH";
        case K::NON_FINITE_COMPONENT:     return "NON_FINITE_COMPONENT";
        case K::SIZE_ACCOUNTING_MISMATCH: return "SIZE_ACCOUNTING_MISMATCH";
        case K::CORRUPTION_RATE_EXCEEDED: return "CORRUPTION_RATE_EXCEEDED";
        default:                          return "UNKNOWN";
    }
}

bool IntegrityChecker::Report::hasUnrecoverable() const {
    for (const auto& f : findings) {
        if (!f.recoverable) return true;
    }
    return false;
}

std::vector<std::string> IntegrityChecker::Report::recoverableIds() const {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& f : findings) {
        if (f.recoverable && !f.entry_id.empty() && seen.insert(f.entry_id).second) {
            ids.push_back(f.entry_id);
        }
    }
    return ids;
}

IntegrityChecker::Report IntegrityChecker::scan(const VectorCacheStore& store) const {
    std::shared_lock<std::shared_mutex> lock(store.mutex_);

    Report report;
    report.total_entries = store.entries_.size();
    report.checksums_verified = options_.verify_checksums;

    std::unordered_set<std::string> affected;
    size_t recomputed_bytes = 0;

    for (const auto& entry : store.entries_) {
        recomputed_bytes += entry->sizeBytes();
        const std::string& id = entry->id();

        if (store.dimensions_ != 0 && entry->embedding().size() != store.dimensions_) {
            report.findings.push_back({FindingKind::DIMENSION_MISMATCH, id, true,
                                       "expected " + std::to_string(store.dimensions_) +
                                           ", found " + std::to_string(entry->embedding().size())});
            affected.insert(id);
        }
        if (!entry->embedding().is_finite()) {
            report.findings.push_back({FindingKind::NON_FINITE_COMPONENT, id, true,
                                       "embedding contains NaN or infinite values"});
            affected.insert(id);
        }
        if (options_.verify_checksums && entry->contentHash() != entry->computeContentHash()) {
            report.findings.push_back({FindingKind::CHECKSUM_MISMATCH, id, true,
                                       "stored content hash does not match content"});
            affected.insert(id);
        }
    }

    if (recomputed_bytes != store.total_bytes_) {
        report.findings.push_back({FindingKind::SIZE_ACCOUNTING_MISMATCH, "", false,
                                   "tracked " + std::to_string(store.total_bytes_) +
                                       " bytes, entries sum to " + std::to_string(recomputed_bytes)});
    }

    report.affected_entries = affected.size();
    report.corruption_rate = report.total_entries == 0
        ? 0.0
        : static_cast<double>(report.affected_entries) / static_cast<double>(report.total_entries);

    if (report.corruption_rate > options_.max_recoverable_corruption_rate) {
        report.findings.push_back({FindingKind::CORRUPTION_RATE_EXCEEDED, "", false,
                                   std::to_string(report.affected_entries) + " of " +
                                       std::to_string(report.total_entries) + " entries affected"});
    }

    if (!report.clean()) {
        std::cerr << "[Integrity] " << report.findings.size() << " finding(s), corruption rate "
                  << report.corruption_rate << std::endl;
    }
    return report;
}

void to_json(json& j, const IntegrityChecker::Finding& f) {
    j = json{
        {"kind", to_string(f.kind)},
        {"entry_id", f.entry_id},
        {"recoverable", f.recoverable},
        {"detail", f.detail}
    };
}

void to_json(json& j, const IntegrityChecker::Report& r) {
    j = json{
        {"total_entries", r.total_entries},
        {"affected_entries", r.affected_entries},
        {"corruption_rate", r.corruption_rate},
        {"checksums_verified", r.checksums_verified},
        {"findings", r.findings}
    };
}
