// src/core/scope_key.hpp
#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <tuple>

// Identifies one isolated cache: organization + chatbot configuration + the
// knowledge-base content version it was built from.
struct ScopeKey {
    std::string organization_id;
    std::string configuration_id;
    std::string content_version;

    bool operator==(const ScopeKey& other) const {
        return std::tie(organization_id, configuration_id, content_version) ==
               std::tie(other.organization_id, other.configuration_id, other.content_version);
    }
    bool operator!=(const ScopeKey& other) const { return !(*this == other); }
    bool operator<(const ScopeKey& other) const {
        return std::tie(organization_id, configuration_id, content_version) <
               std::tie(other.organization_id, other.configuration_id, other.content_version);
    }

    // For log lines only.
    std::string toString() const {
        return organization_id + "/" + configuration_id + "@" + content_version;
    }
};

namespace std {
    template <>
    struct hash<ScopeKey> {
        size_t operator()(const ScopeKey& k) const {
            size_t seed = 0;
            for (const std::string* part : {&k.organization_id, &k.configuration_id, &k.content_version}) {
                seed ^= std::hash<std::string>()(*part) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            }
            return seed;
        }
    };
}
