#pragma once

#include <factstore/model/triple_assertion.h>

#include <optional>
#include <string>
#include <vector>

namespace factstore {

enum class SortOrder { Ascending, Descending };

/**
 * One read request against an ITripleStore. Every filter is optional.
 *
 * Time bounds and active_at are compared with stored timestamps as byte
 * strings, so they must use the same fixed-width UTC format.
 */
struct TripleQuery {
    // Exact-match filters, canonicalized before comparison
    std::optional<std::string> subject;
    std::optional<std::string> predicate;
    std::optional<std::string> object;

    // Partition filter
    std::optional<Scope> scope;
    std::optional<std::string> owner_id;

    std::optional<std::string> since;     // observed_at >= since
    std::optional<std::string> until;     // observed_at <= until
    std::optional<std::string> active_at; // valid_from <= active_at < valid_until

    // Semantic search: query_text needs a store-configured embedder,
    // query_vector is used directly and takes precedence.
    std::optional<std::string> query_text;
    std::optional<std::vector<float>> query_vector;
    std::optional<double> min_score; // Cosine similarity threshold

    int limit = 100; // <= 0 means unbounded
    SortOrder order = SortOrder::Ascending; // observed_at order for non-semantic queries

    bool isSemantic() const { return query_vector.has_value() || query_text.has_value(); }
};

/**
 * Filter values canonicalized once, so that per-row matching does no
 * allocation. Empty filters are dropped.
 */
struct NormalizedFilters {
    std::optional<std::string> subject;
    std::optional<std::string> predicate;
    std::optional<std::string> object;
    std::optional<Scope> scope;
    std::optional<std::string> owner_id;
    std::optional<std::string> since;
    std::optional<std::string> until;
    std::optional<std::string> active_at;
};

NormalizedFilters normalizeFilters(const TripleQuery& query);

/**
 * Structured match of @p assertion against @p filters. Semantic fields of the
 * query play no part here.
 */
bool matchesFilters(const TripleAssertion& assertion, const NormalizedFilters& filters);

/**
 * True when the validity window of @p assertion contains @p at:
 * (valid_from absent or <= at) and (valid_until absent or > at).
 */
bool isActiveAt(const TripleAssertion& assertion, const std::string& at);

/**
 * Convert TripleQuery::limit to a row count; 0 means unbounded.
 */
inline size_t effectiveLimit(int limit) {
    return limit > 0 ? static_cast<size_t>(limit) : 0;
}

} // namespace factstore
