#include <factstore/model/triple_query.h>

namespace factstore {

namespace {

std::optional<std::string> canonicalFilter(const std::optional<std::string>& value) {
    if (!value)
        return std::nullopt;
    auto canonical = canonicalizeTerm(*value);
    if (canonical.empty())
        return std::nullopt;
    return canonical;
}

std::optional<std::string> nonEmpty(const std::optional<std::string>& value) {
    if (!value || value->empty())
        return std::nullopt;
    return value;
}

} // namespace

NormalizedFilters normalizeFilters(const TripleQuery& query) {
    NormalizedFilters f;
    f.subject = canonicalFilter(query.subject);
    f.predicate = canonicalFilter(query.predicate);
    f.object = canonicalFilter(query.object);
    f.scope = query.scope;
    f.owner_id = nonEmpty(query.owner_id);
    f.since = nonEmpty(query.since);
    f.until = nonEmpty(query.until);
    f.active_at = nonEmpty(query.active_at);
    return f;
}

bool isActiveAt(const TripleAssertion& assertion, const std::string& at) {
    if (assertion.validFrom() && *assertion.validFrom() > at)
        return false;
    if (assertion.validUntil() && *assertion.validUntil() <= at)
        return false;
    return true;
}

bool matchesFilters(const TripleAssertion& assertion, const NormalizedFilters& filters) {
    if (filters.subject && assertion.subject() != *filters.subject)
        return false;
    if (filters.predicate && assertion.predicate() != *filters.predicate)
        return false;
    if (filters.object && assertion.object() != *filters.object)
        return false;
    if (filters.scope && assertion.scope() != *filters.scope)
        return false;
    if (filters.owner_id && assertion.ownerId() != filters.owner_id)
        return false;
    if (filters.since && assertion.observedAt() < *filters.since)
        return false;
    if (filters.until && assertion.observedAt() > *filters.until)
        return false;
    if (filters.active_at && !isActiveAt(assertion, *filters.active_at))
        return false;
    return true;
}

} // namespace factstore
