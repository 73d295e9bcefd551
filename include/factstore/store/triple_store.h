#pragma once

#include <factstore/core/types.h>
#include <factstore/model/triple_assertion.h>
#include <factstore/model/triple_query.h>

#include <string>
#include <vector>

namespace factstore::store {

/**
 * Contract shared by every triple store backend.
 *
 * For the same structured query all backends return the same assertions in
 * the same order: observed_at order (ties in insertion order), with the
 * limit applied after sorting. Semantic queries rank by descending cosine
 * similarity.
 *
 * Implementations are not internally synchronized; callers sharing a store
 * between threads must serialize access themselves.
 */
class ITripleStore {
public:
    virtual ~ITripleStore() = default;

    /**
     * Append @p assertions as one atomic batch: all become visible to later
     * queries or, on failure, none do.
     * @return Generated assertion ids, in input order
     */
    virtual Result<std::vector<std::string>> add(const std::vector<TripleAssertion>& assertions) = 0;

    /**
     * Read matching assertions. Never mutates state; no match is an empty
     * vector. query_text without a configured embedder fails with
     * ErrorCode::MissingCapability.
     */
    virtual Result<std::vector<TripleAssertion>> query(const TripleQuery& query) const = 0;

    /**
     * Number of stored assertions
     */
    virtual Result<size_t> count() const = 0;

    /**
     * True when query_text requests can be served
     */
    virtual bool hasEmbedder() const = 0;

    /**
     * Release resources. Idempotent; later operations fail with
     * ErrorCode::NotInitialized.
     */
    virtual void close() = 0;
};

} // namespace factstore::store
