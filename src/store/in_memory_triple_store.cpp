#include <spdlog/spdlog.h>
#include <factstore/core/uuid.h>
#include <factstore/store/in_memory_triple_store.h>
#include <factstore/store/semantic_search.h>

#include <algorithm>

namespace factstore::store {

InMemoryTripleStore::InMemoryTripleStore(std::shared_ptr<embedding::ITextEmbedder> embedder)
    : embedder_(std::move(embedder)) {
    spdlog::debug("InMemoryTripleStore created (embedder: {})",
                  embedder_ ? embedder_->name() : "none");
}

Result<std::vector<std::string>>
InMemoryTripleStore::add(const std::vector<TripleAssertion>& assertions) {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }
    if (assertions.empty()) {
        return std::vector<std::string>{};
    }

    // Embed everything before touching rows_ so a failure leaves no partial batch.
    std::vector<std::vector<float>> vectors;
    if (embedder_) {
        auto embedded = embedAssertions(*embedder_, assertions);
        if (!embedded)
            return embedded.error();
        vectors = std::move(embedded).value();

        const size_t dim = vectors.front().size();
        if (dimension_ != 0 && dim != dimension_) {
            return Error{ErrorCode::InvalidData,
                         "Embedding dimension " + std::to_string(dim) +
                             " does not match stored dimension " + std::to_string(dimension_)};
        }
        dimension_ = dim;
    }

    std::vector<std::string> ids;
    ids.reserve(assertions.size());
    rows_.reserve(rows_.size() + assertions.size());
    for (size_t i = 0; i < assertions.size(); ++i) {
        Row row{core::generateUUID(), assertions[i], std::nullopt};
        if (!vectors.empty()) {
            row.vector = std::move(vectors[i]);
        }
        ids.push_back(row.id);
        rows_.push_back(std::move(row));
    }

    spdlog::debug("InMemoryTripleStore appended {} assertions ({} total)", assertions.size(),
                  rows_.size());
    return ids;
}

Result<std::vector<TripleAssertion>> InMemoryTripleStore::query(const TripleQuery& query) const {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }

    auto queryVector = resolveQueryVector(query, embedder_.get());
    if (!queryVector)
        return queryVector.error();

    const auto filters = normalizeFilters(query);
    const size_t limit = effectiveLimit(query.limit);

    std::vector<const Row*> matched;
    for (const auto& row : rows_) {
        if (matchesFilters(row.assertion, filters)) {
            matched.push_back(&row);
        }
    }

    std::vector<TripleAssertion> out;

    if (queryVector.value()) {
        std::vector<RankCandidate> candidates;
        candidates.reserve(matched.size());
        for (const Row* row : matched) {
            candidates.push_back({&row->assertion, row->vector ? &*row->vector : nullptr});
        }

        auto ranked = rankBySimilarity(candidates, *queryVector.value(), query.min_score, limit);
        if (!ranked)
            return ranked.error();

        out.reserve(ranked.value().size());
        for (const auto& hit : ranked.value()) {
            out.push_back(*hit.assertion);
        }
        return out;
    }

    // Sort before truncating; stable so equal timestamps keep insertion order.
    const bool descending = query.order == SortOrder::Descending;
    std::stable_sort(matched.begin(), matched.end(), [descending](const Row* a, const Row* b) {
        return descending ? a->assertion.observedAt() > b->assertion.observedAt()
                          : a->assertion.observedAt() < b->assertion.observedAt();
    });

    if (limit > 0 && matched.size() > limit) {
        matched.resize(limit);
    }

    out.reserve(matched.size());
    for (const Row* row : matched) {
        out.push_back(row->assertion);
    }
    return out;
}

Result<size_t> InMemoryTripleStore::count() const {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }
    return rows_.size();
}

void InMemoryTripleStore::close() {
    if (closed_) {
        return;
    }
    rows_.clear();
    rows_.shrink_to_fit();
    closed_ = true;
    spdlog::debug("InMemoryTripleStore closed");
}

} // namespace factstore::store
