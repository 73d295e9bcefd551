#pragma once

#include <factstore/core/types.h>
#include <factstore/embedding/text_embedder.h>
#include <factstore/model/triple_assertion.h>
#include <factstore/model/triple_query.h>

#include <optional>
#include <vector>

namespace factstore::store {

/**
 * Embed the canonical text of every assertion in one embedder call.
 *
 * Embedder errors, a wrong vector count, empty vectors or mixed dimensions
 * all come back as ErrorCode::EmbeddingFailure.
 */
Result<std::vector<std::vector<float>>>
embedAssertions(embedding::ITextEmbedder& embedder, const std::vector<TripleAssertion>& assertions);

/**
 * Vector to rank against, or nullopt for a structured query.
 *
 * query_vector wins over query_text. query_text with no @p embedder fails
 * with ErrorCode::MissingCapability; there is no keyword fallback.
 */
Result<std::optional<std::vector<float>>> resolveQueryVector(const TripleQuery& query,
                                                             embedding::ITextEmbedder* embedder);

/**
 * A filtered row offered for ranking. @p vector may be null for rows stored
 * without an embedding; those are skipped.
 */
struct RankCandidate {
    const TripleAssertion* assertion = nullptr;
    const std::vector<float>* vector = nullptr;
};

struct RankedAssertion {
    const TripleAssertion* assertion = nullptr;
    double score = 0.0;
};

/**
 * Rank candidates by descending cosine similarity to @p query_vector.
 * Scores below @p min_score are dropped, equal scores keep candidate order,
 * and at most @p limit results are kept (0 = unbounded).
 *
 * Fails with ErrorCode::InvalidArgument when the query vector is empty or
 * its length differs from a stored vector.
 */
Result<std::vector<RankedAssertion>> rankBySimilarity(const std::vector<RankCandidate>& candidates,
                                                      const std::vector<float>& query_vector,
                                                      std::optional<double> min_score,
                                                      size_t limit);

} // namespace factstore::store
