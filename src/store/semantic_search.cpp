#include <spdlog/spdlog.h>
#include <factstore/store/semantic_search.h>
#include <factstore/store/vector_math.h>

#include <algorithm>

namespace factstore::store {

Result<std::vector<std::vector<float>>>
embedAssertions(embedding::ITextEmbedder& embedder, const std::vector<TripleAssertion>& assertions) {
    std::vector<std::string> texts;
    texts.reserve(assertions.size());
    for (const auto& a : assertions) {
        texts.push_back(a.canonicalText());
    }

    auto result = embedder.embedTexts(texts);
    if (!result) {
        return Error{ErrorCode::EmbeddingFailure,
                     "Embedder '" + embedder.name() + "' failed: " + result.error().message};
    }

    auto vectors = std::move(result).value();
    if (vectors.size() != texts.size()) {
        return Error{ErrorCode::EmbeddingFailure,
                     "Embedder '" + embedder.name() + "' returned " +
                         std::to_string(vectors.size()) + " vectors for " +
                         std::to_string(texts.size()) + " texts"};
    }
    for (const auto& v : vectors) {
        if (v.empty() || v.size() != vectors.front().size()) {
            return Error{ErrorCode::EmbeddingFailure,
                         "Embedder '" + embedder.name() + "' returned inconsistent dimensions"};
        }
    }
    return vectors;
}

Result<std::optional<std::vector<float>>> resolveQueryVector(const TripleQuery& query,
                                                             embedding::ITextEmbedder* embedder) {
    if (query.query_vector) {
        if (query.query_vector->empty()) {
            return Error{ErrorCode::InvalidArgument, "query_vector must not be empty"};
        }
        return std::optional<std::vector<float>>{*query.query_vector};
    }
    if (!query.query_text) {
        return std::optional<std::vector<float>>{};
    }
    if (embedder == nullptr) {
        return Error{ErrorCode::MissingCapability,
                     "query_text requires a configured embedder (vector search); keyword "
                     "fallback is disabled"};
    }

    auto vec = embedder->embed(*query.query_text);
    if (!vec) {
        return Error{ErrorCode::EmbeddingFailure,
                     "Embedder '" + embedder->name() + "' failed: " + vec.error().message};
    }
    if (vec.value().empty()) {
        return Error{ErrorCode::EmbeddingFailure,
                     "Embedder '" + embedder->name() + "' returned an empty vector"};
    }
    return std::optional<std::vector<float>>{std::move(vec).value()};
}

Result<std::vector<RankedAssertion>> rankBySimilarity(const std::vector<RankCandidate>& candidates,
                                                      const std::vector<float>& query_vector,
                                                      std::optional<double> min_score,
                                                      size_t limit) {
    if (query_vector.empty()) {
        return Error{ErrorCode::InvalidArgument, "query_vector must not be empty"};
    }

    std::vector<RankedAssertion> ranked;
    ranked.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.vector == nullptr || c.vector->empty()) {
            continue;
        }
        if (c.vector->size() != query_vector.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "query_vector has dimension " + std::to_string(query_vector.size()) +
                             ", stored vectors have dimension " +
                             std::to_string(c.vector->size())};
        }
        double score = computeCosineSimilarity(query_vector, *c.vector);
        if (min_score && score < *min_score) {
            continue;
        }
        ranked.push_back({c.assertion, score});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedAssertion& a, const RankedAssertion& b) {
                         return a.score > b.score;
                     });

    if (limit > 0 && ranked.size() > limit) {
        ranked.resize(limit);
    }
    spdlog::debug("Semantic ranking kept {} of {} candidates", ranked.size(), candidates.size());
    return ranked;
}

} // namespace factstore::store
