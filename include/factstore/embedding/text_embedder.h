#pragma once

#include <factstore/core/types.h>

#include <string>
#include <vector>

namespace factstore::embedding {

/**
 * Abstract text embedding capability.
 *
 * Stores treat an embedder as a pure function from text to a fixed-length
 * vector and never look at embedding quality. Transport, batching policy,
 * caching and timeouts belong to the implementation.
 */
class ITextEmbedder {
public:
    virtual ~ITextEmbedder() = default;

    /**
     * Embed a batch of texts.
     * @return One vector per input, in input order, all of the same length
     */
    virtual Result<std::vector<std::vector<float>>>
    embedTexts(const std::vector<std::string>& texts) = 0;

    /**
     * Name used in log lines (e.g. "http", "mock")
     */
    virtual std::string name() const = 0;

    /**
     * Embed a single text
     */
    Result<std::vector<float>> embed(const std::string& text) {
        auto result = embedTexts({text});
        if (!result)
            return result.error();
        auto vectors = std::move(result).value();
        if (vectors.size() != 1) {
            return Error{ErrorCode::EmbeddingFailure,
                         "Embedder returned " + std::to_string(vectors.size()) +
                             " vectors for 1 input"};
        }
        return std::move(vectors.front());
    }
};

} // namespace factstore::embedding
