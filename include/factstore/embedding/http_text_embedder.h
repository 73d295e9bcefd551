#pragma once

#include <factstore/embedding/text_embedder.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace factstore::embedding {

/**
 * Configuration for an OpenAI-compatible embeddings endpoint.
 */
struct HttpEmbedderConfig {
    std::string url = "http://localhost:8080/v1/embeddings";
    std::string model;
    std::optional<std::string> api_key; // Sent as "Authorization: Bearer <key>"
    std::chrono::milliseconds timeout{30000};
    bool insecure_tls = false;
};

/**
 * ITextEmbedder backed by an HTTP embeddings gateway (libcurl).
 *
 * Request:  {"model": "...", "input": ["text", ...]}
 * Response: {"data": [{"index": 0, "embedding": [..]}, ...]}
 *
 * One POST per embedTexts() call. Transport failures map to NetworkError or
 * Timeout, HTTP errors and malformed bodies to EmbeddingFailure.
 */
class HttpTextEmbedder final : public ITextEmbedder {
public:
    explicit HttpTextEmbedder(HttpEmbedderConfig config);
    ~HttpTextEmbedder() override = default;

    Result<std::vector<std::vector<float>>>
    embedTexts(const std::vector<std::string>& texts) override;

    std::string name() const override { return "http"; }

    const HttpEmbedderConfig& config() const { return config_; }

    static std::string buildRequestBody(const std::string& model,
                                        const std::vector<std::string>& texts);

    /**
     * Parse an embeddings response body. Entries are reordered by their
     * "index" field; @p expected_count inputs must yield exactly that many
     * vectors of equal length.
     */
    static Result<std::vector<std::vector<float>>> parseResponseBody(const std::string& body,
                                                                     size_t expected_count);

private:
    HttpEmbedderConfig config_;
};

} // namespace factstore::embedding
