#include <factstore/embedding/http_text_embedder.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string_view>

namespace factstore::embedding {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::EmbeddingFailure;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpTextEmbedder::HttpTextEmbedder(HttpEmbedderConfig config) : config_(std::move(config)) {
    ensureCurlGlobalInit();
}

std::string HttpTextEmbedder::buildRequestBody(const std::string& model,
                                               const std::vector<std::string>& texts) {
    nlohmann::json body;
    if (!model.empty()) {
        body["model"] = model;
    }
    body["input"] = texts;
    return body.dump();
}

Result<std::vector<std::vector<float>>>
HttpTextEmbedder::parseResponseBody(const std::string& body, size_t expected_count) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::EmbeddingFailure, "Embedding response is not valid JSON"};
    }

    auto data = parsed.find("data");
    if (data == parsed.end() || !data->is_array()) {
        return Error{ErrorCode::EmbeddingFailure, "Embedding response has no 'data' array"};
    }

    std::vector<std::pair<size_t, std::vector<float>>> items;
    items.reserve(data->size());
    std::vector<bool> seen(expected_count, false);
    size_t position = 0;
    for (const auto& entry : *data) {
        auto embedding = entry.find("embedding");
        if (!entry.is_object() || embedding == entry.end() || !embedding->is_array()) {
            return Error{ErrorCode::EmbeddingFailure, "Embedding entry has no 'embedding' array"};
        }

        size_t index = position;
        if (auto idx = entry.find("index"); idx != entry.end()) {
            if (!idx->is_number_unsigned()) {
                return Error{ErrorCode::EmbeddingFailure,
                             "Embedding entry has a non-integer 'index'"};
            }
            index = idx->get<size_t>();
        }
        if (index >= expected_count) {
            return Error{ErrorCode::EmbeddingFailure,
                         "Embedding index " + std::to_string(index) + " out of range for " +
                             std::to_string(expected_count) + " inputs"};
        }
        if (seen[index]) {
            return Error{ErrorCode::EmbeddingFailure,
                         "Embedding index " + std::to_string(index) + " appears twice"};
        }
        seen[index] = true;

        std::vector<float> vec;
        vec.reserve(embedding->size());
        for (const auto& v : *embedding) {
            if (!v.is_number()) {
                return Error{ErrorCode::EmbeddingFailure, "Embedding contains a non-numeric value"};
            }
            vec.push_back(v.get<float>());
        }
        items.emplace_back(index, std::move(vec));
        ++position;
    }

    if (items.size() != expected_count) {
        return Error{ErrorCode::EmbeddingFailure,
                     "Expected " + std::to_string(expected_count) + " embeddings, got " +
                         std::to_string(items.size())};
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::vector<float>> out;
    out.reserve(items.size());
    for (auto& [index, vec] : items) {
        if (vec.empty()) {
            return Error{ErrorCode::EmbeddingFailure, "Embedding response contains an empty vector"};
        }
        if (!out.empty() && vec.size() != out.front().size()) {
            return Error{ErrorCode::EmbeddingFailure, "Embedding dimensions differ within a batch"};
        }
        out.push_back(std::move(vec));
    }
    return out;
}

Result<std::vector<std::vector<float>>>
HttpTextEmbedder::embedTexts(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        return std::vector<std::vector<float>>{};
    }

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));
    if (config_.api_key && !config_.api_key->empty()) {
        std::string auth = "Authorization: Bearer " + *config_.api_key;
        headers.reset(curl_slist_append(headers.release(), auth.c_str()));
    }

    const std::string request = buildRequestBody(config_.model, texts);
    std::string response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(config_.timeout.count(), 30000)));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.insecure_tls ? 0L : 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.insecure_tls ? 0L : 2L);

    spdlog::debug("Embedding {} texts via {}", texts.size(), config_.url);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return makeCurlError(rc, "embeddings request");
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status >= 400) {
        std::string snippet = response.substr(0, std::min<size_t>(response.size(), 200));
        return Error{ErrorCode::EmbeddingFailure,
                     "Embeddings endpoint returned HTTP " + std::to_string(http_status) + ": " +
                         snippet};
    }

    return parseResponseBody(response, texts.size());
}

} // namespace factstore::embedding
