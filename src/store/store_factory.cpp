#include <spdlog/spdlog.h>
#include <factstore/config/config_helpers.h>
#include <factstore/store/in_memory_triple_store.h>
#include <factstore/store/store_factory.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace factstore::store {

const char* backendToString(TripleStoreBackend backend) {
    switch (backend) {
        case TripleStoreBackend::InMemory:
            return "memory";
        case TripleStoreBackend::Sqlite:
            return "sqlite";
    }
    return "memory";
}

std::optional<TripleStoreBackend> parseBackend(std::string_view text) {
    std::string value(text);
    config::trim(value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "memory" || value == "in_memory" || value == "inmemory") {
        return TripleStoreBackend::InMemory;
    }
    if (value == "sqlite") {
        return TripleStoreBackend::Sqlite;
    }
    return std::nullopt;
}

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& config_path) {
    StoreConfig cfg;
    cfg.sqlite.path = config::get_data_dir() / "triples.db";

    auto backend = config::parse_config_value(config_path, "store", "backend");
    if (!backend.empty()) {
        auto parsed = parseBackend(backend);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument, "Unknown store backend '" + backend + "'"};
        }
        cfg.backend = *parsed;
    }

    if (auto path = config::parse_config_value(config_path, "store", "path"); !path.empty()) {
        cfg.sqlite.path = config::expand_tilde(path);
    }
    if (auto table = config::parse_config_value(config_path, "store", "table"); !table.empty()) {
        cfg.sqlite.table_name = table;
    }
    if (auto column = config::parse_config_value(config_path, "store", "vector_column");
        !column.empty()) {
        cfg.sqlite.vector_column = column;
    }
    return cfg;
}

Result<std::optional<embedding::HttpEmbedderConfig>>
loadEmbedderConfig(const std::filesystem::path& config_path) {
    auto url = config::parse_config_value(config_path, "embeddings", "url");
    if (url.empty()) {
        return std::optional<embedding::HttpEmbedderConfig>{};
    }

    embedding::HttpEmbedderConfig cfg;
    cfg.url = url;
    cfg.model = config::parse_config_value(config_path, "embeddings", "model");

    if (auto keyEnv = config::parse_config_value(config_path, "embeddings", "api_key_env");
        !keyEnv.empty()) {
        if (const char* key = std::getenv(keyEnv.c_str()); key && *key) {
            cfg.api_key = std::string(key);
        } else {
            spdlog::warn("Embeddings api_key_env '{}' is not set; sending no credentials",
                         keyEnv);
        }
    }

    if (auto timeout = config::parse_config_value(config_path, "embeddings", "timeout_ms");
        !timeout.empty()) {
        auto ms = config::parse_ms(timeout);
        if (!ms) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid embeddings.timeout_ms '" + timeout + "'"};
        }
        cfg.timeout = *ms;
    }

    auto insecure = config::parse_config_value(config_path, "embeddings", "insecure_tls");
    cfg.insecure_tls = (insecure == "true" || insecure == "1");

    return std::optional<embedding::HttpEmbedderConfig>{std::move(cfg)};
}

Result<std::unique_ptr<ITripleStore>>
createTripleStore(const StoreConfig& config, std::shared_ptr<embedding::ITextEmbedder> embedder) {
    switch (config.backend) {
        case TripleStoreBackend::InMemory:
            return std::unique_ptr<ITripleStore>(
                std::make_unique<InMemoryTripleStore>(std::move(embedder)));
        case TripleStoreBackend::Sqlite: {
            auto opened = SqliteTripleStore::open(config.sqlite, std::move(embedder));
            if (!opened)
                return opened.error();
            return std::unique_ptr<ITripleStore>(std::move(opened).value());
        }
    }
    return Error{ErrorCode::InvalidArgument, "Unknown store backend"};
}

Result<std::unique_ptr<ITripleStore>>
openTripleStoreFromConfig(const std::string& override_config_path) {
    const auto configPath = config::get_config_path(override_config_path);

    auto storeConfig = loadStoreConfig(configPath);
    if (!storeConfig)
        return storeConfig.error();

    auto embedderConfig = loadEmbedderConfig(configPath);
    if (!embedderConfig)
        return embedderConfig.error();

    std::shared_ptr<embedding::ITextEmbedder> embedder;
    if (embedderConfig.value()) {
        embedder = std::make_shared<embedding::HttpTextEmbedder>(*embedderConfig.value());
    }

    spdlog::debug("Opening {} triple store (config: {}, embedder: {})",
                  backendToString(storeConfig.value().backend), configPath.string(),
                  embedder ? embedder->name() : "none");
    return createTripleStore(storeConfig.value(), std::move(embedder));
}

} // namespace factstore::store
