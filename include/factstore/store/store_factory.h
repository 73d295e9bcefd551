#pragma once

#include <factstore/core/types.h>
#include <factstore/embedding/http_text_embedder.h>
#include <factstore/store/sqlite_triple_store.h>
#include <factstore/store/triple_store.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace factstore::store {

enum class TripleStoreBackend { InMemory, Sqlite };

const char* backendToString(TripleStoreBackend backend);

// Accepts "memory"/"in_memory" and "sqlite" (case-insensitive)
std::optional<TripleStoreBackend> parseBackend(std::string_view text);

struct StoreConfig {
    TripleStoreBackend backend = TripleStoreBackend::InMemory;
    SqliteTripleStoreConfig sqlite; // Used when backend == Sqlite
};

/**
 * Read the [store] section of @p config_path. A missing file or key keeps the
 * default; the default sqlite path is <data dir>/triples.db.
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& config_path);

/**
 * Read the [embeddings] section of @p config_path. Returns nullopt when no
 * url is configured. The api key is taken from the environment variable
 * named by api_key_env.
 */
Result<std::optional<embedding::HttpEmbedderConfig>>
loadEmbedderConfig(const std::filesystem::path& config_path);

Result<std::unique_ptr<ITripleStore>>
createTripleStore(const StoreConfig& config,
                  std::shared_ptr<embedding::ITextEmbedder> embedder = nullptr);

/**
 * Resolve the config file, build the configured embedder (if any) and open
 * the configured backend.
 */
Result<std::unique_ptr<ITripleStore>>
openTripleStoreFromConfig(const std::string& override_config_path = "");

} // namespace factstore::store
