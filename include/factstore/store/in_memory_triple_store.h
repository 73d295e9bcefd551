#pragma once

#include <factstore/embedding/text_embedder.h>
#include <factstore/store/triple_store.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace factstore::store {

/**
 * Process-local, append-only triple store.
 *
 * Rows live in a growable vector; structured queries are a linear scan.
 * When constructed with an embedder, each added assertion is also embedded
 * from its canonical text so query_text/query_vector can be served.
 *
 * Not thread-safe: the row vector is shared mutable state. Callers must
 * serialize concurrent access externally.
 */
class InMemoryTripleStore final : public ITripleStore {
public:
    explicit InMemoryTripleStore(std::shared_ptr<embedding::ITextEmbedder> embedder = nullptr);
    ~InMemoryTripleStore() override = default;

    InMemoryTripleStore(const InMemoryTripleStore&) = delete;
    InMemoryTripleStore& operator=(const InMemoryTripleStore&) = delete;

    Result<std::vector<std::string>> add(const std::vector<TripleAssertion>& assertions) override;
    Result<std::vector<TripleAssertion>> query(const TripleQuery& query) const override;
    Result<size_t> count() const override;
    bool hasEmbedder() const override { return embedder_ != nullptr; }
    void close() override;

private:
    struct Row {
        std::string id;
        TripleAssertion assertion;
        std::optional<std::vector<float>> vector;
    };

    std::shared_ptr<embedding::ITextEmbedder> embedder_;
    std::vector<Row> rows_;
    size_t dimension_ = 0;
    bool closed_ = false;
};

} // namespace factstore::store
