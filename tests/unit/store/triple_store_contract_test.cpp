// Behaviour every ITripleStore backend must share, run against each backend.

#include <gtest/gtest.h>
#include <factstore/store/in_memory_triple_store.h>
#include <factstore/store/sqlite_triple_store.h>

#include "../../common/test_embedders.h"
#include "../../common/test_helpers.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <set>
#include <type_traits>

using namespace factstore;
using namespace factstore::store;
using factstore::tests::makeAssertion;
using factstore::tests::objectsOf;
using factstore::tests::observedOf;

namespace {

std::string ts(int day, int hour = 0, int minute = 0) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "2025-01-%02dT%02d:%02d:00Z", day, hour, minute);
    return buf;
}

struct InMemoryBackend {
    static std::unique_ptr<ITripleStore> make(const std::filesystem::path&,
                                              std::shared_ptr<embedding::ITextEmbedder> embedder) {
        return std::make_unique<InMemoryTripleStore>(std::move(embedder));
    }
};

struct SqliteBackend {
    static std::unique_ptr<ITripleStore> make(const std::filesystem::path& dir,
                                              std::shared_ptr<embedding::ITextEmbedder> embedder) {
        SqliteTripleStoreConfig config;
        config.path = dir / "triples.db";
        auto opened = SqliteTripleStore::open(config, std::move(embedder));
        EXPECT_TRUE(opened.has_value()) << (opened ? "" : opened.error().message);
        if (!opened)
            return nullptr;
        return std::move(opened).value();
    }
};

} // namespace

template <typename Backend> class TripleStoreContractTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = factstore::tests::make_temp_dir("factstore_contract_"); }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    ITripleStore& open(std::shared_ptr<embedding::ITextEmbedder> embedder = nullptr) {
        store_ = Backend::make(dir_, std::move(embedder));
        EXPECT_TRUE(store_ != nullptr);
        return *store_;
    }

    std::vector<std::string> add(const std::vector<TripleAssertion>& rows) {
        auto result = store_->add(rows);
        EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message);
        return result ? result.value() : std::vector<std::string>{};
    }

    std::vector<TripleAssertion> query(const TripleQuery& q) {
        auto result = store_->query(q);
        EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message);
        return result ? result.value() : std::vector<TripleAssertion>{};
    }

    // Three facts with predictable bag-of-words embeddings
    void addStoryFacts() {
        add({makeAssertion("scrooge", "hates", "christmas", ts(1)),
             makeAssertion("marley", "is", "ghost", ts(2)),
             makeAssertion("scrooge", "sees", "ghost", ts(3))});
    }

    std::shared_ptr<factstore::tests::VocabularyEmbedder> storyEmbedder() {
        return std::make_shared<factstore::tests::VocabularyEmbedder>(
            std::vector<std::string>{"scrooge", "christmas", "ghost", "marley"});
    }

    std::filesystem::path dir_;
    std::unique_ptr<ITripleStore> store_;
};

using Backends = ::testing::Types<InMemoryBackend, SqliteBackend>;

class BackendNames {
public:
    template <typename T> static std::string GetName(int) {
        if (std::is_same_v<T, InMemoryBackend>)
            return "InMemory";
        return "Sqlite";
    }
};

TYPED_TEST_SUITE(TripleStoreContractTest, Backends, BackendNames);

TYPED_TEST(TripleStoreContractTest, ScroogeRelatedToChristmas) {
    this->open();
    this->add({makeAssertion("  Scrooge ", "related_to", "Christmas", ts(1))});

    TripleQuery q;
    q.subject = "Scrooge";
    q.predicate = "related_to";
    auto hits = this->query(q);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].object(), "christmas");
}

TYPED_TEST(TripleStoreContractTest, AddReturnsOneIdPerAssertion) {
    auto& store = this->open();
    auto ids = this->add({makeAssertion("a", "p", "x", ts(1)), makeAssertion("b", "p", "y", ts(2)),
                          makeAssertion("c", "p", "z", ts(3))});
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 3u);
    for (const auto& id : ids) {
        // Version 4, RFC 4122 variant
        ASSERT_EQ(id.size(), 36u) << id;
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4') << id;
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos) << id;
    }

    auto count = store.count();
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 3u);
}

TYPED_TEST(TripleStoreContractTest, EmptyBatchIsNoOp) {
    auto& store = this->open();
    auto ids = this->add({});
    EXPECT_TRUE(ids.empty());
    EXPECT_EQ(store.count().value(), 0u);
    EXPECT_TRUE(this->query(TripleQuery{}).empty());
}

TYPED_TEST(TripleStoreContractTest, NoMatchIsEmptyNotError) {
    this->open();
    this->add({makeAssertion("a", "p", "x", ts(1))});
    TripleQuery q;
    q.subject = "nobody";
    EXPECT_TRUE(this->query(q).empty());
}

TYPED_TEST(TripleStoreContractTest, LimitAppliesAfterSorting) {
    this->open();
    this->add({makeAssertion("s", "p", "t3", ts(3)), makeAssertion("s", "p", "t1", ts(1)),
               makeAssertion("s", "p", "t2", ts(2))});

    TripleQuery q;
    q.limit = 2;
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"t1", "t2"}));

    q.order = SortOrder::Descending;
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"t3", "t2"}));
}

TYPED_TEST(TripleStoreContractTest, NonPositiveLimitIsUnbounded) {
    this->open();
    std::vector<TripleAssertion> rows;
    for (int i = 0; i < 150; ++i) {
        rows.push_back(makeAssertion("s", "p", "o" + std::to_string(i), ts(1 + i / 60, 0, i % 60)));
    }
    this->add(rows);

    TripleQuery q;
    EXPECT_EQ(this->query(q).size(), 100u);

    q.limit = 0;
    EXPECT_EQ(this->query(q).size(), 150u);

    q.limit = -1;
    auto all = this->query(q);
    ASSERT_EQ(all.size(), 150u);
    EXPECT_TRUE(std::is_sorted(all.begin(), all.end(),
                               [](const TripleAssertion& a, const TripleAssertion& b) {
                                   return a.observedAt() < b.observedAt();
                               }));
}

TYPED_TEST(TripleStoreContractTest, EqualTimestampsKeepInsertionOrder) {
    this->open();
    this->add({makeAssertion("s", "p", "first", ts(5)), makeAssertion("s", "p", "second", ts(5))});
    this->add({makeAssertion("s", "p", "third", ts(5))});

    TripleQuery q;
    EXPECT_EQ(objectsOf(this->query(q)),
              (std::vector<std::string>{"first", "second", "third"}));

    q.order = SortOrder::Descending;
    EXPECT_EQ(objectsOf(this->query(q)),
              (std::vector<std::string>{"first", "second", "third"}));
}

TYPED_TEST(TripleStoreContractTest, SinceAndUntilAreInclusive) {
    this->open();
    this->add({makeAssertion("s", "p", "a", ts(1)), makeAssertion("s", "p", "b", ts(2)),
               makeAssertion("s", "p", "c", ts(3))});

    TripleQuery q;
    q.since = ts(2);
    q.until = ts(2);
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"b"}));

    q.since = ts(1);
    q.until = ts(2);
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"a", "b"}));
}

TYPED_TEST(TripleStoreContractTest, ValidUntilIsExclusiveAtActiveAt) {
    this->open();
    TripleAssertionFields fields;
    fields.subject = "alice";
    fields.predicate = "works_at";
    fields.object = "acme";
    fields.observed_at = ts(1);
    fields.valid_from = ts(1);
    fields.valid_until = ts(10);
    this->add({makeAssertion(fields)});

    TripleQuery q;
    q.active_at = ts(10);
    EXPECT_TRUE(this->query(q).empty());

    q.active_at = ts(9, 23, 59);
    EXPECT_EQ(this->query(q).size(), 1u);

    q.active_at = ts(1);
    EXPECT_EQ(this->query(q).size(), 1u);
}

TYPED_TEST(TripleStoreContractTest, ActiveAtHonoursOpenEnds) {
    this->open();
    TripleAssertionFields openStart;
    openStart.subject = "s";
    openStart.predicate = "p";
    openStart.object = "until-only";
    openStart.observed_at = ts(1);
    openStart.valid_until = ts(5);

    TripleAssertionFields openEnd = openStart;
    openEnd.object = "from-only";
    openEnd.valid_until.reset();
    openEnd.valid_from = ts(5);

    TripleAssertionFields inverted = openStart;
    inverted.object = "inverted";
    inverted.valid_from = ts(8);
    inverted.valid_until = ts(2);

    this->add({makeAssertion(openStart), makeAssertion(openEnd), makeAssertion(inverted)});

    TripleQuery q;
    q.active_at = ts(4);
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"until-only"}));
    q.active_at = ts(5);
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"from-only"}));
}

TYPED_TEST(TripleStoreContractTest, PartitionsAreIsolated) {
    this->open();
    this->add({makeAssertion("user", "likes", "tea", ts(1), Scope::Session, "sess-1"),
               makeAssertion("user", "likes", "coffee", ts(2), Scope::Session, "sess-2"),
               makeAssertion("user", "likes", "water", ts(3), Scope::Global)});

    TripleQuery q;
    q.scope = Scope::Session;
    q.owner_id = "sess-1";
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"tea"}));

    q.owner_id = "sess-2";
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"coffee"}));

    q.owner_id.reset();
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"tea", "coffee"}));

    q.scope = Scope::Global;
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"water"}));

    // Owner filter without scope still excludes unowned rows
    TripleQuery byOwner;
    byOwner.owner_id = "sess-2";
    EXPECT_EQ(objectsOf(this->query(byOwner)), (std::vector<std::string>{"coffee"}));
}

TYPED_TEST(TripleStoreContractTest, CorrectionsNeverReplaceHistory) {
    this->open();
    this->add({makeAssertion("alice", "lives_in", "paris", ts(1))});
    this->add({makeAssertion("alice", "lives_in", "berlin", ts(20))});

    TripleQuery history;
    history.subject = "alice";
    history.predicate = "lives_in";
    EXPECT_EQ(objectsOf(this->query(history)), (std::vector<std::string>{"paris", "berlin"}));

    TripleQuery original = history;
    original.since = ts(1);
    original.until = ts(1);
    EXPECT_EQ(objectsOf(this->query(original)), (std::vector<std::string>{"paris"}));

    TripleQuery latest = history;
    latest.order = SortOrder::Descending;
    latest.limit = 1;
    EXPECT_EQ(objectsOf(this->query(latest)), (std::vector<std::string>{"berlin"}));
}

TYPED_TEST(TripleStoreContractTest, MetadataSurvivesStorage) {
    this->open();
    TripleAssertionFields fields;
    fields.subject = "scrooge";
    fields.predicate = "related_to";
    fields.object = "christmas";
    fields.scope = Scope::Session;
    fields.owner_id = "Sess-A";
    fields.observed_at = ts(1);
    fields.valid_from = ts(1);
    fields.valid_until = ts(30);
    fields.confidence = 0.8;
    fields.provenance = {{"source", "stave-1"}, {"line", 12}};
    fields.attributes = {{"evidence", "Bah! Humbug!"}, {"tags", nlohmann::json::array({"a", "b"})}};
    auto original = makeAssertion(fields);
    this->add({original});

    auto hits = this->query(TripleQuery{});
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0], original);
}

TYPED_TEST(TripleStoreContractTest, NonUtf8MetadataIsAccepted) {
    auto& store = this->open();
    TripleAssertionFields fields;
    fields.subject = "scrooge";
    fields.predicate = "visits";
    fields.object = "cafe";
    fields.observed_at = ts(1);
    fields.provenance = {{"source", std::string("stave-\xff")}};
    fields.attributes = {{"evidence", std::string("caf") + '\xe9'}, {"line", 7}};

    auto ids = store.add({makeAssertion(fields)});
    ASSERT_TRUE(ids.has_value()) << (ids ? "" : ids.error().message);
    EXPECT_EQ(ids.value().size(), 1u);

    auto hits = this->query(TripleQuery{});
    ASSERT_EQ(hits.size(), 1u);
    const auto& attributes = hits[0].attributes();
    ASSERT_EQ(attributes.count("evidence"), 1u);
    ASSERT_TRUE(attributes.at("evidence").is_string());
    EXPECT_EQ(attributes.at("evidence").template get<std::string>().rfind("caf", 0), 0u);
    EXPECT_EQ(attributes.at("line").template get<int>(), 7);
    ASSERT_EQ(hits[0].provenance().count("source"), 1u);
}

TYPED_TEST(TripleStoreContractTest, QueryTextWithoutEmbedderIsMissingCapability) {
    auto& store = this->open();
    EXPECT_FALSE(store.hasEmbedder());
    this->add({makeAssertion("s", "p", "o", ts(1))});

    TripleQuery q;
    q.query_text = "anything";
    auto result = store.query(q);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingCapability);
}

TYPED_TEST(TripleStoreContractTest, QueryTextOnEmptyStoreStillNeedsEmbedder) {
    auto& store = this->open();
    TripleQuery q;
    q.query_text = "anything";
    auto result = store.query(q);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingCapability);
}

TYPED_TEST(TripleStoreContractTest, QueryVectorWithoutStoredVectorsIsEmpty) {
    this->open();
    this->add({makeAssertion("s", "p", "o", ts(1))});
    TripleQuery q;
    q.query_vector = std::vector<float>{1.0f, 0.0f};
    EXPECT_TRUE(this->query(q).empty());
}

TYPED_TEST(TripleStoreContractTest, EmptyQueryVectorIsInvalid) {
    auto& store = this->open();
    TripleQuery q;
    q.query_vector = std::vector<float>{};
    auto result = store.query(q);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TYPED_TEST(TripleStoreContractTest, SemanticRankingByCosine) {
    auto& store = this->open(this->storyEmbedder());
    EXPECT_TRUE(store.hasEmbedder());
    this->addStoryFacts();

    TripleQuery q;
    q.query_text = "scrooge ghost";
    // scores: sees-ghost 1.0, hates-christmas 0.5, marley 0.5 (tie keeps insertion order)
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"ghost", "christmas", "ghost"}));
    auto hits = this->query(q);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].predicate(), "sees");
    EXPECT_EQ(hits[1].predicate(), "hates");
    EXPECT_EQ(hits[2].predicate(), "is");
}

TYPED_TEST(TripleStoreContractTest, SemanticMinScoreAndLimit) {
    this->open(this->storyEmbedder());
    this->addStoryFacts();

    TripleQuery q;
    q.query_text = "christmas";
    auto all = this->query(q);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].object(), "christmas");
    // Zero-score rows tie and keep insertion order
    EXPECT_EQ(all[1].subject(), "marley");
    EXPECT_EQ(all[2].predicate(), "sees");

    q.min_score = 0.5;
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"christmas"}));

    q.min_score.reset();
    q.limit = 2;
    EXPECT_EQ(this->query(q).size(), 2u);
}

TYPED_TEST(TripleStoreContractTest, SemanticQueryAppliesFiltersFirst) {
    this->open(this->storyEmbedder());
    this->addStoryFacts();

    TripleQuery q;
    q.query_text = "scrooge ghost";
    q.subject = "marley";
    auto hits = this->query(q);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].subject(), "marley");

    q.subject.reset();
    q.until = ts(2);
    EXPECT_EQ(objectsOf(this->query(q)), (std::vector<std::string>{"christmas", "ghost"}));
}

TYPED_TEST(TripleStoreContractTest, QueryVectorTakesPrecedenceOverText) {
    auto embedder = this->storyEmbedder();
    this->open(embedder);
    this->addStoryFacts();
    const size_t callsAfterAdd = embedder->calls();

    TripleQuery q;
    q.query_text = "christmas";
    q.query_vector = std::vector<float>{0.0f, 0.0f, 0.0f, 1.0f}; // "marley"
    auto hits = this->query(q);
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].subject(), "marley");
    EXPECT_EQ(embedder->calls(), callsAfterAdd);
}

TYPED_TEST(TripleStoreContractTest, QueryVectorDimensionMismatchIsInvalid) {
    auto& store = this->open(this->storyEmbedder());
    this->addStoryFacts();

    TripleQuery q;
    q.query_vector = std::vector<float>{1.0f, 0.0f};
    auto result = store.query(q);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TYPED_TEST(TripleStoreContractTest, EmbeddingFailureLeavesStoreUnchanged) {
    auto embedder = std::make_shared<factstore::tests::FailingEmbedder>();
    auto& store = this->open(embedder);

    auto result = store.add({makeAssertion("s", "p", "o", ts(1))});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingFailure);
    EXPECT_NE(result.error().message.find("connection refused"), std::string::npos);
    EXPECT_EQ(embedder->calls(), 1u);

    EXPECT_EQ(store.count().value(), 0u);
    EXPECT_TRUE(this->query(TripleQuery{}).empty());
}

TYPED_TEST(TripleStoreContractTest, QueryTextEmbeddingFailure) {
    auto embedder = std::make_shared<factstore::tests::FailingEmbedder>();
    auto& store = this->open(embedder);

    TripleQuery q;
    q.query_text = "anything";
    auto result = store.query(q);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingFailure);
}

TYPED_TEST(TripleStoreContractTest, MismatchedEmbeddingDimensionRejectsBatch) {
    auto embedder = std::make_shared<factstore::tests::FixedDimensionEmbedder>(4);
    auto& store = this->open(embedder);
    this->add({makeAssertion("s", "p", "first", ts(1))});

    embedder->setDimension(3);
    auto result = store.add({makeAssertion("s", "p", "second", ts(2))});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(store.count().value(), 1u);
}

TYPED_TEST(TripleStoreContractTest, OperationsAfterCloseFail) {
    auto& store = this->open();
    this->add({makeAssertion("s", "p", "o", ts(1))});

    store.close();
    store.close(); // idempotent

    auto added = store.add({makeAssertion("s", "p", "o2", ts(2))});
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ErrorCode::NotInitialized);

    auto queried = store.query(TripleQuery{});
    ASSERT_FALSE(queried.has_value());
    EXPECT_EQ(queried.error().code, ErrorCode::NotInitialized);

    auto counted = store.count();
    ASSERT_FALSE(counted.has_value());
    EXPECT_EQ(counted.error().code, ErrorCode::NotInitialized);
}

TYPED_TEST(TripleStoreContractTest, QueryDoesNotMutate) {
    auto& store = this->open(this->storyEmbedder());
    this->addStoryFacts();

    TripleQuery q;
    q.query_text = "ghost";
    auto first = this->query(q);
    auto second = this->query(q);
    EXPECT_EQ(first, second);
    EXPECT_EQ(store.count().value(), 3u);
    EXPECT_EQ(observedOf(this->query(TripleQuery{})),
              (std::vector<std::string>{ts(1), ts(2), ts(3)}));
}
