#pragma once

#include <factstore/core/types.h>

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace factstore {

/**
 * Opaque string-keyed metadata. Stores persist and return these values but
 * never look inside them.
 */
using PropertyMap = std::map<std::string, nlohmann::json>;

/**
 * Partition key limiting the visibility of an assertion.
 */
enum class Scope { Run, Session, Global };

const char* scopeToString(Scope scope);
std::optional<Scope> parseScope(std::string_view text);

/**
 * Trim surrounding whitespace and lowercase (ASCII). Idempotent.
 */
std::string canonicalizeTerm(std::string_view term);

/**
 * Caller-supplied input for TripleAssertion::create().
 */
struct TripleAssertionFields {
    std::string subject;
    std::string predicate;
    std::string object;
    Scope scope = Scope::Run;
    std::optional<std::string> owner_id; // Finer partition within scope (e.g. a session id)
    std::string observed_at;             // Append time; empty means "now" (UTC)
    std::optional<std::string> valid_from;
    std::optional<std::string> valid_until; // Exclusive upper bound of the validity window
    std::optional<double> confidence;       // [0,1]
    PropertyMap provenance;
    PropertyMap attributes;
};

/**
 * One append-only fact: a canonicalized subject-predicate-object triple plus
 * temporal, partition and provenance metadata.
 *
 * Instances are immutable. A correction is a new assertion with a later
 * observed_at, never an edit of an existing one.
 */
class TripleAssertion {
public:
    /**
     * Validate and canonicalize @p fields.
     *
     * Fails with ErrorCode::ValidationError when subject, predicate or object
     * is empty after trimming, or when confidence is outside [0,1].
     */
    static Result<TripleAssertion> create(TripleAssertionFields fields);

    /**
     * Build from the JSON object produced by toJson(). Applies the same
     * validation as create(); an unknown scope string is rejected.
     */
    static Result<TripleAssertion> fromJson(const nlohmann::json& j);

    /**
     * Compact JSON form. Absent optional fields are omitted.
     */
    nlohmann::json toJson() const;

    const std::string& subject() const { return fields_.subject; }
    const std::string& predicate() const { return fields_.predicate; }
    const std::string& object() const { return fields_.object; }
    Scope scope() const { return fields_.scope; }
    const std::optional<std::string>& ownerId() const { return fields_.owner_id; }
    const std::string& observedAt() const { return fields_.observed_at; }
    const std::optional<std::string>& validFrom() const { return fields_.valid_from; }
    const std::optional<std::string>& validUntil() const { return fields_.valid_until; }
    const std::optional<double>& confidence() const { return fields_.confidence; }
    const PropertyMap& provenance() const { return fields_.provenance; }
    const PropertyMap& attributes() const { return fields_.attributes; }

    /**
     * "subject predicate object"; the text embedded for semantic search.
     */
    std::string canonicalText() const;

    /**
     * Copy of the underlying fields, e.g. as a template for a correction.
     */
    const TripleAssertionFields& fields() const { return fields_; }

    bool operator==(const TripleAssertion& other) const;
    bool operator!=(const TripleAssertion& other) const { return !(*this == other); }

private:
    explicit TripleAssertion(TripleAssertionFields fields) : fields_(std::move(fields)) {}

    TripleAssertionFields fields_;
};

} // namespace factstore
