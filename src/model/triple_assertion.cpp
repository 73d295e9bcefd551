#include <spdlog/spdlog.h>
#include <factstore/core/timestamp.h>
#include <factstore/model/triple_assertion.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace factstore {

namespace {

std::string_view trimView(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

Result<std::optional<std::string>> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::ValidationError, std::string(key) + " must be a string"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

Result<PropertyMap> propertyMap(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return PropertyMap{};
    }
    if (!it->is_object()) {
        return Error{ErrorCode::ValidationError, std::string(key) + " must be a JSON object"};
    }
    PropertyMap out;
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        out.emplace(entry.key(), entry.value());
    }
    return out;
}

} // namespace

const char* scopeToString(Scope scope) {
    switch (scope) {
        case Scope::Run:
            return "run";
        case Scope::Session:
            return "session";
        case Scope::Global:
            return "global";
    }
    return "run";
}

std::optional<Scope> parseScope(std::string_view text) {
    auto canonical = canonicalizeTerm(text);
    if (canonical == "run")
        return Scope::Run;
    if (canonical == "session")
        return Scope::Session;
    if (canonical == "global")
        return Scope::Global;
    return std::nullopt;
}

std::string canonicalizeTerm(std::string_view term) {
    auto trimmed = trimView(term);
    std::string out;
    out.reserve(trimmed.size());
    // ASCII only, independent of the global locale; other bytes pass through
    for (char c : trimmed) {
        out.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
    }
    return out;
}

Result<TripleAssertion> TripleAssertion::create(TripleAssertionFields fields) {
    fields.subject = canonicalizeTerm(fields.subject);
    fields.predicate = canonicalizeTerm(fields.predicate);
    fields.object = canonicalizeTerm(fields.object);

    if (fields.subject.empty()) {
        return Error{ErrorCode::ValidationError, "TripleAssertion.subject must be non-empty"};
    }
    if (fields.predicate.empty()) {
        return Error{ErrorCode::ValidationError, "TripleAssertion.predicate must be non-empty"};
    }
    if (fields.object.empty()) {
        return Error{ErrorCode::ValidationError, "TripleAssertion.object must be non-empty"};
    }

    if (fields.confidence) {
        double c = *fields.confidence;
        if (std::isnan(c) || c < 0.0 || c > 1.0) {
            return Error{ErrorCode::ValidationError,
                         "TripleAssertion.confidence must be within [0,1]"};
        }
    }

    if (fields.owner_id) {
        std::string owner(trimView(*fields.owner_id));
        if (owner.empty()) {
            fields.owner_id.reset();
        } else {
            fields.owner_id = std::move(owner);
        }
    }

    fields.observed_at = std::string(trimView(fields.observed_at));
    if (fields.observed_at.empty()) {
        fields.observed_at = core::utcNow();
    }

    // Accepted as-is: an inverted window simply never matches active_at.
    if (fields.valid_from && fields.valid_until && *fields.valid_from > *fields.valid_until) {
        spdlog::debug("Assertion '{} {} {}' has valid_from {} after valid_until {}",
                      fields.subject, fields.predicate, fields.object, *fields.valid_from,
                      *fields.valid_until);
    }

    return TripleAssertion(std::move(fields));
}

Result<TripleAssertion> TripleAssertion::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "TripleAssertion JSON must be an object"};
    }

    TripleAssertionFields fields;
    const std::pair<const char*, std::string*> terms[] = {
        {"subject", &fields.subject}, {"predicate", &fields.predicate}, {"object", &fields.object}};
    for (const auto& [key, target] : terms) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return Error{ErrorCode::ValidationError,
                         std::string("TripleAssertion.") + key + " must be a string"};
        }
        *target = it->get<std::string>();
    }

    auto scopeText = optionalString(j, "scope");
    if (!scopeText)
        return scopeText.error();
    if (scopeText.value()) {
        auto scope = parseScope(*scopeText.value());
        if (!scope) {
            return Error{ErrorCode::ValidationError,
                         "Unknown scope '" + *scopeText.value() + "'"};
        }
        fields.scope = *scope;
    }

    auto owner = optionalString(j, "owner_id");
    if (!owner)
        return owner.error();
    fields.owner_id = owner.value();

    auto observed = optionalString(j, "observed_at");
    if (!observed)
        return observed.error();
    fields.observed_at = observed.value().value_or("");

    auto validFrom = optionalString(j, "valid_from");
    if (!validFrom)
        return validFrom.error();
    fields.valid_from = validFrom.value();

    auto validUntil = optionalString(j, "valid_until");
    if (!validUntil)
        return validUntil.error();
    fields.valid_until = validUntil.value();

    if (auto it = j.find("confidence"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) {
            return Error{ErrorCode::ValidationError, "confidence must be a number"};
        }
        fields.confidence = it->get<double>();
    }

    auto provenance = propertyMap(j, "provenance");
    if (!provenance)
        return provenance.error();
    fields.provenance = provenance.value();

    auto attributes = propertyMap(j, "attributes");
    if (!attributes)
        return attributes.error();
    fields.attributes = attributes.value();

    return create(std::move(fields));
}

nlohmann::json TripleAssertion::toJson() const {
    nlohmann::json j;
    j["subject"] = fields_.subject;
    j["predicate"] = fields_.predicate;
    j["object"] = fields_.object;
    j["scope"] = scopeToString(fields_.scope);
    if (fields_.owner_id)
        j["owner_id"] = *fields_.owner_id;
    j["observed_at"] = fields_.observed_at;
    if (fields_.valid_from)
        j["valid_from"] = *fields_.valid_from;
    if (fields_.valid_until)
        j["valid_until"] = *fields_.valid_until;
    if (fields_.confidence)
        j["confidence"] = *fields_.confidence;
    j["provenance"] = nlohmann::json(fields_.provenance);
    j["attributes"] = nlohmann::json(fields_.attributes);
    return j;
}

std::string TripleAssertion::canonicalText() const {
    return fields_.subject + " " + fields_.predicate + " " + fields_.object;
}

bool TripleAssertion::operator==(const TripleAssertion& other) const {
    const auto& a = fields_;
    const auto& b = other.fields_;
    return a.subject == b.subject && a.predicate == b.predicate && a.object == b.object &&
           a.scope == b.scope && a.owner_id == b.owner_id && a.observed_at == b.observed_at &&
           a.valid_from == b.valid_from && a.valid_until == b.valid_until &&
           a.confidence == b.confidence && a.provenance == b.provenance &&
           a.attributes == b.attributes;
}

} // namespace factstore
