#pragma once

#include "classifier/field_classifier.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Per-category accumulator of field keys for the combinatorial rule
 *
 * Only combinatorial categories have buckets; keys keep insertion order
 * and appear at most once per bucket.
 */
class CategoryBuckets {
public:
    void add(Category category, const std::string& key);

    [[nodiscard]] const std::vector<std::string>& keys(Category category) const;
    [[nodiscard]] bool contains(Category category, std::string_view key) const;

    // Number of combinatorial categories with at least one key
    [[nodiscard]] size_t non_empty_count() const;

private:
    std::array<std::vector<std::string>, kCategoryCount> buckets_;
};

/**
 * @brief Classification of one field within its record
 */
struct FieldEvidence {
    size_t index;                               // Position in the record
    CategorySet categories;
    std::optional<Category> standalone;         // First standalone match
    std::optional<Category> combinatorial;      // Key rule category, else first value match

    FieldEvidence() : index(0) {}
};

/**
 * @brief Everything the analyzer learned about a record before redaction
 */
struct RecordEvidence {
    std::vector<FieldEvidence> fields;          // Non-empty fields only
    CategoryBuckets buckets;
    CategorySet categories;                     // Union over all fields

    [[nodiscard]] bool has_standalone() const { return !categories.standalone().empty(); }
    [[nodiscard]] bool combinatorial_disclosure() const { return buckets.non_empty_count() >= 2; }
};

/**
 * @brief Record analyzer - applies the classifier to every field and
 * decides the record verdict
 *
 * A record contains PII when any field matches a standalone category, or
 * when two or more distinct combinatorial categories co-occur. Standalone
 * fields are always masked; combinatorial fields only when the record
 * crosses the co-occurrence threshold. Each field is masked at most once.
 *
 * Stateless across records and safe to share between threads.
 */
class RecordAnalyzer {
public:
    RecordAnalyzer() = default;

    /**
     * @brief Classify every field and accumulate buckets (no redaction)
     */
    [[nodiscard]] RecordEvidence collect(const Record& record) const;

    /**
     * @brief Full analysis: verdict plus redacted copy
     */
    [[nodiscard]] Verdict analyze(const Record& record) const;

    [[nodiscard]] const FieldClassifier& classifier() const { return classifier_; }

private:
    FieldClassifier classifier_;
};

} // namespace piiguard
