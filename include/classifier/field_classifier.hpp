#pragma once

#include "core/pii_patterns.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piiguard {

/**
 * @brief Record-level facts a single field's classification depends on
 */
struct ClassifyContext {
    bool record_has_name_key = false;   // Suppresses first_name/last_name trigger
};

/**
 * @brief Field classifier - decides which PII categories one field belongs to
 *
 * Two independent predicate sets per field, unioned:
 * 1. Key rules (case-insensitive exact key match, no value inspection)
 * 2. Value patterns (regex search within the trimmed value)
 *
 * Empty and null values never match anything, key rules included.
 * Pure: the result depends only on (key, value, context).
 */
class FieldClassifier {
public:
    FieldClassifier();

    /**
     * @brief Classify a field, one Detection per matched category
     * @return Detections in detector order
     */
    [[nodiscard]] std::vector<Detection> detect(
        std::string_view key,
        std::string_view value,
        const ClassifyContext& context = {}) const;

    /**
     * @brief Classify a field into the set of matched categories
     */
    [[nodiscard]] CategorySet classify(
        std::string_view key,
        std::string_view value,
        const ClassifyContext& context = {}) const;

    /**
     * @brief Key rules only (Strategy 1)
     */
    [[nodiscard]] CategorySet classify_by_key(
        std::string_view key,
        const ClassifyContext& context = {}) const;

    /**
     * @brief Value pattern for one category (Strategy 2)
     * @param trimmed_value Value with surrounding whitespace removed
     * @return First matching span; nullopt for key-only categories
     */
    [[nodiscard]] std::optional<Span> match_value(
        Category category,
        std::string_view trimmed_value) const;

private:
    // Lowercased key -> category it forces
    std::unordered_map<std::string, Category> key_rules_;

    const PiiPatterns& patterns_;
};

} // namespace piiguard
