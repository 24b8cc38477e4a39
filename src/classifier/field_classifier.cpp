#include "classifier/field_classifier.hpp"
#include "core/utils.hpp"

namespace piiguard {

FieldClassifier::FieldClassifier() : patterns_(PiiPatterns::instance()) {
    // Standalone key overrides
    key_rules_["phone"] = Category::PHONE;
    key_rules_["contact"] = Category::PHONE;
    key_rules_["aadhar"] = Category::NATIONAL_ID;
    key_rules_["passport"] = Category::PASSPORT;
    key_rules_["upi_id"] = Category::PAYMENT_HANDLE;

    // Combinatorial keys
    key_rules_["email"] = Category::EMAIL;
    key_rules_["address"] = Category::ADDRESS;
    key_rules_["city"] = Category::ADDRESS;
    key_rules_["pin_code"] = Category::ADDRESS;
    key_rules_["state"] = Category::ADDRESS;
    key_rules_["device_id"] = Category::DEVICE_ID;
    key_rules_["ip_address"] = Category::IP_ADDRESS;
}

CategorySet FieldClassifier::classify_by_key(
    std::string_view key,
    const ClassifyContext& context) const {

    CategorySet result;
    const std::string lower = utils::to_lower(utils::trim(key));

    const auto it = key_rules_.find(lower);
    if (it != key_rules_.end()) {
        result.insert(it->second);
    }

    // Split name fields identify a person unless a full name sits beside them
    if ((lower == "first_name" || lower == "last_name") && !context.record_has_name_key) {
        result.insert(Category::NAME);
    }

    return result;
}

std::optional<Span> FieldClassifier::match_value(
    Category category,
    std::string_view trimmed_value) const {

    switch (category) {
        case Category::PHONE: {
            if (auto span = patterns_.find_phone(trimmed_value)) {
                return span;
            }
            const auto runs = patterns_.find_phone_digit_runs(trimmed_value);
            if (!runs.empty()) return runs.front();
            return std::nullopt;
        }

        case Category::NATIONAL_ID: {
            const auto spans = patterns_.find_national_ids(trimmed_value);
            if (!spans.empty()) return spans.front();
            return std::nullopt;
        }

        case Category::PASSPORT:
            return PiiPatterns::find_first(patterns_.passport, trimmed_value);

        case Category::PAYMENT_HANDLE:
            return PiiPatterns::find_first(patterns_.payment_handle, trimmed_value);

        case Category::EMAIL:
            return PiiPatterns::find_first(patterns_.email, trimmed_value);

        case Category::NAME: {
            const auto runs = patterns_.find_name_runs(trimmed_value);
            if (!runs.empty()) return runs.front();
            return std::nullopt;
        }

        // Key-only categories
        case Category::ADDRESS:
        case Category::DEVICE_ID:
        case Category::IP_ADDRESS:
            return std::nullopt;
    }
    return std::nullopt;
}

std::vector<Detection> FieldClassifier::detect(
    std::string_view key,
    std::string_view value,
    const ClassifyContext& context) const {

    std::vector<Detection> detections;

    const std::string trimmed = utils::trim(value);
    if (trimmed.empty()) {
        return detections;
    }

    const CategorySet by_key = classify_by_key(key, context);

    for (const auto category : kAllCategories) {
        if (auto span = match_value(category, trimmed)) {
            detections.emplace_back(category, MatchSource::VALUE, span);
        } else if (by_key.contains(category)) {
            detections.emplace_back(category, MatchSource::KEY);
        }
    }

    return detections;
}

CategorySet FieldClassifier::classify(
    std::string_view key,
    std::string_view value,
    const ClassifyContext& context) const {

    CategorySet result;
    for (const auto& d : detect(key, value, context)) {
        result.insert(d.category);
    }
    return result;
}

} // namespace piiguard
