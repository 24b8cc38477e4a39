#include "classifier/record_analyzer.hpp"
#include "core/redactor.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace piiguard {

// ============================================================================
// CategoryBuckets
// ============================================================================

void CategoryBuckets::add(Category category, const std::string& key) {
    if (is_standalone(category)) return;

    auto& bucket = buckets_[static_cast<size_t>(category)];
    if (std::find(bucket.begin(), bucket.end(), key) == bucket.end()) {
        bucket.push_back(key);
    }
}

const std::vector<std::string>& CategoryBuckets::keys(Category category) const {
    return buckets_[static_cast<size_t>(category)];
}

bool CategoryBuckets::contains(Category category, std::string_view key) const {
    const auto& bucket = keys(category);
    return std::find(bucket.begin(), bucket.end(), key) != bucket.end();
}

size_t CategoryBuckets::non_empty_count() const {
    return static_cast<size_t>(std::count_if(buckets_.begin(), buckets_.end(),
        [](const auto& bucket) { return !bucket.empty(); }));
}

// ============================================================================
// RecordAnalyzer
// ============================================================================

namespace {

// Semantic key match: case-insensitive, surrounding whitespace ignored
bool has_semantic_key(const Record& record, std::string_view key) {
    return std::any_of(record.begin(), record.end(), [&](const Field& field) {
        return utils::to_lower(utils::trim(field.key)) == key;
    });
}

} // anonymous namespace

RecordEvidence RecordAnalyzer::collect(const Record& record) const {
    RecordEvidence evidence;

    ClassifyContext context;
    context.record_has_name_key = has_semantic_key(record, "name");

    for (size_t i = 0; i < record.size(); ++i) {
        const auto& field = record[i];
        if (field.value.is_empty()) continue;

        const CategorySet categories =
            classifier_.classify(field.key, field.value.text, context);
        if (categories.empty()) continue;

        FieldEvidence fe;
        fe.index = i;
        fe.categories = categories;
        fe.standalone = categories.standalone().first();

        // A key rule category decides the mask over a value pattern
        const CategorySet by_key = classifier_.classify_by_key(field.key, context).combinatorial();
        fe.combinatorial = by_key.empty()
            ? categories.combinatorial().first()
            : by_key.first();

        for (const auto c : categories.combinatorial().to_vector()) {
            evidence.buckets.add(c, field.key);
        }
        evidence.categories |= categories;
        evidence.fields.push_back(std::move(fe));
    }

    return evidence;
}

Verdict RecordAnalyzer::analyze(const Record& record) const {
    Verdict verdict;
    verdict.redacted = record;

    const RecordEvidence evidence = collect(record);
    const bool disclosure = evidence.combinatorial_disclosure();

    // Fields are visited in record order, so redacted_fields stays ordered
    for (const auto& fe : evidence.fields) {
        std::optional<Category> mask_with;
        if (fe.standalone) {
            mask_with = fe.standalone;
        } else if (disclosure && fe.combinatorial) {
            mask_with = fe.combinatorial;
        }
        if (!mask_with) continue;

        auto& field = verdict.redacted[fe.index];
        field.value = FieldValue(Redactor::mask(field.value.text, *mask_with));
        verdict.redacted_fields.emplace_back(field.key, *mask_with);
    }

    verdict.has_pii = evidence.has_standalone() || disclosure;
    // A lone combinatorial category is not reported
    verdict.categories = verdict.has_pii ? evidence.categories : CategorySet{};

    return verdict;
}

} // namespace piiguard
