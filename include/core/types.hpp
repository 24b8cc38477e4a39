#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace piiguard {

// ============================================================================
// PII Categories
// ============================================================================

// Enumeration order is detector order. Redaction precedence and
// CategorySet iteration both rely on it.
enum class Category : uint8_t {
    PHONE,
    NATIONAL_ID,
    PASSPORT,
    PAYMENT_HANDLE,
    EMAIL,
    NAME,
    ADDRESS,
    DEVICE_ID,
    IP_ADDRESS
};

inline constexpr size_t kCategoryCount = 9;

inline constexpr Category kAllCategories[kCategoryCount] = {
    Category::PHONE, Category::NATIONAL_ID, Category::PASSPORT,
    Category::PAYMENT_HANDLE, Category::EMAIL, Category::NAME,
    Category::ADDRESS, Category::DEVICE_ID, Category::IP_ADDRESS
};

// Category membership as bitmasks: one bit per Category, class checks are
// a single AND.
namespace category_mask {
    inline constexpr uint16_t bit(Category c) noexcept {
        return static_cast<uint16_t>(1u << static_cast<int>(c));
    }
    inline constexpr uint16_t kStandalone =
        bit(Category::PHONE) | bit(Category::NATIONAL_ID) |
        bit(Category::PASSPORT) | bit(Category::PAYMENT_HANDLE);
    inline constexpr uint16_t kCombinatorial =
        bit(Category::EMAIL) | bit(Category::NAME) | bit(Category::ADDRESS) |
        bit(Category::DEVICE_ID) | bit(Category::IP_ADDRESS);
    [[nodiscard]] inline constexpr bool test(Category c, uint16_t mask) noexcept {
        return (mask & bit(c)) != 0;
    }
}

[[nodiscard]] inline constexpr bool is_standalone(Category c) noexcept {
    return category_mask::test(c, category_mask::kStandalone);
}

[[nodiscard]] inline constexpr std::string_view category_name(Category c) noexcept {
    switch (c) {
        case Category::PHONE: return "phone";
        case Category::NATIONAL_ID: return "national_id";
        case Category::PASSPORT: return "passport";
        case Category::PAYMENT_HANDLE: return "payment_handle";
        case Category::EMAIL: return "email";
        case Category::NAME: return "name";
        case Category::ADDRESS: return "address";
        case Category::DEVICE_ID: return "device_id";
        case Category::IP_ADDRESS: return "ip_address";
    }
    return "unknown";
}

/**
 * @brief Small value-type set of categories
 *
 * Iterates in detector order, so first() is the highest-precedence match.
 */
class CategorySet {
public:
    constexpr CategorySet() = default;
    constexpr explicit CategorySet(uint16_t bits) : bits_(bits) {}

    constexpr void insert(Category c) noexcept { bits_ |= category_mask::bit(c); }
    [[nodiscard]] constexpr bool contains(Category c) const noexcept {
        return category_mask::test(c, bits_);
    }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr uint16_t bits() const noexcept { return bits_; }

    [[nodiscard]] constexpr size_t size() const noexcept {
        size_t n = 0;
        for (uint16_t b = bits_; b != 0; b &= static_cast<uint16_t>(b - 1)) ++n;
        return n;
    }

    [[nodiscard]] constexpr CategorySet standalone() const noexcept {
        return CategorySet(static_cast<uint16_t>(bits_ & category_mask::kStandalone));
    }
    [[nodiscard]] constexpr CategorySet combinatorial() const noexcept {
        return CategorySet(static_cast<uint16_t>(bits_ & category_mask::kCombinatorial));
    }

    // Lowest-ordered member, if any
    [[nodiscard]] constexpr std::optional<Category> first() const noexcept {
        for (const auto c : kAllCategories) {
            if (contains(c)) return c;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::vector<Category> to_vector() const {
        std::vector<Category> out;
        for (const auto c : kAllCategories) {
            if (contains(c)) out.push_back(c);
        }
        return out;
    }

    constexpr CategorySet& operator|=(CategorySet other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }
    [[nodiscard]] constexpr bool operator==(const CategorySet& other) const noexcept = default;

private:
    uint16_t bits_ = 0;
};

// ============================================================================
// Record Model
// ============================================================================

enum class ValueKind {
    NULL_VALUE,
    STRING,
    INTEGER,
    FLOAT,
    BOOLEAN
};

/**
 * @brief Scalar field value: its kind plus its canonical text
 *
 * Numbers and booleans carry the text their source wrote, so a value that
 * is not redacted can be written back unchanged.
 */
struct FieldValue {
    ValueKind kind;
    std::string text;

    FieldValue() : kind(ValueKind::NULL_VALUE) {}
    FieldValue(ValueKind k, std::string t) : kind(k), text(std::move(t)) {}
    FieldValue(std::string t) : kind(ValueKind::STRING), text(std::move(t)) {}
    FieldValue(const char* t) : kind(ValueKind::STRING), text(t) {}

    static FieldValue null() { return {}; }

    [[nodiscard]] bool is_null() const { return kind == ValueKind::NULL_VALUE; }

    // Null, or nothing but whitespace
    [[nodiscard]] bool is_empty() const {
        if (is_null()) return true;
        return text.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
    }

    [[nodiscard]] bool operator==(const FieldValue& other) const = default;
};

struct Field {
    std::string key;
    FieldValue value;

    Field() = default;
    Field(std::string k, FieldValue v) : key(std::move(k)), value(std::move(v)) {}

    [[nodiscard]] bool operator==(const Field& other) const = default;
};

/**
 * @brief Ordered key/value record
 *
 * Keys are unique and case-sensitive; set() on an existing key replaces
 * the value in place so insertion order never changes.
 */
class Record {
public:
    using const_iterator = std::vector<Field>::const_iterator;

    Record() = default;
    Record(std::initializer_list<Field> fields) {
        for (const auto& f : fields) set(f.key, f.value);
    }

    void set(std::string key, FieldValue value) {
        for (auto& f : fields_) {
            if (f.key == key) {
                f.value = std::move(value);
                return;
            }
        }
        fields_.emplace_back(std::move(key), std::move(value));
    }

    [[nodiscard]] const FieldValue* find(std::string_view key) const {
        for (const auto& f : fields_) {
            if (f.key == key) return &f.value;
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(fields_.size());
        for (const auto& f : fields_) out.push_back(f.key);
        return out;
    }

    [[nodiscard]] size_t size() const { return fields_.size(); }
    [[nodiscard]] bool empty() const { return fields_.empty(); }
    [[nodiscard]] const Field& operator[](size_t idx) const { return fields_[idx]; }
    [[nodiscard]] Field& operator[](size_t idx) { return fields_[idx]; }

    [[nodiscard]] const_iterator begin() const { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const { return fields_.end(); }

    [[nodiscard]] bool operator==(const Record& other) const = default;

private:
    std::vector<Field> fields_;
};

// ============================================================================
// Classification Types
// ============================================================================

enum class MatchSource {
    KEY,        // Field key alone triggered the category
    VALUE       // Value pattern matched (key may also have matched)
};

struct Span {
    size_t offset;
    size_t length;

    Span() : offset(0), length(0) {}
    Span(size_t o, size_t l) : offset(o), length(l) {}

    [[nodiscard]] bool operator==(const Span& other) const = default;
};

struct Detection {
    Category category;
    MatchSource source;
    std::optional<Span> span;   // First match in the trimmed value (VALUE only)

    Detection() : category(Category::PHONE), source(MatchSource::KEY) {}
    Detection(Category c, MatchSource s, std::optional<Span> sp = std::nullopt)
        : category(c), source(s), span(sp) {}
};

struct RedactedField {
    std::string key;
    Category category;          // Mask applied

    RedactedField() : category(Category::PHONE) {}
    RedactedField(std::string k, Category c) : key(std::move(k)), category(c) {}
};

/**
 * @brief Outcome of analysing one record
 */
struct Verdict {
    bool has_pii;
    Record redacted;
    std::vector<RedactedField> redacted_fields;   // In record order
    CategorySet categories;                       // Every category that fired

    Verdict() : has_pii(false) {}
};

// ============================================================================
// Batch Types
// ============================================================================

struct BatchStats {
    uint64_t records = 0;
    uint64_t records_with_pii = 0;
    uint64_t fields_redacted = 0;
    uint64_t category_counts[kCategoryCount] = {};  // Redacted fields per mask category
    std::chrono::microseconds elapsed{0};

    void add(const Verdict& verdict) {
        ++records;
        if (verdict.has_pii) ++records_with_pii;
        fields_redacted += verdict.redacted_fields.size();
        for (const auto& f : verdict.redacted_fields) {
            ++category_counts[static_cast<size_t>(f.category)];
        }
    }

    [[nodiscard]] uint64_t count(Category c) const {
        return category_counts[static_cast<size_t>(c)];
    }

    [[nodiscard]] double pii_percentage() const {
        return records > 0
            ? static_cast<double>(records_with_pii) / static_cast<double>(records) * 100.0
            : 0.0;
    }
};

} // namespace piiguard
