#include <catch2/catch_test_macros.hpp>
#include "classifier/record_analyzer.hpp"

using namespace piiguard;

static std::string text_of(const Verdict& v, std::string_view key) {
    const auto* value = v.redacted.find(key);
    REQUIRE(value != nullptr);
    return value->text;
}

TEST_CASE("RecordAnalyzer reference records", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("Phone alone is PII") {
        auto v = analyzer.analyze({{"phone", "9876543210"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "phone") == "98XXXXXX10");
    }

    SECTION("Name plus email is PII") {
        auto v = analyzer.analyze({{"name", "Rahul Sharma"}, {"email", "rahul@x.com"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "name") == "RXXX SXXX");
        CHECK(text_of(v, "email") == "rahXXX@x.com");
        CHECK(v.categories.contains(Category::NAME));
        CHECK(v.categories.contains(Category::EMAIL));
    }

    SECTION("Email alone is not PII") {
        Record input{{"email", "rahul@x.com"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
        CHECK(v.redacted_fields.empty());
        CHECK(v.categories.empty());
    }

    SECTION("National ID alone is PII") {
        auto v = analyzer.analyze({{"aadhar", "234567890123"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "aadhar") == "XXXXXXXX0123");
    }

    SECTION("City alone is not PII") {
        Record input{{"city", "Mumbai"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Payment handle alone is PII") {
        auto v = analyzer.analyze({{"upi_id", "john.doe@okaxis"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "upi_id") == "johXXX@okaxis");
    }
}

TEST_CASE("RecordAnalyzer combinatorial rule", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("Two fields in the same category are still one category") {
        Record input{{"first_name", "rahul"}, {"last_name", "sharma"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Split name plus address") {
        auto v = analyzer.analyze({{"first_name", "rahul"}, {"city", "Mumbai"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "first_name") == "XXXX");
        CHECK(text_of(v, "city") == "[REDACTED_ADDRESS]");
        REQUIRE(v.redacted_fields.size() == 2);
        CHECK(v.redacted_fields[0].category == Category::NAME);
        CHECK(v.redacted_fields[1].category == Category::ADDRESS);
    }

    SECTION("Full name key suppresses the split name trigger") {
        Record input{{"name", "x"}, {"first_name", "rahul"}, {"city", "Pune"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Device and IP together") {
        auto v = analyzer.analyze({{"device_id", "D-1"}, {"ip_address", "10.0.0.1"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "device_id") == "[REDACTED_DEVICE_ID]");
        CHECK(text_of(v, "ip_address") == "[REDACTED_IP_ADDRESS]");
    }

    SECTION("Standalone does not lift a lone combinatorial field") {
        auto v = analyzer.analyze({{"phone", "9876543210"}, {"email", "rahul@x.com"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "phone") == "98XXXXXX10");
        CHECK(text_of(v, "email") == "rahul@x.com");
        REQUIRE(v.redacted_fields.size() == 1);
        CHECK(v.redacted_fields[0].key == "phone");
    }
}

TEST_CASE("RecordAnalyzer precedence within a field", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("Standalone mask wins over combinatorial") {
        auto v = analyzer.analyze({{"email", "alice@gmail.com"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "email") == "aliXXX@gmail.com");
        REQUIRE(v.redacted_fields.size() == 1);
        CHECK(v.redacted_fields[0].category == Category::PAYMENT_HANDLE);
    }

    SECTION("Standalone field still counts toward its buckets") {
        // alice@gmail.com fills the EMAIL bucket, name fills NAME
        auto v = analyzer.analyze({{"email", "alice@gmail.com"}, {"name", "Alice Brown"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "email") == "aliXXX@gmail.com");
        CHECK(text_of(v, "name") == "AXXX BXXX");
        CHECK(v.redacted_fields.size() == 2);
    }

    SECTION("Key rule category decides the mask") {
        // "Rahul Sharma" in the address field: ADDRESS by key, NAME by value
        auto v = analyzer.analyze({{"address", "Rahul Sharma"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "address") == "[REDACTED_ADDRESS]");
        REQUIRE(v.redacted_fields.size() == 1);
        CHECK(v.redacted_fields[0].category == Category::ADDRESS);
    }

    SECTION("Address with capitalized words is masked whole") {
        auto v = analyzer.analyze({{"address", "Flat 4, Brigade Road, Bangalore 560001"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "address") == "[REDACTED_ADDRESS]");
        CHECK(v.categories.contains(Category::NAME));
        CHECK(v.categories.contains(Category::ADDRESS));
    }

    SECTION("Value pattern decides the mask without a key rule") {
        auto v = analyzer.analyze({{"remarks", "Rahul Sharma"}, {"city", "Pune"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "remarks") == "RXXX SXXX");
        CHECK(text_of(v, "city") == "[REDACTED_ADDRESS]");
    }
}

TEST_CASE("RecordAnalyzer sibling name key is matched case-insensitively", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("Lowercase keys") {
        Record input{{"name", "rahul sharma"}, {"first_name", "rahul"}, {"city", "Mumbai"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Capitalized keys give the same verdict") {
        Record input{{"Name", "rahul sharma"}, {"First_Name", "rahul"}, {"City", "Mumbai"}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Padded key") {
        Record input{{" NAME ", "x"}, {"Last_Name", "sharma"}, {"city", "Pune"}};
        CHECK_FALSE(analyzer.analyze(input).has_pii);
    }

    SECTION("Without a name key the split name still counts") {
        auto v = analyzer.analyze({{"First_Name", "rahul"}, {"City", "Mumbai"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "First_Name") == "XXXX");
    }
}

TEST_CASE("RecordAnalyzer handles very long values", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("100 KB of letters") {
        Record input{{"notes", std::string(100000, 'a')}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("100 KB of digits") {
        Record input{{"notes", std::string(100000, '5')}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Long value under a phone key is still masked") {
        auto v = analyzer.analyze({{"phone", std::string(100000, '5')}});
        CHECK(v.has_pii);
        const auto masked = text_of(v, "phone");
        CHECK(masked.size() == 100000);
        CHECK(masked.starts_with("55X"));
        CHECK(masked.ends_with("X55"));
    }

    SECTION("Long run of names") {
        std::string remarks;
        for (int i = 0; i < 20000; ++i) {
            remarks += "Rahul ";
        }
        auto v = analyzer.analyze({{"remarks", remarks}, {"email", "rahul@x.com"}});
        CHECK(v.has_pii);
        CHECK(text_of(v, "remarks") == "RXXX RXXX");
        CHECK(text_of(v, "email") == "rahXXX@x.com");
    }
}

TEST_CASE("RecordAnalyzer preserves shape", "[analyzer]") {
    RecordAnalyzer analyzer;

    SECTION("Key order and key set") {
        Record input{{"zeta", "1"}, {"phone", "9876543210"}, {"alpha", "2"}};
        auto v = analyzer.analyze(input);
        CHECK(v.redacted.keys() == input.keys());
    }

    SECTION("Empty and null values pass through") {
        Record input{{"phone", ""}, {"aadhar", FieldValue::null()}, {"passport", "  "}};
        auto v = analyzer.analyze(input);
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted == input);
    }

    SECTION("Unredacted values keep their kind") {
        Record input{{"age", FieldValue(ValueKind::INTEGER, "42")},
                     {"active", FieldValue(ValueKind::BOOLEAN, "true")},
                     {"phone", FieldValue(ValueKind::INTEGER, "9876543210")}};
        auto v = analyzer.analyze(input);
        CHECK(v.redacted[0].value.kind == ValueKind::INTEGER);
        CHECK(v.redacted[1].value.kind == ValueKind::BOOLEAN);
        CHECK(v.redacted[2].value.kind == ValueKind::STRING);
        CHECK(v.redacted[2].value.text == "98XXXXXX10");
    }

    SECTION("Empty record") {
        auto v = analyzer.analyze(Record{});
        CHECK_FALSE(v.has_pii);
        CHECK(v.redacted.empty());
    }
}

TEST_CASE("RecordAnalyzer evidence collection", "[analyzer]") {
    RecordAnalyzer analyzer;

    auto evidence = analyzer.collect({{"email", "a.b@x.com"},
                                      {"note", "ok"},
                                      {"city", "Pune"},
                                      {"state", "MH"}});

    CHECK(evidence.fields.size() == 3);
    CHECK(evidence.buckets.keys(Category::EMAIL) == std::vector<std::string>{"email"});
    CHECK(evidence.buckets.keys(Category::ADDRESS) == std::vector<std::string>{"city", "state"});
    CHECK(evidence.buckets.non_empty_count() == 2);
    CHECK(evidence.combinatorial_disclosure());
    CHECK_FALSE(evidence.has_standalone());
}

TEST_CASE("CategoryBuckets ignores standalone categories and duplicates", "[analyzer]") {
    CategoryBuckets buckets;
    buckets.add(Category::PHONE, "phone");
    buckets.add(Category::EMAIL, "email");
    buckets.add(Category::EMAIL, "email");

    CHECK(buckets.keys(Category::PHONE).empty());
    CHECK(buckets.keys(Category::EMAIL).size() == 1);
    CHECK(buckets.contains(Category::EMAIL, "email"));
    CHECK(buckets.non_empty_count() == 1);
}
