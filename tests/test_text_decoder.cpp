#include <catch2/catch_test_macros.hpp>
#include "io/text_decoder.hpp"

using namespace piiguard;

static const std::vector<std::string> kDefaultEncodings = {"utf-8", "utf-8-sig", "latin-1", "cp1252"};

TEST_CASE("TextDecoder UTF-8 input", "[decoder]") {
    auto result = TextDecoder::decode("record_id,data_json\n1,{}\n", kDefaultEncodings);
    REQUIRE(result.is_ok());
    CHECK(result.value().encoding == "utf-8");
    CHECK(result.value().text == "record_id,data_json\n1,{}\n");
}

TEST_CASE("TextDecoder strips a BOM", "[decoder]") {
    const std::string bytes = "\xEF\xBB\xBFid,json\n";

    auto as_utf8 = TextDecoder::decode(bytes, {"utf-8"});
    REQUIRE(as_utf8.is_ok());
    CHECK(as_utf8.value().text == "id,json\n");

    auto as_sig = TextDecoder::decode(bytes, {"utf-8-sig"});
    REQUIRE(as_sig.is_ok());
    CHECK(as_sig.value().text == "id,json\n");
    CHECK(as_sig.value().encoding == "utf-8-sig");
}

TEST_CASE("TextDecoder falls back to Latin-1", "[decoder]") {
    // "Zürich" in Latin-1: 0xFC is not valid UTF-8 on its own
    const std::string bytes = "Z\xFCrich";
    auto result = TextDecoder::decode(bytes, kDefaultEncodings);
    REQUIRE(result.is_ok());
    CHECK(result.value().encoding == "latin-1");
    CHECK(result.value().text == "Z\xC3\xBCrich");
}

TEST_CASE("TextDecoder cp1252", "[decoder]") {
    SECTION("Euro sign and smart quotes") {
        auto text = TextDecoder::decode_as("\x80 \x93hi\x94", "cp1252");
        REQUIRE(text.has_value());
        CHECK(*text == "\xE2\x82\xAC \xE2\x80\x9Chi\xE2\x80\x9D");
    }

    SECTION("Undefined bytes fail") {
        CHECK_FALSE(TextDecoder::decode_as("a\x81z", "cp1252").has_value());
    }

    SECTION("Windows alias") {
        CHECK(TextDecoder::decode_as("abc", "Windows-1252").has_value());
    }
}

TEST_CASE("TextDecoder strict UTF-8 validation", "[decoder]") {
    CHECK(TextDecoder::is_valid_utf8("plain ascii"));
    CHECK(TextDecoder::is_valid_utf8("\xE2\x82\xAC"));            // U+20AC
    CHECK(TextDecoder::is_valid_utf8("\xF0\x9F\x98\x80"));        // U+1F600
    CHECK_FALSE(TextDecoder::is_valid_utf8("\xC0\xAF"));          // overlong '/'
    CHECK_FALSE(TextDecoder::is_valid_utf8("\xED\xA0\x80"));      // surrogate
    CHECK_FALSE(TextDecoder::is_valid_utf8("\xE2\x82"));          // truncated
    CHECK_FALSE(TextDecoder::is_valid_utf8("\xFF"));
}

TEST_CASE("TextDecoder errors", "[decoder]") {
    SECTION("All encodings rejected") {
        auto result = TextDecoder::decode("a\x81z", {"utf-8", "cp1252"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DECODE_ERROR);
    }

    SECTION("Unsupported encoding") {
        auto result = TextDecoder::decode("abc", {"ebcdic"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    }

    SECTION("Empty list") {
        auto result = TextDecoder::decode("abc", {});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    }
}

TEST_CASE("TextDecoder canonical names", "[decoder]") {
    CHECK(TextDecoder::canonical_name("UTF8") == "utf-8");
    CHECK(TextDecoder::canonical_name("utf_8_sig") == "utf-8-sig");
    CHECK(TextDecoder::canonical_name("ISO-8859-1") == "latin-1");
    CHECK_FALSE(TextDecoder::canonical_name("utf-16").has_value());
}
