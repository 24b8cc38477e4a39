#include <catch2/catch_test_macros.hpp>
#include "driver/batch_driver.hpp"
#include "io/csv.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace piiguard;

namespace {

// Temp input/output pair, removed on scope exit
struct TempFiles {
    std::filesystem::path input;
    std::filesystem::path output;

    explicit TempFiles(const std::string& tag) {
        const auto dir = std::filesystem::temp_directory_path();
        input = dir / ("piiguard_driver_" + tag + "_in.csv");
        output = dir / ("piiguard_driver_" + tag + "_out.csv");
        std::filesystem::remove(output);
    }

    ~TempFiles() {
        std::error_code ec;
        std::filesystem::remove(input, ec);
        std::filesystem::remove(output, ec);
    }

    void write_input(const std::string& bytes) const {
        std::ofstream f(input, std::ios::binary);
        f << bytes;
    }

    [[nodiscard]] CsvTable read_output() const {
        std::ifstream f(output, std::ios::binary);
        std::stringstream ss;
        ss << f.rdbuf();
        auto parsed = CsvReader::parse(ss.str(), ',');
        REQUIRE(parsed.is_ok());
        return parsed.value();
    }
};

} // anonymous namespace

TEST_CASE("BatchDriver end-to-end", "[driver]") {
    TempFiles files("e2e");
    files.write_input(
        "record_id,data_json\n"
        "1,\"{\"\"phone\"\": \"\"9876543210\"\"}\"\n"
        "2,\"{\"\"name\"\": \"\"Rahul Sharma\"\", \"\"email\"\": \"\"rahul@x.com\"\"}\"\n"
        "3,\"{\"\"city\"\": \"\"Mumbai\"\"}\"\n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());

    const auto& summary = result.value();
    CHECK(summary.records == 3);
    CHECK(summary.records_with_pii == 2);
    CHECK(summary.encoding == "utf-8");
    CHECK(summary.delimiter == ",");
    CHECK(summary.redactions_by_category.at("phone") == 1);

    const auto out = files.read_output();
    CHECK(out.header == std::vector<std::string>{"record_id", "redacted_data_json", "is_pii"});
    REQUIRE(out.rows.size() == 3);
    CHECK(out.rows[0] == std::vector<std::string>{"1", R"({"phone":"98XXXXXX10"})", "true"});
    CHECK(out.rows[1] == std::vector<std::string>{
        "2", R"({"name":"RXXX SXXX","email":"rahXXX@x.com"})", "true"});
    CHECK(out.rows[2] == std::vector<std::string>{"3", R"({"city":"Mumbai"})", "false"});
}

TEST_CASE("BatchDriver semicolon file with BOM", "[driver]") {
    TempFiles files("semicolon");
    files.write_input(
        "\xEF\xBB\xBFrecord_id;Data_JSON\n"
        "10;\"{\"\"upi_id\"\": \"\"john.doe@okaxis\"\"}\"\n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());
    CHECK(result.value().delimiter == ";");

    const auto out = files.read_output();
    REQUIRE(out.rows.size() == 1);
    CHECK(out.rows[0][0] == "10");
    CHECK(out.rows[0][1] == R"({"upi_id":"johXXX@okaxis"})");
}

TEST_CASE("BatchDriver Latin-1 input", "[driver]") {
    TempFiles files("latin1");
    files.write_input(
        "record_id,data_json\n"
        "1,\"{\"\"city\"\": \"\"Z\xFCrich\"\"}\"\n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());
    CHECK(result.value().encoding == "latin-1");

    const auto out = files.read_output();
    REQUIRE(out.rows.size() == 1);
    CHECK(out.rows[0][1] == "{\"city\":\"Z\xC3\xBCrich\"}");
}

TEST_CASE("BatchDriver malformed and missing payloads", "[driver]") {
    TempFiles files("malformed");
    files.write_input(
        "record_id,data_json\n"
        "1,not json\n"
        "2,\n"
        "3,\"{\"\"nested\"\": {\"\"a\"\": 1}}\"\n"
        "4,\"{\"\"aadhar\"\": \"\"234567890123\"\"}\"\n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());

    const auto& summary = result.value();
    CHECK(summary.rows_read == 4);
    CHECK(summary.rows_skipped == 1);
    CHECK(summary.malformed_payloads == 2);
    CHECK(summary.records == 3);
    CHECK(summary.records_with_pii == 1);

    const auto out = files.read_output();
    REQUIRE(out.rows.size() == 3);
    CHECK(out.rows[0] == std::vector<std::string>{"1", "not json", "false"});
    CHECK(out.rows[1] == std::vector<std::string>{"3", R"({"nested": {"a": 1}})", "false"});
    CHECK(out.rows[2] == std::vector<std::string>{"4", R"({"aadhar":"XXXXXXXX0123"})", "true"});
}

TEST_CASE("BatchDriver row number as id", "[driver]") {
    TempFiles files("rownum");
    files.write_input(
        "payload_json\n"
        "\"{\"\"phone\"\": \"\"9876543210\"\"}\"\n"
        "\"{\"\"note\"\": \"\"hello\"\"}\"\n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());

    const auto out = files.read_output();
    REQUIRE(out.rows.size() == 2);
    CHECK(out.rows[0][0] == "1");
    CHECK(out.rows[1][0] == "2");
}

TEST_CASE("BatchDriver configured columns", "[driver]") {
    TempFiles files("columns");
    files.write_input(
        "id|payload\n"
        "a7|\"{\"\"passport\"\": \"\"A1234567\"\"}\"\n");

    PiiguardConfig config;
    config.input.delimiter = "|";
    config.input.id_column = "id";
    config.input.payload_column = "payload";

    BatchDriver driver(config);
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());

    const auto out = files.read_output();
    REQUIRE(out.rows.size() == 1);
    CHECK(out.rows[0] == std::vector<std::string>{"a7", R"({"passport":"[REDACTED_PASSPORT]"})", "true"});
}

TEST_CASE("BatchDriver errors", "[driver]") {
    BatchDriver driver(PiiguardConfig{});

    SECTION("Missing input file") {
        auto result = driver.run("/nonexistent/input.csv", "/tmp/unused.csv");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }

    SECTION("No payload column") {
        TempFiles files("nocol");
        files.write_input("record_id,data\n1,{}\n");
        auto result = driver.run(files.input.string(), files.output.string());
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::FORMAT_ERROR);
    }

    SECTION("Unwritable output") {
        TempFiles files("badout");
        files.write_input("record_id,data_json\n1,\"{\"\"phone\"\": \"\"9876543210\"\"}\"\n");
        auto result = driver.run(files.input.string(), "/nonexistent/dir/out.csv");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }
}

TEST_CASE("BatchDriver writes nothing when no record is processed", "[driver]") {
    TempFiles files("empty");
    files.write_input("record_id,data_json\n1,\n2,  \n");

    BatchDriver driver(PiiguardConfig{});
    auto result = driver.run(files.input.string(), files.output.string());
    REQUIRE(result.is_ok());
    CHECK(result.value().records == 0);
    CHECK(result.value().rows_skipped == 2);
    CHECK_FALSE(std::filesystem::exists(files.output));
}

TEST_CASE("BatchDriver payload column lookup", "[driver]") {
    CsvTable table;
    table.header = {"record_id", "Data_JSON", "other_json"};

    CHECK(BatchDriver::find_payload_column(table, "") == 1);
    CHECK(BatchDriver::find_payload_column(table, "other_json") == 2);
    CHECK_FALSE(BatchDriver::find_payload_column(table, "missing").has_value());
}
