// CSV / JSON data loading tests

#include "intentnn/data_io.h"
#include "intentnn/errors.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

std::string writeFile(const std::string& dir, const std::string& name, const std::string& content) {
    std::string path = (fs::path(dir) / name).string();
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

// Test 1: quoted fields, escaped quotes and embedded commas
bool test_parse_csv_line() {
    std::vector<std::string> fields = parseCsvLine("\"book room b, please\",meeting_room_booking,\"say \"\"hi\"\"\"");
    std::vector<std::string> expected = {"book room b, please", "meeting_room_booking", "say \"hi\""};
    if (fields != expected) {
        std::cerr << "parse_csv_line: got " << fields.size() << " fields" << std::endl;
        return false;
    }
    if (parseCsvLine(csvEscape("a \"quoted\", text")).front() != "a \"quoted\", text") {
        std::cerr << "parse_csv_line: escape does not parse back" << std::endl;
        return false;
    }

    bool threw = false;
    try {
        parseCsvLine("\"never closed,label");
    } catch (const EncodingError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "parse_csv_line: unterminated quote accepted" << std::endl;
        return false;
    }

    std::cout << "test_parse_csv_line: PASSED" << std::endl;
    return true;
}

// Test 2: CSV file with column lookup by header and multi-line records
bool test_load_csv() {
    std::string dir = makeTempDir("csv");
    std::string path = writeFile(dir, "train.csv",
        "id,label,text\r\n"
        "1,salary_inquiry,what is my salary\r\n"
        "2,leave_request,\"I need leave,\nstarting monday\"\n"
        "\n"
        "3, company_info ,tell me about the company\n");
    LabeledData data = loadLabeledData(path);
    fs::remove_all(dir);

    if (data.size() != 3 || data.labels.size() != 3) {
        std::cerr << "load_csv: expected 3 rows, got " << data.size() << std::endl;
        return false;
    }
    if (data.texts[1] != "I need leave,\nstarting monday" || data.labels[2] != "company_info") {
        std::cerr << "load_csv: field values wrong" << std::endl;
        return false;
    }

    std::cout << "test_load_csv: PASSED" << std::endl;
    return true;
}

// Test 3: CSV without the required columns
bool test_csv_missing_columns() {
    std::string dir = makeTempDir("csv_bad");
    std::string no_label = writeFile(dir, "a.csv", "text,category\nhello,x\n");
    std::string short_row = writeFile(dir, "b.csv", "text,intent\nhello\n");

    bool ok = true;
    for (const auto& path : {no_label, short_row}) {
        bool threw = false;
        try {
            loadLabeledCsv(path);
        } catch (const EncodingError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "csv_missing_columns: accepted " << path << std::endl;
            ok = false;
        }
    }
    fs::remove_all(dir);
    if (!ok) return false;

    std::cout << "test_csv_missing_columns: PASSED" << std::endl;
    return true;
}

// Test 4: both JSON layouts
bool test_load_json() {
    std::string dir = makeTempDir("json");
    std::string columns = writeFile(dir, "columns.json",
        R"({"texts": ["a", "b"], "labels": ["company_info", "employee_info"]})");
    std::string records = writeFile(dir, "records.json",
        R"([{"text": "a", "intent": "company_info"}, {"text": "b", "label": "employee_info"}])");
    std::string ragged = writeFile(dir, "ragged.json", R"({"texts": ["a"], "labels": []})");

    LabeledData from_columns = loadLabeledData(columns);
    LabeledData from_records = loadLabeledData(records);

    bool threw = false;
    try {
        loadLabeledJson(ragged);
    } catch (const EncodingError&) {
        threw = true;
    }
    fs::remove_all(dir);

    if (from_columns.texts != from_records.texts || from_columns.labels != from_records.labels
        || from_records.labels[1] != "employee_info") {
        std::cerr << "load_json: layouts disagree" << std::endl;
        return false;
    }
    if (!threw) {
        std::cerr << "load_json: ragged arrays accepted" << std::endl;
        return false;
    }

    std::cout << "test_load_json: PASSED" << std::endl;
    return true;
}

// Test 5: text lines and missing files
bool test_text_lines_and_missing_file() {
    std::string dir = makeTempDir("lines");
    std::string path = writeFile(dir, "input.txt", "  book a room \n\nwho is my manager\n");
    std::vector<std::string> lines = loadTextLines(path);

    if (lines != std::vector<std::string>{"book a room", "who is my manager"}) {
        std::cerr << "text_lines: unexpected lines" << std::endl;
        fs::remove_all(dir);
        return false;
    }

    bool threw = false;
    try {
        loadLabeledData((fs::path(dir) / "absent.csv").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        fs::remove_all(dir);
        std::cerr << "text_lines: missing file accepted" << std::endl;
        return false;
    }

    // A file of blank lines has nothing to predict
    std::string blank = writeFile(dir, "blank.txt", "\n   \n\t\n");
    threw = false;
    try {
        loadTextLines(blank);
    } catch (const EncodingError&) {
        threw = true;
    }
    fs::remove_all(dir);
    if (!threw) {
        std::cerr << "text_lines: blank input file accepted" << std::endl;
        return false;
    }

    std::cout << "test_text_lines_and_missing_file: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Data IO Tests ===" << std::endl;

    int failures = 0;

    if (!test_parse_csv_line()) ++failures;
    if (!test_load_csv()) ++failures;
    if (!test_csv_missing_columns()) ++failures;
    if (!test_load_json()) ++failures;
    if (!test_text_lines_and_missing_file()) ++failures;

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All Data IO tests passed (5/5) ===" << std::endl;
    return 0;
}
