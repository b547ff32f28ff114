#include "intentnn/data_io.h"
#include "intentnn/errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <filesystem>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::ifstream openForReading(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open data file: " + path);
    }
    return file;
}

// Read one logical CSV record; quoted fields may span lines
bool readCsvRecord(std::istream& in, std::string& record) {
    record.clear();
    std::string line;
    bool in_quotes = false;
    bool got_any = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (got_any) record += '\n';
        record += line;
        got_any = true;
        for (char c : line) {
            if (c == '"') in_quotes = !in_quotes;
        }
        if (!in_quotes) break;
    }
    return got_any;
}

} // namespace

std::vector<std::string> parseCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    if (in_quotes) {
        throw EncodingError("Unterminated quoted CSV field");
    }
    fields.push_back(field);
    return fields;
}

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

LabeledData loadLabeledCsv(const std::string& path) {
    std::ifstream file = openForReading(path);

    std::string record;
    if (!readCsvRecord(file, record)) {
        throw EncodingError("CSV file is empty: " + path);
    }
    std::vector<std::string> header = parseCsvLine(record);
    for (auto& name : header) name = trim(name);

    auto text_it = std::find(header.begin(), header.end(), "text");
    auto label_it = std::find(header.begin(), header.end(), "label");
    if (label_it == header.end()) {
        label_it = std::find(header.begin(), header.end(), "intent");
    }
    if (text_it == header.end() || label_it == header.end()) {
        throw EncodingError("CSV header must contain 'text' and 'label' columns: " + path);
    }
    size_t text_col = static_cast<size_t>(text_it - header.begin());
    size_t label_col = static_cast<size_t>(label_it - header.begin());

    LabeledData data;
    size_t row = 1;
    while (readCsvRecord(file, record)) {
        ++row;
        if (trim(record).empty()) continue;
        std::vector<std::string> fields = parseCsvLine(record);
        if (fields.size() <= std::max(text_col, label_col)) {
            throw EncodingError("Row " + std::to_string(row) + " of " + path + " has too few columns");
        }
        data.texts.push_back(fields[text_col]);
        data.labels.push_back(trim(fields[label_col]));
    }
    return data;
}

LabeledData loadLabeledJson(const std::string& path) {
    std::ifstream file = openForReading(path);

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw EncodingError("Cannot parse " + path + ": " + e.what());
    }

    LabeledData data;
    try {
        if (j.is_object() && j.contains("texts") && j.contains("labels")) {
            data.texts = j["texts"].get<std::vector<std::string>>();
            data.labels = j["labels"].get<std::vector<std::string>>();
            if (data.texts.size() != data.labels.size()) {
                throw EncodingError(path + ": 'texts' and 'labels' differ in length");
            }
        } else if (j.is_array()) {
            for (const auto& item : j) {
                const char* label_key = item.contains("intent") ? "intent" : "label";
                if (!item.contains("text") || !item.contains(label_key)) {
                    throw EncodingError(path + ": every item needs 'text' and 'intent'");
                }
                data.texts.push_back(item["text"].get<std::string>());
                data.labels.push_back(item[label_key].get<std::string>());
            }
        } else {
            throw EncodingError(path + ": expected {\"texts\", \"labels\"} or an array of examples");
        }
    } catch (const json::type_error& e) {
        throw EncodingError("Malformed data in " + path + ": " + e.what());
    }
    return data;
}

LabeledData loadLabeledData(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadLabeledJson(path);
    }
    return loadLabeledCsv(path);
}

std::vector<std::string> loadTextLines(const std::string& path) {
    std::ifstream file = openForReading(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        std::string text = trim(line);
        if (!text.empty()) {
            lines.push_back(text);
        }
    }
    if (lines.empty()) {
        throw EncodingError("No texts found in " + path);
    }
    return lines;
}
