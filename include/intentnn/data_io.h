#ifndef INTENTNN_DATA_IO_H
#define INTENTNN_DATA_IO_H

#include <string>
#include <vector>

/**
 * @brief Parallel text / intent lists as read from a data file
 */
struct LabeledData {
    std::vector<std::string> texts;
    std::vector<std::string> labels;

    size_t size() const { return texts.size(); }
};

// ===== CSV helpers =====

/**
 * @brief Split one CSV record, honoring double-quoted fields and "" escapes
 * @throws EncodingError on an unterminated quote
 */
std::vector<std::string> parseCsvLine(const std::string& line);

/**
 * @brief Quote a field when it contains a comma, quote or newline
 */
std::string csvEscape(const std::string& field);

// ===== Loaders =====

/**
 * @brief CSV file with a header containing "text" and "label" columns
 * @throws std::runtime_error if the file cannot be opened
 * @throws EncodingError on missing columns or short rows
 */
LabeledData loadLabeledCsv(const std::string& path);

/**
 * @brief JSON file, either {"texts": [...], "labels": [...]} or an array of
 * {"text": ..., "intent"|"label": ...} objects
 * @throws std::runtime_error if the file cannot be opened
 * @throws EncodingError on malformed content
 */
LabeledData loadLabeledJson(const std::string& path);

/**
 * @brief Dispatch on extension: .json, otherwise CSV
 */
LabeledData loadLabeledData(const std::string& path);

/**
 * @brief Non-empty, trimmed lines of a plain text file
 * @throws std::runtime_error if the file cannot be opened
 * @throws EncodingError if the file holds no text at all
 */
std::vector<std::string> loadTextLines(const std::string& path);

#endif // INTENTNN_DATA_IO_H
