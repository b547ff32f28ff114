#include "intentnn/tokenizer.h"
#include "intentnn/errors.h"
#include <sentencepiece_processor.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// Pad with pad_id up to max_length and build the matching mask
EncodedText padToLength(std::vector<int> ids, size_t max_length, int pad_id) {
    EncodedText encoded;
    encoded.attention_mask.assign(max_length, 0);
    std::fill(encoded.attention_mask.begin(), encoded.attention_mask.begin() + ids.size(), 1);
    ids.resize(max_length, pad_id);
    encoded.token_ids = std::move(ids);
    return encoded;
}

} // namespace

std::vector<EncodedText> TextTokenizer::encodeBatch(const std::vector<std::string>& texts,
                                                    size_t max_length) const {
    std::vector<EncodedText> batch;
    batch.reserve(texts.size());
    for (const auto& text : texts) {
        batch.push_back(encode(text, max_length));
    }
    return batch;
}

// ============ WordTokenizer ============

WordTokenizer::WordTokenizer() {
    addSpecialTokens();
}

void WordTokenizer::addSpecialTokens() {
    vocab.clear();
    inv_vocab = {"<pad>", "<unk>", "<cls>", "<sep>"};
    for (size_t i = 0; i < inv_vocab.size(); ++i) {
        vocab[inv_vocab[i]] = static_cast<int>(i);
    }
}

std::vector<std::string> WordTokenizer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    for (unsigned char c : text) {
        if (std::isspace(c)) {
            flush();
        } else if (std::ispunct(c) && c != '\'' && c != '_') {
            flush();
            tokens.emplace_back(1, static_cast<char>(c));
        } else {
            current += static_cast<char>(std::tolower(c));
        }
    }
    flush();

    return tokens;
}

WordTokenizer WordTokenizer::build(const std::vector<std::string>& texts, size_t min_frequency) {
    std::map<std::string, size_t> freq;
    for (const auto& text : texts) {
        for (const auto& token : tokenize(text)) {
            freq[token]++;
        }
    }

    // Sort by frequency; std::map order breaks ties alphabetically
    std::vector<std::pair<std::string, size_t>> sorted_freq(freq.begin(), freq.end());
    std::stable_sort(sorted_freq.begin(), sorted_freq.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    WordTokenizer tokenizer;
    for (const auto& [token, count] : sorted_freq) {
        if (count < min_frequency) break;
        if (tokenizer.vocab.count(token)) continue;
        tokenizer.vocab[token] = static_cast<int>(tokenizer.inv_vocab.size());
        tokenizer.inv_vocab.push_back(token);
    }
    return tokenizer;
}

EncodedText WordTokenizer::encode(const std::string& text, size_t max_length) const {
    if (max_length < 2) {
        throw ConfigurationError("max_length must be at least 2 to hold [CLS] and [SEP]");
    }
    std::vector<std::string> words = tokenize(text);
    if (words.empty()) {
        throw EncodingError("Cannot encode empty text");
    }

    size_t body = std::min(words.size(), max_length - 2);
    std::vector<int> ids;
    ids.reserve(max_length);
    ids.push_back(CLS_ID);
    for (size_t i = 0; i < body; ++i) {
        ids.push_back(tokenToId(words[i]));
    }
    ids.push_back(SEP_ID);

    return padToLength(std::move(ids), max_length, PAD_ID);
}

int WordTokenizer::tokenToId(const std::string& token) const {
    auto it = vocab.find(token);
    return it != vocab.end() ? it->second : UNK_ID;
}

void WordTokenizer::save(const std::string& directory) const {
    json j;
    json v = json::object();
    for (size_t i = 0; i < inv_vocab.size(); ++i) {
        v[inv_vocab[i]] = i;
    }
    j["vocab"] = v;
    j["special_tokens"] = {
        {"pad_token", "<pad>"},
        {"unk_token", "<unk>"},
        {"cls_token", "<cls>"},
        {"sep_token", "<sep>"}
    };

    std::string path = (fs::path(directory) / "vocab.json").string();
    std::ofstream file(path);
    if (!file.is_open()) {
        throw CheckpointError("Cannot write vocabulary: " + path);
    }
    file << j.dump(2);
}

WordTokenizer WordTokenizer::load(const std::string& directory) {
    std::string path = (fs::path(directory) / "vocab.json").string();
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CheckpointError("Cannot open vocabulary: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw CheckpointError("Cannot parse vocabulary " + path + ": " + e.what());
    }
    if (!j.contains("vocab") || !j["vocab"].is_object()) {
        throw CheckpointError("Vocabulary file has no 'vocab' object: " + path);
    }

    const json& v = j["vocab"];
    WordTokenizer tokenizer;
    tokenizer.inv_vocab.assign(v.size(), "");
    tokenizer.vocab.clear();
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (!it.value().is_number_integer() || it.key().empty()) {
            throw CheckpointError("Malformed vocabulary entry in " + path);
        }
        int id = it.value().get<int>();
        if (id < 0 || static_cast<size_t>(id) >= v.size() || !tokenizer.inv_vocab[id].empty()) {
            throw CheckpointError("Vocabulary ids are not a dense range: " + path);
        }
        tokenizer.vocab[it.key()] = id;
        tokenizer.inv_vocab[id] = it.key();
    }
    if (tokenizer.inv_vocab.size() < 4 || tokenizer.inv_vocab[PAD_ID] != "<pad>"
        || tokenizer.inv_vocab[UNK_ID] != "<unk>" || tokenizer.inv_vocab[CLS_ID] != "<cls>"
        || tokenizer.inv_vocab[SEP_ID] != "<sep>") {
        throw CheckpointError("Vocabulary special tokens are missing or misplaced: " + path);
    }
    return tokenizer;
}

// ============ SentencePieceTokenizer ============

SentencePieceTokenizer::SentencePieceTokenizer(const std::string& model_path)
    : processor(std::make_unique<sentencepiece::SentencePieceProcessor>()),
      model_path(model_path)
{
    const auto status = processor->Load(model_path);
    if (!status.ok()) {
        throw ConfigurationError("Failed to load SentencePiece model " + model_path
                                 + ": " + status.ToString());
    }

    pad_id = processor->pad_id() >= 0 ? processor->pad_id() : 0;
    bos_id = processor->bos_id();
    eos_id = processor->eos_id();
}

SentencePieceTokenizer::~SentencePieceTokenizer() = default;

EncodedText SentencePieceTokenizer::encode(const std::string& text, size_t max_length) const {
    size_t specials = (bos_id >= 0 ? 1 : 0) + (eos_id >= 0 ? 1 : 0);
    if (max_length <= specials) {
        throw ConfigurationError("max_length is too small for the model's BOS/EOS tokens");
    }
    if (isBlank(text)) {
        throw EncodingError("Cannot encode empty text");
    }

    std::vector<int> pieces;
    const auto status = processor->Encode(text, &pieces);
    if (!status.ok()) {
        throw EncodingError("SentencePiece failed to encode text: " + status.ToString());
    }
    pieces.resize(std::min(pieces.size(), max_length - specials));

    std::vector<int> ids;
    ids.reserve(max_length);
    if (bos_id >= 0) ids.push_back(bos_id);
    ids.insert(ids.end(), pieces.begin(), pieces.end());
    if (eos_id >= 0) ids.push_back(eos_id);

    return padToLength(std::move(ids), max_length, pad_id);
}

size_t SentencePieceTokenizer::getVocabSize() const {
    return static_cast<size_t>(processor->GetPieceSize());
}

void SentencePieceTokenizer::save(const std::string& directory) const {
    fs::path target = fs::path(directory) / "spiece.model";
    std::error_code ec;
    if (fs::exists(target) && fs::equivalent(model_path, target, ec)) {
        return;
    }
    fs::copy_file(model_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw CheckpointError("Cannot copy SentencePiece model to " + target.string()
                              + ": " + ec.message());
    }
}

std::unique_ptr<TextTokenizer> loadTokenizer(const std::string& type, const std::string& directory) {
    if (type == "word") {
        return std::make_unique<WordTokenizer>(WordTokenizer::load(directory));
    }
    if (type == "sentencepiece") {
        fs::path model = fs::path(directory) / "spiece.model";
        if (!fs::exists(model)) {
            throw CheckpointError("Checkpoint has no SentencePiece model: " + model.string());
        }
        return std::make_unique<SentencePieceTokenizer>(model.string());
    }
    throw CheckpointError("Unknown tokenizer type in checkpoint: '" + type + "'");
}
