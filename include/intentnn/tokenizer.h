#ifndef INTENTNN_TOKENIZER_H
#define INTENTNN_TOKENIZER_H

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

// Forward declaration for SentencePiece
namespace sentencepiece {
    class SentencePieceProcessor;
}

/**
 * @brief Fixed-length encoding of one text
 *
 * token_ids and attention_mask always have the requested max_length;
 * mask is 1 for real tokens and 0 for padding.
 */
struct EncodedText {
    std::vector<int> token_ids;
    std::vector<int> attention_mask;
};

/**
 * @brief Text -> token id capability required from the encoder
 */
class TextTokenizer {
public:
    virtual ~TextTokenizer() = default;

    /**
     * @brief Encode one text, padded or truncated to max_length
     * @throws EncodingError for empty or whitespace-only text
     * @throws ConfigurationError if max_length cannot hold the special tokens
     */
    virtual EncodedText encode(const std::string& text, size_t max_length) const = 0;

    std::vector<EncodedText> encodeBatch(const std::vector<std::string>& texts,
                                         size_t max_length) const;

    virtual size_t getVocabSize() const = 0;
    virtual int getPadId() const = 0;

    /**
     * @brief Type tag stored in checkpoint config ("word", "sentencepiece")
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Write the tokenizer's files into a checkpoint directory
     */
    virtual void save(const std::string& directory) const = 0;
};

/**
 * @brief Word-level tokenizer with a vocabulary built from training texts
 *
 * Lower-cases, splits on whitespace and emits each ASCII punctuation mark
 * as its own token. Sequences are [CLS] w1 .. wn [SEP].
 */
class WordTokenizer : public TextTokenizer {
private:
    std::unordered_map<std::string, int> vocab;
    std::vector<std::string> inv_vocab;

    void addSpecialTokens();

public:
    static constexpr int PAD_ID = 0;
    static constexpr int UNK_ID = 1;
    static constexpr int CLS_ID = 2;
    static constexpr int SEP_ID = 3;

    /**
     * @brief Tokenizer holding only the special tokens
     */
    WordTokenizer();

    /**
     * @brief Build vocabulary from a corpus
     * @param texts Training texts
     * @param min_frequency Words seen fewer times map to <unk>
     *
     * Words are ordered by descending frequency, ties alphabetically, so the
     * same corpus always yields the same ids.
     */
    static WordTokenizer build(const std::vector<std::string>& texts, size_t min_frequency = 1);

    /**
     * @brief Load vocab.json from a checkpoint directory
     */
    static WordTokenizer load(const std::string& directory);

    /**
     * @brief Split text into lower-cased word and punctuation tokens
     */
    static std::vector<std::string> tokenize(const std::string& text);

    EncodedText encode(const std::string& text, size_t max_length) const override;

    int tokenToId(const std::string& token) const;

    size_t getVocabSize() const override { return inv_vocab.size(); }
    int getPadId() const override { return PAD_ID; }
    std::string getName() const override { return "word"; }

    void save(const std::string& directory) const override;
};

/**
 * @brief Tokenizer wrapper for a trained SentencePiece model
 *
 * Adds BOS/EOS when the model defines them and pads with the model's pad
 * id, or 0 when the model has none.
 */
class SentencePieceTokenizer : public TextTokenizer {
private:
    std::unique_ptr<sentencepiece::SentencePieceProcessor> processor;
    std::string model_path;

    int pad_id;
    int bos_id;
    int eos_id;

public:
    /**
     * @brief Load SentencePiece model
     * @param model_path Path to .model file
     * @throws ConfigurationError if the model cannot be loaded
     */
    explicit SentencePieceTokenizer(const std::string& model_path);
    ~SentencePieceTokenizer() override;

    EncodedText encode(const std::string& text, size_t max_length) const override;

    size_t getVocabSize() const override;
    int getPadId() const override { return pad_id; }
    std::string getName() const override { return "sentencepiece"; }

    /**
     * @brief Copy the model file into the directory as spiece.model
     */
    void save(const std::string& directory) const override;
};

/**
 * @brief Reload the tokenizer a checkpoint directory was saved with
 * @param type Value of getName() at save time
 * @throws CheckpointError for unknown types or missing files
 */
std::unique_ptr<TextTokenizer> loadTokenizer(const std::string& type, const std::string& directory);

#endif // INTENTNN_TOKENIZER_H
