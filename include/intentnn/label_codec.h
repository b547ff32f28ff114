#ifndef INTENTNN_LABEL_CODEC_H
#define INTENTNN_LABEL_CODEC_H

#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

/**
 * @brief Bidirectional intent name <-> dense id mapping
 *
 * Ids follow the order of the label list passed in, never hash or sort
 * order. A trained model's codec is persisted with its weights and must be
 * loaded together with them; regenerating it independently can permute ids.
 *
 * Immutable once built.
 */
class LabelCodec {
private:
    std::vector<std::string> labels;
    std::unordered_map<std::string, int> label_to_id;

public:
    /**
     * @brief Build from the canonical ordered intent list
     * @throws ConfigurationError on empty list, empty names or duplicates
     */
    explicit LabelCodec(const std::vector<std::string>& intent_labels);

    /**
     * @brief The seven office-domain intents in canonical order
     */
    static LabelCodec officeIntents();

    /**
     * @throws EncodingError if the label is not in the intent set
     */
    int encode(const std::string& label) const;

    /**
     * @throws EncodingError if the id is outside [0, size())
     */
    const std::string& decode(int id) const;

    bool contains(const std::string& label) const;
    size_t size() const { return labels.size(); }
    const std::vector<std::string>& getLabels() const { return labels; }

    bool operator==(const LabelCodec& other) const { return labels == other.labels; }
    bool operator!=(const LabelCodec& other) const { return !(*this == other); }

    /**
     * @brief {intent_labels, label_to_id, id_to_label, num_labels}
     */
    nlohmann::json toJson() const;

    /**
     * @brief Parse and cross-check all three views of the mapping
     * @throws CheckpointError if fields are missing or disagree
     */
    static LabelCodec fromJson(const nlohmann::json& j);

    void save(const std::string& path) const;
    static LabelCodec load(const std::string& path);
};

#endif // INTENTNN_LABEL_CODEC_H
