#include "intentnn/label_codec.h"
#include "intentnn/errors.h"
#include <fstream>
#include <unordered_set>

using json = nlohmann::json;

LabelCodec::LabelCodec(const std::vector<std::string>& intent_labels)
    : labels(intent_labels)
{
    if (labels.empty()) {
        throw ConfigurationError("Intent label set must not be empty");
    }
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].empty()) {
            throw ConfigurationError("Intent label at position " + std::to_string(i) + " is empty");
        }
        if (!label_to_id.emplace(labels[i], static_cast<int>(i)).second) {
            throw ConfigurationError("Duplicate intent label: " + labels[i]);
        }
    }
}

LabelCodec LabelCodec::officeIntents() {
    return LabelCodec({
        "salary_inquiry",
        "meeting_room_booking",
        "leave_request",
        "directory_search",
        "company_info",
        "employee_info",
        "employee_search"
    });
}

int LabelCodec::encode(const std::string& label) const {
    auto it = label_to_id.find(label);
    if (it == label_to_id.end()) {
        throw EncodingError("Unknown intent label: '" + label + "'");
    }
    return it->second;
}

const std::string& LabelCodec::decode(int id) const {
    if (id < 0 || static_cast<size_t>(id) >= labels.size()) {
        throw EncodingError("Label id out of range: " + std::to_string(id));
    }
    return labels[id];
}

bool LabelCodec::contains(const std::string& label) const {
    return label_to_id.count(label) > 0;
}

json LabelCodec::toJson() const {
    json j;
    j["intent_labels"] = labels;

    json to_id = json::object();
    json to_label = json::object();
    for (size_t i = 0; i < labels.size(); ++i) {
        to_id[labels[i]] = i;
        // JSON object keys must be strings
        to_label[std::to_string(i)] = labels[i];
    }
    j["label_to_id"] = to_id;
    j["id_to_label"] = to_label;
    j["num_labels"] = labels.size();
    return j;
}

LabelCodec LabelCodec::fromJson(const json& j) {
    for (const char* key : {"intent_labels", "label_to_id", "id_to_label"}) {
        if (!j.contains(key)) {
            throw CheckpointError(std::string("Label mapping is missing field '") + key + "'");
        }
    }

    std::vector<std::string> intent_labels;
    try {
        intent_labels = j.at("intent_labels").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw CheckpointError(std::string("Malformed intent_labels: ") + e.what());
    }

    const json& to_id = j.at("label_to_id");
    const json& to_label = j.at("id_to_label");
    if (!to_id.is_object() || !to_label.is_object()
        || to_id.size() != intent_labels.size() || to_label.size() != intent_labels.size()) {
        throw CheckpointError("Label mapping views disagree on the number of intents");
    }

    for (size_t i = 0; i < intent_labels.size(); ++i) {
        const std::string& name = intent_labels[i];
        std::string key = std::to_string(i);
        if (!to_id.contains(name) || !to_id.at(name).is_number_integer()
            || to_id.at(name).get<long long>() != static_cast<long long>(i)) {
            throw CheckpointError("label_to_id disagrees with intent_labels for '" + name + "'");
        }
        if (!to_label.contains(key) || !to_label.at(key).is_string()
            || to_label.at(key).get<std::string>() != name) {
            throw CheckpointError("id_to_label disagrees with intent_labels at id " + key);
        }
    }

    if (j.contains("num_labels") && j.at("num_labels") != intent_labels.size()) {
        throw CheckpointError("num_labels disagrees with intent_labels");
    }

    try {
        return LabelCodec(intent_labels);
    } catch (const ConfigurationError& e) {
        throw CheckpointError(std::string("Invalid label mapping: ") + e.what());
    }
}

void LabelCodec::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw CheckpointError("Cannot write label mapping: " + path);
    }
    file << toJson().dump(2);
}

LabelCodec LabelCodec::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CheckpointError("Cannot open label mapping: " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw CheckpointError("Cannot parse label mapping " + path + ": " + e.what());
    }
    return fromJson(j);
}
