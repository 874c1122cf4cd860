#include "model/model_description.hpp"

#include <cstddef>
#include <fstream>
#include <string>
#include <stdexcept>

namespace gamcoach {

namespace {

double numberFromString(const std::string& text, const std::string& what) {
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used == text.size()) return value;
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    throw std::invalid_argument(what + " contains \"" + text + "\", which is not a number");
}

std::vector<double> numberArray(const nlohmann::json& j, const std::string& what) {
    if (!j.is_array()) {
        throw std::invalid_argument(what + " must be an array");
    }
    std::vector<double> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        if (item.is_number()) {
            out.push_back(item.get<double>());
        } else if (item.is_string()) {
            // Label codes are sometimes serialized as strings.
            out.push_back(numberFromString(item.get<std::string>(), what));
        } else {
            throw std::invalid_argument(what + " contains a non-numeric entry");
        }
    }
    return out;
}

int labelCode(const nlohmann::json& j, const std::string& what) {
    if (j.is_number()) return j.get<int>();
    if (j.is_string()) {
        const std::string text = j.get<std::string>();
        try {
            std::size_t used = 0;
            const int code = std::stoi(text, &used);
            if (used == text.size()) return code;
        } catch (const std::logic_error&) {
            // invalid_argument or out_of_range, reported below
        }
        throw std::invalid_argument(what + " has code \"" + text + "\", which is not an integer");
    }
    throw std::invalid_argument(what + " must map to a number");
}

FeatureConfig parseConfig(const nlohmann::json& j) {
    FeatureConfig config;
    if (!j.is_object()) return config;

    if (j.contains("acceptableRange") && !j["acceptableRange"].is_null()) {
        config.acceptable_range = numberArray(j["acceptableRange"], "acceptableRange");
    }
    config.requires_increasing = j.value("requiresIncreasing", false);
    config.requires_decreasing = j.value("requiresDecreasing", false);
    config.difficulty = j.value("difficulty", 3);
    if (j.contains("usesTransform") && j["usesTransform"].is_string()) {
        config.uses_transform = j["usesTransform"].get<std::string>();
    }
    config.requires_int = j.value("requiresInt", false);
    return config;
}

FeatureDef parseMainFeature(const nlohmann::json& j, FeatureType type) {
    FeatureDef def;
    def.name = j.at("name").get<std::string>();
    def.type = type;
    def.additive = numberArray(j.at("additive"), def.name + ".additive");

    if (type == FeatureType::Continuous) {
        def.bin_edges = numberArray(j.at("binEdge"), def.name + ".binEdge");
        if (def.bin_edges.size() != def.additive.size() + 1 &&
            def.bin_edges.size() != def.additive.size()) {
            throw std::invalid_argument("Continuous feature " + def.name +
                                        " has mismatched binEdge/additive lengths");
        }
        for (size_t i = 1; i < def.bin_edges.size(); i++) {
            if (def.bin_edges[i] < def.bin_edges[i - 1]) {
                throw std::invalid_argument("Bin edges of " + def.name + " are not sorted");
            }
        }
    } else {
        def.bin_labels = numberArray(j.at("binLabel"), def.name + ".binLabel");
        if (def.bin_labels.size() != def.additive.size()) {
            throw std::invalid_argument("Categorical feature " + def.name +
                                        " has mismatched binLabel/additive lengths");
        }
    }

    if (def.additive.empty()) {
        throw std::invalid_argument("Feature " + def.name + " has no bins");
    }

    if (j.contains("config")) {
        def.config = parseConfig(j["config"]);
    }
    def.importance = j.value("importance", 0.0);
    return def;
}

InteractionDef parseInteraction(const nlohmann::json& j, size_t feature_count) {
    InteractionDef def;
    def.name = j.at("name").get<std::string>();

    const auto& id = j.at("id");
    if (!id.is_array() || id.size() != 2) {
        throw std::invalid_argument("Interaction " + def.name + " needs a two-element id");
    }
    def.index1 = id[0].get<size_t>();
    def.index2 = id[1].get<size_t>();
    if (def.index1 >= feature_count || def.index2 >= feature_count || def.index1 == def.index2) {
        throw std::invalid_argument("Interaction " + def.name + " references invalid features");
    }

    def.bin_labels1 = numberArray(j.at("binLabel1"), def.name + ".binLabel1");
    def.bin_labels2 = numberArray(j.at("binLabel2"), def.name + ".binLabel2");

    const auto& grid = j.at("additive");
    if (!grid.is_array()) {
        throw std::invalid_argument("Interaction " + def.name + " additive must be a 2-D array");
    }
    for (const auto& row : grid) {
        def.additive.push_back(numberArray(row, def.name + ".additive"));
    }

    if (def.additive.empty()) {
        throw std::invalid_argument("Interaction " + def.name + " has an empty score grid");
    }
    const size_t cols = def.additive.front().size();
    for (const auto& row : def.additive) {
        if (row.size() != cols) {
            throw std::invalid_argument("Interaction " + def.name + " has a ragged score grid");
        }
    }
    return def;
}

} // namespace

std::string featureTypeToString(FeatureType type) {
    switch (type) {
        case FeatureType::Continuous:  return "continuous";
        case FeatureType::Categorical: return "categorical";
        case FeatureType::Interaction: return "interaction";
    }
    return "continuous";
}

FeatureType parseFeatureType(const std::string& value) {
    if (value == "continuous") return FeatureType::Continuous;
    if (value == "categorical") return FeatureType::Categorical;
    if (value == "interaction") return FeatureType::Interaction;
    throw std::invalid_argument("Unknown feature type: " + value);
}

std::optional<size_t> ModelDescription::featureIndex(const std::string& name) const {
    for (size_t i = 0; i < feature_names.size(); i++) {
        if (feature_names[i] == name) return i;
    }
    return std::nullopt;
}

ModelDescription ModelDescription::fromJson(const nlohmann::json& j) {
    ModelDescription desc;

    try {
        desc.feature_names = j.at("featureNames").get<std::vector<std::string>>();
        for (const auto& t : j.at("featureTypes")) {
            desc.feature_types.push_back(parseFeatureType(t.get<std::string>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed model header: ") + e.what());
    }

    if (desc.feature_names.size() != desc.feature_types.size()) {
        throw std::invalid_argument("featureNames and featureTypes have different lengths");
    }

    desc.features.resize(desc.feature_names.size());
    std::vector<bool> seen(desc.feature_names.size(), false);

    try {
        for (const auto& f : j.at("features")) {
            FeatureType type = parseFeatureType(f.at("type").get<std::string>());
            if (type == FeatureType::Interaction) {
                desc.interactions.push_back(parseInteraction(f, desc.feature_names.size()));
                continue;
            }

            const std::string name = f.at("name").get<std::string>();
            auto index = desc.featureIndex(name);
            if (!index) {
                throw std::invalid_argument("Feature " + name + " is not listed in featureNames");
            }
            if (desc.feature_types[*index] != type) {
                throw std::invalid_argument("Feature " + name + " type disagrees with featureTypes");
            }
            desc.features[*index] = parseMainFeature(f, type);
            seen[*index] = true;
        }

        for (size_t i = 0; i < seen.size(); i++) {
            if (!seen[i]) {
                throw std::invalid_argument("Feature " + desc.feature_names[i] + " has no definition");
            }
        }

        if (j.contains("labelEncoder") && j["labelEncoder"].is_object()) {
            for (const auto& [feature, mapping] : j["labelEncoder"].items()) {
                auto& encoder = desc.label_encoder[feature];
                for (const auto& [label, code] : mapping.items()) {
                    encoder[label] = labelCode(code, "labelEncoder." + feature + "." + label);
                }
            }
        }

        desc.intercept = j.value("intercept", 0.0);
        desc.is_classifier = j.value("isClassifier", true);

        if (j.contains("modelInfo") && j["modelInfo"].is_object()) {
            const auto& info = j["modelInfo"];
            if (info.contains("classes")) {
                for (const auto& c : info["classes"]) {
                    desc.class_names.push_back(c.is_string() ? c.get<std::string>() : c.dump());
                }
            }
            desc.regression_name = info.value("regressionName", std::string());
        }

        if (j.contains("contMads") && j["contMads"].is_object()) {
            for (const auto& [name, mad] : j["contMads"].items()) {
                desc.cont_mads[name] = mad.get<double>();
            }
        }

        if (j.contains("catDistances") && j["catDistances"].is_object()) {
            for (const auto& [name, table] : j["catDistances"].items()) {
                auto& distances = desc.cat_distances[name];
                for (const auto& [level, distance] : table.items()) {
                    distances[level] = distance.get<double>();
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed model description: ") + e.what());
    }

    for (const auto& inter : desc.interactions) {
        if (inter.additive.size() != inter.bin_labels1.size() &&
            inter.additive.size() + 1 != inter.bin_labels1.size()) {
            throw std::invalid_argument("Interaction " + inter.name + " first axis does not match its grid");
        }
        const size_t cols = inter.additive.front().size();
        if (cols != inter.bin_labels2.size() && cols + 1 != inter.bin_labels2.size()) {
            throw std::invalid_argument("Interaction " + inter.name + " second axis does not match its grid");
        }
    }

    return desc;
}

ModelDescription ModelDescription::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open model file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse model file " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace gamcoach
