#include "coach/cf_request.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace gamcoach {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

std::size_t resolveFeature(const ScoringModel& model, const std::string& name) {
    auto index = model.featureIndex(name);
    if (!index) {
        throw std::invalid_argument("Unknown feature: " + name);
    }
    return *index;
}

// null stands for an open end of an interval.
double boundFromJson(const nlohmann::json& j, double open_value) {
    if (j.is_null()) return open_value;
    if (!j.is_number()) {
        throw std::invalid_argument("Interval bound must be a number or null, got " + j.dump());
    }
    return j.get<double>();
}

std::pair<double, double> intervalFromJson(const nlohmann::json& j, const std::string& what) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument(what + " must be a [low, high] pair");
    }
    const double lo = boundFromJson(j[0], -kInf);
    const double hi = boundFromJson(j[1], kInf);
    if (lo > hi) {
        throw std::invalid_argument(what + " has low > high");
    }
    return {lo, hi};
}

nlohmann::json boundToJson(double value) {
    if (std::isinf(value)) return nullptr;
    return value;
}

} // namespace

nlohmann::json CoachConfig::toJson() const {
    return {
        {"simThresholdFactor", sim_threshold_factor},
        {"epsilon", epsilon},
        {"classFlipMargin", class_flip_margin}
    };
}

CoachConfig CoachConfig::fromJson(const nlohmann::json& j) {
    CoachConfig c;
    c.sim_threshold_factor = j.value("simThresholdFactor", c.sim_threshold_factor);
    c.epsilon = j.value("epsilon", c.epsilon);
    c.class_flip_margin = j.value("classFlipMargin", c.class_flip_margin);
    return c;
}

bool FeatureRange::admits(const FeatureValue& value) const {
    if (isNumeric(value)) {
        if (!interval) return true;
        const double v = asNumber(value);
        return v >= interval->first && v <= interval->second;
    }
    if (levels.empty()) return true;
    return levels.count(asLabel(value)) > 0;
}

CfRequest CfRequest::fromJson(const nlohmann::json& j, const ScoringModel& model) {
    CfRequest r;
    try {
        r.sample = sampleFromJson(j.at("sample"));
        if (r.sample.size() != model.featureCount()) {
            throw std::invalid_argument("Sample has " + std::to_string(r.sample.size()) +
                                        " values, model expects " +
                                        std::to_string(model.featureCount()));
        }

        r.total_cfs = j.value("totalCfs", r.total_cfs);
        if (r.total_cfs < 1) {
            throw std::invalid_argument("totalCfs must be at least 1");
        }

        if (j.contains("targetRange") && !j["targetRange"].is_null()) {
            r.target_range = intervalFromJson(j["targetRange"], "targetRange");
        }
        if (j.contains("simThreshold") && !j["simThreshold"].is_null()) {
            r.sim_threshold = j["simThreshold"].get<double>();
        }
        if (j.contains("categoricalWeight")) {
            const auto& w = j["categoricalWeight"];
            if (w.is_number()) {
                r.categorical_weight = w.get<double>();
            } else if (!w.is_null() && w != "auto") {
                throw std::invalid_argument("categoricalWeight must be a number or \"auto\"");
            }
        }

        if (j.contains("featuresToVary") && !j["featuresToVary"].is_null()) {
            const auto& names = j["featuresToVary"];
            if (names.is_string() && names == "all") {
                // all features, same as omitting the key
            } else {
                std::vector<std::size_t> indices;
                for (const auto& name : names) {
                    indices.push_back(resolveFeature(model, name.get<std::string>()));
                }
                r.features_to_vary = std::move(indices);
            }
        }

        if (j.contains("featureRanges")) {
            for (const auto& [name, range] : j["featureRanges"].items()) {
                const std::size_t f = resolveFeature(model, name);
                if (model.mainTerm(f).type == FeatureType::Categorical) {
                    std::set<std::string> labels;
                    for (const auto& level : range) {
                        labels.insert(asLabel(valueFromJson(level)));
                    }
                    r.feature_ranges[f] = FeatureRange::oneOf(std::move(labels));
                } else {
                    auto [lo, hi] = intervalFromJson(range, "featureRanges." + name);
                    r.feature_ranges[f] = FeatureRange::between(lo, hi);
                }
            }
        }

        if (j.contains("featureWeightMultipliers")) {
            for (const auto& [name, weight] : j["featureWeightMultipliers"].items()) {
                r.feature_weight_multipliers[resolveFeature(model, name)] = weight.get<double>();
            }
        }

        if (j.contains("maxNumFeaturesToVary") && !j["maxNumFeaturesToVary"].is_null()) {
            r.max_num_features_to_vary = j["maxNumFeaturesToVary"].get<int>();
        }

        if (j.contains("continuousIntegerFeatures")) {
            for (const auto& name : j["continuousIntegerFeatures"]) {
                r.continuous_integer_features.insert(resolveFeature(model, name.get<std::string>()));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed request: ") + e.what());
    }
    return r;
}

nlohmann::json CfRequest::toJson(const ScoringModel& model) const {
    nlohmann::json j;
    j["sample"] = sampleToJson(sample);
    j["totalCfs"] = total_cfs;
    if (target_range) {
        j["targetRange"] = {boundToJson(target_range->first), boundToJson(target_range->second)};
    }
    if (sim_threshold) j["simThreshold"] = *sim_threshold;
    j["categoricalWeight"] = categorical_weight ? nlohmann::json(*categorical_weight)
                                                : nlohmann::json("auto");

    if (features_to_vary) {
        nlohmann::json names = nlohmann::json::array();
        for (std::size_t f : *features_to_vary) names.push_back(model.mainTerm(f).name);
        j["featuresToVary"] = names;
    } else {
        j["featuresToVary"] = "all";
    }

    nlohmann::json ranges = nlohmann::json::object();
    for (const auto& [f, range] : feature_ranges) {
        if (range.interval) {
            ranges[model.mainTerm(f).name] = {boundToJson(range.interval->first),
                                              boundToJson(range.interval->second)};
        } else {
            ranges[model.mainTerm(f).name] = range.levels;
        }
    }
    j["featureRanges"] = ranges;

    nlohmann::json weights = nlohmann::json::object();
    for (const auto& [f, w] : feature_weight_multipliers) {
        weights[model.mainTerm(f).name] = w;
    }
    j["featureWeightMultipliers"] = weights;

    if (max_num_features_to_vary) j["maxNumFeaturesToVary"] = *max_num_features_to_vary;

    nlohmann::json integers = nlohmann::json::array();
    for (std::size_t f : continuous_integer_features) integers.push_back(model.mainTerm(f).name);
    j["continuousIntegerFeatures"] = integers;
    return j;
}

} // namespace gamcoach
