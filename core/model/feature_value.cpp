#include "model/feature_value.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace gamcoach {

double asNumber(const FeatureValue& v) {
    if (const double* d = std::get_if<double>(&v)) {
        return *d;
    }
    throw std::invalid_argument("Expected a numeric feature value, got label: " +
                                std::get<std::string>(v));
}

std::string asLabel(const FeatureValue& v) {
    if (const std::string* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    double d = std::get<double>(v);
    if (std::floor(d) == d && std::abs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    std::ostringstream out;
    out << d;
    return out.str();
}

std::string toString(const FeatureValue& v) {
    if (isNumeric(v)) {
        std::ostringstream out;
        out << std::get<double>(v);
        return out.str();
    }
    return std::get<std::string>(v);
}

nlohmann::json valueToJson(const FeatureValue& v) {
    if (isNumeric(v)) return std::get<double>(v);
    return std::get<std::string>(v);
}

FeatureValue valueFromJson(const nlohmann::json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    throw std::invalid_argument("Feature value must be a number or a string: " + j.dump());
}

nlohmann::json sampleToJson(const Sample& sample) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& v : sample) {
        out.push_back(valueToJson(v));
    }
    return out;
}

Sample sampleFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Sample must be a JSON array");
    }
    Sample sample;
    sample.reserve(j.size());
    for (const auto& item : j) {
        sample.push_back(valueFromJson(item));
    }
    return sample;
}

} // namespace gamcoach
