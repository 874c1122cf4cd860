#include "scoring/label_encoder.hpp"

#include <algorithm>

namespace gamcoach {

void LabelEncoder::add(const std::string& feature, const std::string& label, int code) {
    encoder_[feature][label] = code;
    decoder_[feature][code] = label;
}

std::optional<int> LabelEncoder::encode(const std::string& feature,
                                        const std::string& label) const {
    auto it = encoder_.find(feature);
    if (it == encoder_.end()) return std::nullopt;
    auto level = it->second.find(label);
    if (level == it->second.end()) return std::nullopt;
    return level->second;
}

std::optional<std::string> LabelEncoder::decode(const std::string& feature, int code) const {
    auto it = decoder_.find(feature);
    if (it == decoder_.end()) return std::nullopt;
    auto level = it->second.find(code);
    if (level == it->second.end()) return std::nullopt;
    return level->second;
}

std::vector<std::string> LabelEncoder::labels(const std::string& feature) const {
    std::vector<std::pair<int, std::string>> ordered;
    auto it = decoder_.find(feature);
    if (it != decoder_.end()) {
        for (const auto& [code, label] : it->second) {
            ordered.push_back({code, label});
        }
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<std::string> out;
    out.reserve(ordered.size());
    for (auto& [_, label] : ordered) {
        out.push_back(std::move(label));
    }
    return out;
}

} // namespace gamcoach
