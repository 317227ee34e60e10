#include "gpu_names.hpp"
#include <core/utils.hpp>
#include <set>

// Marketing words that precede the model number
static const std::set<std::string>& brand_words() {
    static const std::set<std::string> words = {
        "NVIDIA", "AMD", "TESLA", "GEFORCE", "INSTINCT", "RADEON", "QUADRO",
        "GRAPHICS", "CORPORATION",
    };
    return words;
}

static bool starts_with_digit(const std::string& s) {
    return !s.empty() && s[0] >= '0' && s[0] <= '9';
}

std::string normalize_gpu_name(const std::string& raw) {
    std::string upper = to_upper(trimmed(raw));
    if (upper.empty()) return "";

    std::vector<std::string> tokens;
    for (const auto& tok : split_whitespace(upper)) {
        if (brand_words().count(tok)) continue;
        tokens.push_back(tok);
    }
    if (tokens.empty()) return upper;

    std::string model = tokens[0];
    // "RTX 4090" -> "RTX4090"; "RTX A6000" -> "A6000"
    if ((model == "RTX" || model == "GTX") && tokens.size() > 1) {
        model = starts_with_digit(tokens[1]) ? model + tokens[1] : tokens[1];
    }

    auto cut = model.find_first_of("-/");
    if (cut != std::string::npos && cut > 0) model = model.substr(0, cut);
    return model;
}

std::string gpu_vendor_for_model(const std::string& model) {
    if (model.empty()) return "none";
    return starts_with(to_upper(model), "MI") ? "amd" : "nvidia";
}
