/// @file src/labels/vocabulary.cpp
/// @brief Append-only label table backing every LabelArray.

#include "adjarr/constants.hpp"
#include "adjarr/errors.hpp"
#include "adjarr/label_array.hpp"

#include <fmt/format.h>

namespace adjarr {

Vocabulary::Vocabulary(std::string missing_value) {
    codes_.emplace(missing_value, constants::MISSING_LABEL_CODE);
    labels_.push_back(std::move(missing_value));
}

LabelCode Vocabulary::intern(std::string_view label) {
    if (auto code = find(label)) {
        return *code;
    }
    if (labels_.size() >= constants::MAX_VOCABULARY_SIZE) {
        throw ConfigurationError(fmt::format(
            "vocabulary full: cannot add label '{}' ({} labels)",
            label, labels_.size()));
    }

    const auto code = static_cast<LabelCode>(labels_.size());
    labels_.emplace_back(label);
    codes_.emplace(labels_.back(), code);
    return code;
}

std::optional<LabelCode> Vocabulary::find(std::string_view label) const {
    const auto it = codes_.find(std::string(label));
    if (it == codes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& Vocabulary::label(LabelCode code) const {
    if (code < 0 || static_cast<std::size_t>(code) >= labels_.size()) {
        throw DtypeError(fmt::format(
            "label code {} not in vocabulary of {} labels", code, labels_.size()));
    }
    return labels_[static_cast<std::size_t>(code)];
}

}  // namespace adjarr
