#pragma once

#include "adjarr/types.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>

/// @file include/adjarr/constants.hpp
/// @brief Sentinels and fixed codes shared by the engine and label encoder.

namespace adjarr::constants {

// ─── Missing-Value Sentinels ──────────────────────────────────────────────────

/// "Not a Time": the datetime64 missing value.
static constexpr Timestamp NaT{std::numeric_limits<std::int64_t>::min()};

/// Default float64 missing value.
static constexpr double FLOAT64_MISSING = std::numeric_limits<double>::quiet_NaN();

// ─── Label Encoding ───────────────────────────────────────────────────────────

/// Code reserved for the missing value in every Vocabulary.
static constexpr LabelCode MISSING_LABEL_CODE = 0;

/// Largest number of distinct labels a Vocabulary may hold (code space).
static constexpr std::size_t MAX_VOCABULARY_SIZE =
    static_cast<std::size_t>(std::numeric_limits<LabelCode>::max());

}  // namespace adjarr::constants
