/**
 * @file LawSourceDetector.hpp
 * @brief Heuristic detection of law source metadata from raw Arabic text.
 */

#pragma once
#include <cstddef>
#include <string>
#include "LawSource.hpp"

namespace lexingest::domain {

/**
 * @class LawSourceDetector
 * @brief Stateless detector; for each field the first pattern that matches anywhere wins.
 */
class LawSourceDetector {
public:
    /** @brief Number of leading code points the description is taken from. */
    static constexpr std::size_t kDescriptionWindow = 500;

    /**
     * @brief Detects metadata from the document text.
     * @param text Raw extracted text.
     * @return Detected metadata; defaults for every field nothing matched. Never throws.
     */
    static LawSourceMetadata detect(const std::string& text);

    /**
     * @brief Overlays caller-supplied values onto detected ones.
     * @param detected Result of detect().
     * @param provided Fields the caller set; absent fields keep the detected value.
     */
    static LawSourceMetadata merge(const LawSourceMetadata& detected, const LawSourceOverrides& provided);
};

} // namespace lexingest::domain
