/**
 * @file MimeTypes.hpp
 * @brief Extension based MIME type guess.
 */

#pragma once
#include <optional>
#include <string>

namespace foldermapper::infrastructure {

class MimeTypes {
public:
    /**
     * @brief Guesses a MIME type from a lower-case extension (".json").
     * @return std::nullopt for unknown extensions.
     */
    static std::optional<std::string> Guess(const std::string& extension);
};

} // namespace foldermapper::infrastructure
