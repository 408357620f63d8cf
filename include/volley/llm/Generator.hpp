/**
 * Generator.hpp - Answer generation collaborator interface
 */

#pragma once

#include <optional>
#include <string>

namespace volley::llm {

class Generator {
public:
    virtual ~Generator() = default;

    // Throws CollaboratorError on failure
    virtual std::string generate(const std::string& text, const std::optional<std::string>& context) = 0;
};

} // namespace volley::llm
