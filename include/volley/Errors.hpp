/**
 * Errors.hpp - Failure type raised by collaborator adapters
 */

#pragma once

#include <stdexcept>
#include <string>

namespace volley {

class CollaboratorError : public std::runtime_error {
public:
    CollaboratorError(const std::string& component, const std::string& message)
        : std::runtime_error("[" + component + "] " + message)
        , component_(component)
    {
    }

    const std::string& component() const { return component_; }

private:
    std::string component_;
};

} // namespace volley
