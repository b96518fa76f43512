#pragma once

#include <stdexcept>
#include <string>

namespace levelsplit {

/// Raised when the host model cannot answer a query (unknown id, closed
/// document, malformed model file).  Never caught inside the core.
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace levelsplit
