// include/eldritch/core/Errors.h
#pragma once

#include <stdexcept>
#include <string>

namespace eldritch {

// Raised for programmer/configuration mistakes: duplicate ids, unknown
// objective types or templates, factories rejecting their parameters.
// The turn loop is not expected to swallow it.
class ObjectiveManagerError : public std::runtime_error
{
public:
    explicit ObjectiveManagerError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace eldritch
