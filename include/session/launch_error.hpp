#pragma once

#include <stdexcept>

namespace sessionizer::session {

// An external program could not be started or failed outright.
class LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sessionizer::session
