#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "session/launch_error.hpp"

namespace sessionizer::session {

class Selector {
public:
    virtual ~Selector() = default;

    // nullopt when the user picked nothing.
    virtual std::optional<std::string> select(const std::vector<std::string> &candidates) = 0;
};

class FzfSelector : public Selector {
public:
    explicit FzfSelector(
        const sessionizer::Context &ctx,
        std::string command = "fzf",
        std::vector<std::string> args = {}
    );

    std::optional<std::string> select(const std::vector<std::string> &candidates) override;

private:
    const sessionizer::Context &ctx_;
    std::string command_;
    std::vector<std::string> args_;
};

} // namespace sessionizer::session
