#pragma once

#include <optional>

// Supplies one input key per call; std::nullopt means end of input.
class KeySource {
public:
    virtual ~KeySource() = default;
    virtual std::optional<char> getKey() = 0;
};
