#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ideodrift {

/// Base class for all errors raised by the simulation core.
class IdeoDriftError : public std::runtime_error {
public:
    explicit IdeoDriftError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Rejected construction or run input (bad ideology, bias, sensitivity, ids).
/// Inputs are never clamped; they are reported through this error instead.
class ValidationError : public IdeoDriftError {
public:
    explicit ValidationError(const std::string& what)
        : IdeoDriftError(what) {}
};

/// No directed path exists between the requested endpoints.
class NoPathError : public IdeoDriftError {
public:
    NoPathError(uint64_t source, uint64_t target)
        : IdeoDriftError("No path from node " + std::to_string(source) +
                         " to node " + std::to_string(target)),
          source_(source), target_(target) {}

    uint64_t source() const { return source_; }
    uint64_t target() const { return target_; }

private:
    uint64_t source_;
    uint64_t target_;
};

} // namespace ideodrift
