#pragma once

#include <stdexcept>
#include <string>

namespace trh {

/**
 * @brief Base class for all quantification and parsing failures.
 *
 * Batch drivers catch this type to record a per-sample failure and
 * continue; everything else is treated as a programming error.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg)
        : std::runtime_error(msg), detail_(msg) {}

    /// Message without the error kind prefix
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

protected:
    Error(const std::string& kind, const std::string& detail)
        : std::runtime_error(kind + ": " + detail), detail_(detail) {}

private:
    std::string detail_;
};

/**
 * @brief Thrown when no peak satisfies the one-sided nearest-neighbour
 * rule for a fraction end boundary.
 */
class BoundaryResolutionError : public Error {
public:
    explicit BoundaryResolutionError(const std::string& msg)
        : Error("Boundary resolution error", msg) {}
};

/**
 * @brief Thrown when the internal standard peak cannot be identified.
 */
class IstdError : public Error {
public:
    explicit IstdError(const std::string& msg)
        : Error("ISTD error", msg) {}
};

/**
 * @brief Thrown on division by zero or a non-finite intermediate value.
 */
class NumericDegeneracyError : public Error {
public:
    explicit NumericDegeneracyError(const std::string& msg)
        : Error("Numeric error", msg) {}
};

/**
 * @brief Thrown when an instrument report cannot be read or parsed.
 */
class ReportParseError : public Error {
public:
    explicit ReportParseError(const std::string& msg)
        : Error("Report parse error", msg) {}
};

/**
 * @brief Thrown when a method file cannot be read or parsed.
 */
class MethodParseError : public Error {
public:
    explicit MethodParseError(const std::string& msg)
        : Error("Method parse error", msg) {}
};

} // namespace trh
