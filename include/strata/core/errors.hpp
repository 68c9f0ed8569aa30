#pragma once
#include <stdexcept>
#include <string>

namespace strata::core {

// Base for every error the library raises.
class StrataError : public std::runtime_error {
public:
    explicit StrataError(const std::string& what) : std::runtime_error(what) {}
};

// Not enough defined periods to produce a single strategy return.
class InsufficientDataError : public StrataError {
public:
    explicit InsufficientDataError(const std::string& what) : StrataError(what) {}
};

// Rejected parameter value: non-positive window, inverted thresholds, negative
// cost, wrong arity, malformed range.
class InvalidParameterError : public StrataError {
public:
    explicit InvalidParameterError(const std::string& what) : StrataError(what) {}
};

// The facade was given a strategy tag it does not know.
class UnknownStrategyError : public StrataError {
public:
    explicit UnknownStrategyError(const std::string& what) : StrataError(what) {}
};

// Unordered timestamps or a column that does not line up with its series.
class InvalidSeriesError : public StrataError {
public:
    explicit InvalidSeriesError(const std::string& what) : StrataError(what) {}
};

} // namespace strata::core
