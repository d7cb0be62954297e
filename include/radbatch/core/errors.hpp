#pragma once

#include <stdexcept>
#include <string>

namespace radbatch {

class RadbatchError : public std::runtime_error {
public:
    explicit RadbatchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public RadbatchError {
public:
    explicit ConfigError(const std::string& message)
        : RadbatchError("Config error: " + message) {}
};

class ValidationError : public RadbatchError {
public:
    explicit ValidationError(const std::string& message)
        : RadbatchError("Validation error: " + message) {}
};

class IOError : public RadbatchError {
public:
    explicit IOError(const std::string& message)
        : RadbatchError("I/O error: " + message) {}
};

// Raised before any process is launched; the whole plan is rejected.
class PlanningError : public RadbatchError {
public:
    explicit PlanningError(const std::string& message)
        : RadbatchError("Planning error: " + message) {}
};

// Scoped to a single job. The engine records it and keeps going.
class ExecutionError : public RadbatchError {
public:
    explicit ExecutionError(const std::string& message)
        : RadbatchError("Execution error: " + message) {}
};

class ParseError : public RadbatchError {
public:
    explicit ParseError(const std::string& message)
        : RadbatchError("Parse error: " + message) {}
};

class AggregationError : public RadbatchError {
public:
    explicit AggregationError(const std::string& message)
        : RadbatchError("Aggregation error: " + message) {}
};

} // namespace radbatch
