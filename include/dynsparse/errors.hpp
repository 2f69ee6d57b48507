#pragma once

#include <exception>
#include <string>
#include <vector>
#include <optional>

namespace dynsparse {

/// Base exception for all dynsparse errors
class DynSparseError : public std::exception {
public:
    explicit DynSparseError(std::string message)
        : message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

protected:
    std::string message_;
};

/// Raised when pruner or optimizer parameters are invalid.
/// Always raised eagerly, before any slot is created.
class ConfigurationError : public DynSparseError {
public:
    explicit ConfigurationError(const std::string& message)
        : DynSparseError("Invalid configuration: " + message)
        , errors_{message} {}

    explicit ConfigurationError(const std::vector<std::string>& errors)
        : DynSparseError(build_message(errors))
        , errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string build_message(const std::vector<std::string>& errors) {
        std::string msg = "Invalid configuration:\n";
        for (const auto& e : errors) {
            msg += "  - " + e + "\n";
        }
        return msg;
    }

    std::vector<std::string> errors_;
};

/// Raised when an operation touches a variable that has no allocated slot
class UnconfiguredStateError : public DynSparseError {
public:
    explicit UnconfiguredStateError(const std::string& variable,
                                    std::optional<std::string> slot = std::nullopt)
        : DynSparseError(slot.has_value()
            ? "Variable '" + variable + "' has no slot '" + slot.value() + "'"
            : "Variable '" + variable + "' has no allocated slots; "
              "call create_slots() first")
        , variable_(variable)
        , slot_(std::move(slot)) {}

    const std::string& variable() const { return variable_; }
    const std::optional<std::string>& slot() const { return slot_; }

private:
    std::string variable_;
    std::optional<std::string> slot_;
};

/// Raised when a gradient or mask doesn't match its weight's shape
class ShapeMismatchError : public DynSparseError {
public:
    ShapeMismatchError(const std::string& name,
                       const std::string& expected,
                       const std::string& got)
        : DynSparseError("Shape mismatch for '" + name +
                         "': expected " + expected + ", got " + got)
        , name_(name) {}

    const std::string& tensor_name() const { return name_; }

private:
    std::string name_;
};

/// Raised when a tensor dtype is not one the engine operates on
class DTypeMismatchError : public DynSparseError {
public:
    DTypeMismatchError(const std::string& name,
                       const std::string& expected,
                       const std::string& got)
        : DynSparseError("DType mismatch for '" + name +
                         "': expected " + expected + ", got " + got)
        , name_(name) {}

    const std::string& tensor_name() const { return name_; }

private:
    std::string name_;
};

} // namespace dynsparse
