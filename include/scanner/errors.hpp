#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace scanner {

// Not enough bars for the requested indicator or window. Callers skip the bar or symbol.
class InsufficientData : public std::runtime_error {
public:
    explicit InsufficientData(const std::string& what) : std::runtime_error(what) {}
};

// NaN, infinite or otherwise impossible indicator result.
class CalculationError : public std::runtime_error {
public:
    explicit CalculationError(const std::string& what) : std::runtime_error(what) {}
};

// Rejected user input: settings, symbols, dates, configuration.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(std::vector<std::string> errors)
        : std::invalid_argument(join(errors)), errors_(std::move(errors)) {}

    explicit ValidationError(const std::string& error)
        : ValidationError(std::vector<std::string>{error}) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string join(const std::vector<std::string>& errors) {
        std::string out;
        for (const auto& e : errors) {
            if (!out.empty()) out += "; ";
            out += e;
        }
        return out;
    }

    std::vector<std::string> errors_;
};

} // namespace scanner
