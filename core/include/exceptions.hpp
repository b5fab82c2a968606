#pragma once

#include <stdexcept>
#include <string>
#include <utility> // For std::move

namespace core {

    class BacktestEngineException : public std::runtime_error {
    public:
        explicit BacktestEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktestEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Malformed price series or out-of-range configuration value.
    // field() names the offending input so the caller can correct it.
    class InvalidInputException : public BacktestEngineException {
    public:
        InvalidInputException(std::string field, const std::string& message)
            : BacktestEngineException(message), field_(std::move(field)) {}

        const std::string& field() const noexcept { return field_; }

    private:
        std::string field_;
    };

    // Specific exception types
    class ConfigException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class DataLoadException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class IndicatorCalculationException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

} // namespace core
