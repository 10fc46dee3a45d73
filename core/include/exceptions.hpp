#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class ScreenerException : public std::runtime_error {
    public:
        explicit ScreenerException(const std::string& message)
            : std::runtime_error(message) {}

        explicit ScreenerException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

    class InsufficientDataException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

    class IndicatorCalculationException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

    class PatternDetectionException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

    class ScoringException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

    class ValidationException : public ScreenerException {
    public: using ScreenerException::ScreenerException; };

} // namespace core
