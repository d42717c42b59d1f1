#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BackcastException : public std::runtime_error {
    public:
        explicit BackcastException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BackcastException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public BackcastException {
    public: using BackcastException::BackcastException; };

    class DataLoadException : public BackcastException {
    public: using BackcastException::BackcastException; };

    // Bar data rejected at assignment (empty, NaN prices, duplicate timestamps)
    class DataValidationException : public BackcastException {
    public: using BackcastException::BackcastException; };

    // Lifecycle misuse: stepping before start, re-entrant stepping
    class BacktestException : public BackcastException {
    public: using BackcastException::BackcastException; };

    class InvalidOrderException : public BackcastException {
    public: using BackcastException::BackcastException; };

    // Argument outside its documented domain (close portion, risk-free rate)
    class PreconditionException : public BackcastException {
    public: using BackcastException::BackcastException; };

} // namespace core
