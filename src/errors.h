#pragma once

#include <stdexcept>
#include <string>

// Fatal: invalid field of view, bad command-line value, missing API key
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Fatal: the target index file is already there from a previous run
class OutputExistsError : public std::runtime_error {
public:
    explicit OutputExistsError(const std::string& message) : std::runtime_error(message) {}
};
