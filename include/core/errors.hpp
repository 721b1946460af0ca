#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Paraméter a megengedett tartományon kívül (tőke, díj, RSI küszöbök, periódus)
class InputValidationError : public std::invalid_argument {
public:
    explicit InputValidationError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Az adatforrás üres sorozatot adott
class NoDataError : public std::runtime_error {
public:
    explicit NoDataError(std::string symbol)
    : std::runtime_error("No data available for " + symbol), symbol_(std::move(symbol)) {}
    const std::string& symbol() const { return symbol_; }
private:
    std::string symbol_;
};

// Belső hiba: üres vagy elcsúszott bemenet jutott a maghoz
class ComputationPrecondition : public std::logic_error {
public:
    explicit ComputationPrecondition(const std::string& msg) : std::logic_error(msg) {}
};

// HTTP / JSON / CSV olvasási hiba
class DataSourceError : public std::runtime_error {
public:
    explicit DataSourceError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
