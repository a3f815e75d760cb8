#pragma once

#include <CommandException.hpp>
#include <string>
#include <stdexcept>

namespace copytrader::domain {

/**
 * @brief Недопустимый переход жизненного цикла движка (HTTP 409)
 */
class EngineStateException : public CommandException {
public:
    explicit EngineStateException(const std::string& message)
        : CommandException(message, 409) {}
};

/**
 * @brief Некорректный ввод пользователя (HTTP 422)
 */
class ValidationException : public CommandException {
public:
    explicit ValidationException(const std::string& message)
        : CommandException(message, 422) {}
};

/**
 * @brief Объект не найден (HTTP 404)
 */
class NotFoundException : public CommandException {
public:
    explicit NotFoundException(const std::string& message)
        : CommandException(message, 404) {}
};

enum class BrokerErrorKind {
    CONNECTIVITY,
    REJECTED,
    TIMEOUT
};

/**
 * @brief Ошибка брокерского терминала
 */
class BrokerException : public std::runtime_error {
public:
    BrokerException(BrokerErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    BrokerErrorKind kind() const { return kind_; }

    bool isConnectivity() const { return kind_ == BrokerErrorKind::CONNECTIVITY; }

private:
    BrokerErrorKind kind_;
};

} // namespace copytrader::domain
