#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Базовое исключение для ошибок исполнения команд
 * @author Anton Tobolkin
 * @version 1.1
 */

/**
 * @brief Исключение, выбрасываемое при ошибках выполнения команд
 *
 * Наследники несут код, который primary-адаптеры переводят в HTTP статус.
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message, int code = 500)
        : std::runtime_error(message)
        , code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};
