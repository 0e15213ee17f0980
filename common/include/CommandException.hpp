#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Исключение для команд
 */

/**
 * @brief Исключение, выбрасываемое при ошибках выполнения команд
 *
 * Хранит имя команды, чтобы обработчик очереди мог залогировать,
 * какая именно операция не выполнилась.
 */
class CommandException : public std::runtime_error {
public:
    CommandException(const std::string& command, const std::string& message)
        : std::runtime_error(command + ": " + message)
        , command_(command) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};
