#pragma once

/**
 * @file ICommand.hpp
 * @brief Интерфейс отложенной команды
 */

#include <string>

/**
 * @brief Команда, исполняемая фоновым обработчиком очереди
 *
 * Команда инкапсулирует всё, что нужно для выполнения (например, отправку
 * одного события в брокер), и может быть поставлена в ThreadSafeQueue
 * из любого потока.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws CommandException если команду выполнить не удалось
     */
    virtual void execute() = 0;

    /**
     * @brief Короткое имя команды для логов
     */
    virtual std::string name() const = 0;
};
