#pragma once

/**
 * @file ICommand.hpp
 * @brief Единица работы для упорядоченного канала команд
 * @author Anton Tobolkin
 * @version 1.1
 */

/**
 * @brief Интерфейс команды по паттерну Command
 *
 * Движок репликации оборачивает каждое событие мастер-счёта в команду
 * и кладёт её в ThreadSafeQueue. Диспетчер исполняет команды строго
 * в порядке поступления.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws CommandException если команду невозможно выполнить
     */
    virtual void execute() = 0;

    /**
     * @brief Короткое имя команды для логов
     */
    virtual const char* name() const { return "command"; }
};
