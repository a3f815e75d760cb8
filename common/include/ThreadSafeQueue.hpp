#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд
 * @details
 * Единственный упорядоченный входной канал: один писатель-подписчик
 * и один поток-диспетчер. Очередь можно закрыть (shutdown) и снова
 * открыть (reopen), что нужно при перезапуске движка.
 *
 * Автор: Anton Tobolkin
 * Версия: 4.0
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    /**
     * @brief Добавить команду в очередь
     * @return false если очередь закрыта и команда отброшена
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Извлечь команду с таймаутом
     * @return nullptr по таймауту или после shutdown()
     */
    std::shared_ptr<ICommand> popFor(std::chrono::milliseconds timeout);

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    /**
     * @brief Снова принять команды после shutdown()
     */
    void reopen();

    /**
     * @brief Выбросить все ожидающие команды
     * @return количество выброшенных команд
     */
    size_t clear();

    bool isShutdown() const;
    bool isEmpty() const;
    size_t size() const;
};
