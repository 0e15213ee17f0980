#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд
 * @details
 * Thread-safe очередь с блокирующей операцией pop().
 * После shutdown() новые команды не принимаются, но уже поставленные
 * выдаются до опустошения очереди: потребитель успевает их доисполнить.
 * При заданной ёмкости push() в полную очередь не ждёт, а отказывает.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди
    size_t capacity_;                              ///< 0 - без ограничения

public:
    explicit ThreadSafeQueue(size_t capacity = 0);
    ~ThreadSafeQueue();

    /**
     * @brief Добавить команду в очередь
     * @param command Команда для добавления
     * @return false, если команда пустая, очередь закрыта или заполнена
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду из очереди (блокирующий вызов)
     * @return Команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;
    bool isEmpty() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
};
