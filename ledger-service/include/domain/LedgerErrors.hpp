#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Стабильные коды ошибок, видимые вызывающей стороне
 */
enum class ErrorCode {
    VALIDATION_ERROR,
    INSUFFICIENT_FUNDS,
    IDEMPOTENCY_CONFLICT,
    CONCURRENT_MODIFICATION,
    CUSTOMER_UNAVAILABLE,
    NOT_FOUND,
    STORAGE_UNAVAILABLE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR:        return "VALIDATION_ERROR";
        case ErrorCode::INSUFFICIENT_FUNDS:      return "INSUFFICIENT_FUNDS";
        case ErrorCode::IDEMPOTENCY_CONFLICT:    return "IDEMPOTENCY_CONFLICT";
        case ErrorCode::CONCURRENT_MODIFICATION: return "CONCURRENT_MODIFICATION";
        case ErrorCode::CUSTOMER_UNAVAILABLE:    return "CUSTOMER_UNAVAILABLE";
        case ErrorCode::NOT_FOUND:               return "NOT_FOUND";
        case ErrorCode::STORAGE_UNAVAILABLE:     return "STORAGE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение бизнес-операций леджера
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode code() const { return code_; }
    std::string codeString() const { return toString(code_); }

private:
    ErrorCode code_;
};

/// Некорректный ввод: сумма <= 0, неизвестный счёт/категория, неактивный счёт
class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException(ErrorCode::VALIDATION_ERROR, message) {}
};

class InsufficientFundsError : public LedgerException {
public:
    explicit InsufficientFundsError(const std::string& message)
        : LedgerException(ErrorCode::INSUFFICIENT_FUNDS, message) {}
};

/// Повтор с тем же ключом, но другими счётом, суммой или видом
class IdempotencyConflictError : public LedgerException {
public:
    explicit IdempotencyConflictError(const std::string& message)
        : LedgerException(ErrorCode::IDEMPOTENCY_CONFLICT, message) {}
};

/// Исчерпаны повторы при конфликте версий
class ConcurrentModificationError : public LedgerException {
public:
    explicit ConcurrentModificationError(const std::string& message)
        : LedgerException(ErrorCode::CONCURRENT_MODIFICATION, message) {}
};

/// Customer service не ответил или ответил ошибкой
class CustomerUnavailableError : public LedgerException {
public:
    explicit CustomerUnavailableError(const std::string& message)
        : LedgerException(ErrorCode::CUSTOMER_UNAVAILABLE, message) {}
};

class NotFoundError : public LedgerException {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException(ErrorCode::NOT_FOUND, message) {}
};

/// База недоступна, запрос прерван или нарушено ограничение схемы
class StorageError : public LedgerException {
public:
    explicit StorageError(const std::string& message)
        : LedgerException(ErrorCode::STORAGE_UNAVAILABLE, message) {}
};

} // namespace ledger::domain
