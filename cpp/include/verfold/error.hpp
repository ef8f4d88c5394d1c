// ==============================================================================
// verfold/error.hpp - Ошибки разрешения скриптов
// ==============================================================================
//
// Назначение:
// - Единый тип исключения для фатальных ошибок разрешения
// - Классификация: некорректная версия, неоднозначная версия, ввод-вывод
// - Все ошибки фатальны: частичный результат никогда не возвращается
//
// ==============================================================================

#ifndef VERFOLD_ERROR_HPP
#define VERFOLD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace verfold {

// ----------------------------------------------------------------------------
// ResolveErrorKind - типы ошибок
// ----------------------------------------------------------------------------

enum class ResolveErrorKind {
    MalformedVersion,  // Строка не соответствует грамматике версии
    AmbiguousVersion,  // Две папки дают одну и ту же версию
    Io                 // Ошибка чтения файла или перечисления директории
};

/// Преобразовать ResolveErrorKind в строку
const char* error_kind_to_string(ResolveErrorKind kind);

// ----------------------------------------------------------------------------
// ResolveError - исключение разрешения
// ----------------------------------------------------------------------------

class ResolveError : public std::runtime_error {
public:
    /// @param kind Тип ошибки
    /// @param message Сообщение для пользователя
    /// @param subject Путь или строка, вызвавшая ошибку (может быть пустой)
    ResolveError(ResolveErrorKind kind, const std::string& message, std::string subject = {});

    ResolveErrorKind kind() const { return kind_; }
    const std::string& subject() const { return subject_; }

    /// Форматировать ошибку для вывода
    /// Формат: "<kind>: <message>"
    std::string format() const;

private:
    ResolveErrorKind kind_;
    std::string subject_;
};

}  // namespace verfold

#endif  // VERFOLD_ERROR_HPP
