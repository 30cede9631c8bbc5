// ==============================================================================
// domaindump/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - std::filesystem::path <-> UTF-8 (явные преобразования)
// - TTY detection для цветного вывода
// - Ввод пароля без эха
// - Временные каталоги (для тестов и отладки)
//
// Платформенная специфика изолирована здесь. Поддерживается POSIX.
//
// ==============================================================================

#ifndef DOMAINDUMP_PLATFORM_HPP
#define DOMAINDUMP_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace domaindump::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Терминал
// ----------------------------------------------------------------------------

bool is_tty_stdout();

bool is_tty_stderr();

bool is_tty_stdin();

/// Прочитать строку из stdin, не отображая ввод (если stdin - терминал).
/// Приглашение пишется в stderr. std::nullopt при EOF.
std::optional<std::string> read_password(std::string_view prompt);

// ----------------------------------------------------------------------------
// Временные каталоги
// ----------------------------------------------------------------------------

/// Создать уникальный каталог в $TMPDIR (или /tmp): <prefix>_XXXXXX
/// @throws std::runtime_error
std::filesystem::path make_temp_dir(std::string_view prefix);

}  // namespace domaindump::platform

#endif  // DOMAINDUMP_PLATFORM_HPP
