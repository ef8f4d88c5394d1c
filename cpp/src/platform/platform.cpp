// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "verfold/platform.hpp"

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace verfold::platform {

namespace {

#ifdef _WIN32

// MultiByteToWideChar / WideCharToMultiByte с CP_UTF8.
// Пустой результат при ошибке: вызывающий выбирает запасной путь.

std::wstring utf8_to_wide(std::string_view text) {
    const int size = static_cast<int>(text.size());
    const int len = MultiByteToWideChar(CP_UTF8, 0, text.data(), size, nullptr, 0);
    if (len <= 0) {
        return {};
    }
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), size, wide.data(), len);
    return wide;
}

std::string wide_to_utf8(const std::wstring& wide) {
    const int size = static_cast<int>(wide.size());
    const int len = WideCharToMultiByte(CP_UTF8, 0, wide.data(), size, nullptr, 0, nullptr, nullptr);
    if (len <= 0) {
        return {};
    }
    std::string text(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), size, text.data(), len, nullptr, nullptr);
    return text;
}

#endif

}  // namespace

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    std::wstring wide = utf8_to_wide(u8str);
    return wide.empty() ? std::filesystem::path(u8str) : std::filesystem::path(wide);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    if (p.empty()) {
        return {};
    }
    std::string text = wide_to_utf8(p.native());
    return text.empty() ? p.string() : text;
#else
    return p.string();
#endif
}

bool is_terminal(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

bool filenames_case_sensitive() {
#if defined(_WIN32) || defined(__APPLE__)
    // NTFS и APFS по умолчанию не различают регистр
    return false;
#else
    return true;
#endif
}

}  // namespace verfold::platform
