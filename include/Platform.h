#pragma once
// Platform.h — описание платформы, на которой выполняется сканирование
//
// Все пробы получают PlatformContext снаружи, а не вызывают getenv() сами.
// Это позволяет в тестах прогнать ветку Windows/macOS на Linux-машине
// (с подставным CommandRunner и временной домашней папкой).

#include <string>
#include <filesystem>

enum class Platform { WINDOWS, LINUX, MACOS, OTHER };

struct PlatformContext {
    Platform platform = Platform::OTHER;
    std::filesystem::path home;            // Домашняя папка пользователя
    std::filesystem::path app_data;        // %APPDATA% (только Windows)
    std::filesystem::path local_app_data;  // %LOCALAPPDATA% (только Windows)
    std::string system_drive = "C:";       // %SystemDrive% (только Windows)

    // Контекст текущего процесса (платформа компиляции + переменные окружения)
    static PlatformContext current();
};

Platform current_platform();
std::string platform_name(Platform p);
