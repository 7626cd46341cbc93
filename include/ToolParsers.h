#pragma once
// ToolParsers.h — разбор текстового вывода системных утилит
//
// Каждая функция — чистая: принимает сырой stdout утилиты (или содержимое
// /proc-файла) и возвращает структуру. Никакого I/O, поэтому всё покрыто
// юнит-тестами на записанных образцах вывода (tests/ParserTests.cpp).
//
// Вывод утилит полуструктурированный и зависит от версии/локали, поэтому
// парсеры терпимы: непонятная строка пропускается, а не ломает разбор.

#include <string>
#include <vector>
#include "ScanTypes.h"

// --- /proc/mounts -----------------------------------------------------------

struct MountEntry {
    std::string device;
    std::string mount_point;
    std::string fs_type;
};

// Разбор таблицы монтирования; \040 и прочие восьмеричные escape-последовательности декодируются
std::vector<MountEntry> parse_mount_table(const std::string& text);
std::string decode_mount_escapes(const std::string& field);

// true для реальных блочных устройств: /dev/sdX, /dev/nvme*, /dev/mapper/*...
// false для loop, ram, zram, fd и всего, что не начинается с /dev/
bool is_physical_device(const std::string& device);

// --- Шифрование --------------------------------------------------------------

// lsblk -s -n -r -o TYPE,FSTYPE <dev>
LinuxEncryptionInfo parse_lsblk_crypt(const std::string& text);
// manage-bde -status X:
WindowsEncryptionInfo parse_manage_bde_status(const std::string& text);
// fdesetup status
MacEncryptionInfo parse_fdesetup_status(const std::string& text);

// --- Swap и снапшоты --------------------------------------------------------

// /proc/swaps: имена swap-файлов/разделов (заголовок пропускается)
std::vector<std::string> parse_proc_swaps(const std::string& text);
// vssadmin list shadows: количество теневых копий
int parse_vssadmin_shadow_count(const std::string& text);
// tmutil listlocalsnapshots /: количество локальных снапшотов Time Machine
int parse_tmutil_snapshot_count(const std::string& text);

// --- Списки путей / каналов --------------------------------------------------

// Одна запись на строку (wevtutil el, dir /b, find): trim, пустые строки выбрасываются
std::vector<std::string> parse_line_list(const std::string& text);

// --- Журнал событий Windows --------------------------------------------------

// wevtutil qe <channel> /f:text — блоки "Event[N]:".
// Запись без Event ID и без Date отбрасывается.
std::vector<EventLogEntry> parse_wevtutil_events(const std::string& text, const std::string& channel);
EventSeverity parse_severity(const std::string& level);
