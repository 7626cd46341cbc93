#pragma once
// CommandRunner.h — запуск внешних утилит ОС с таймаутом
//
// Все пробы, которым нужна внешняя утилита (manage-bde, lsblk, wevtutil,
// vssadmin, fdesetup, tmutil, find), вызывают её только через этот интерфейс.
// Таймаут обязателен: зависшая утилита = "проба ничего не вернула",
// а не ошибка всего сканирования.
//
// CommandRunner (абстрактный класс)
// └── ProcessCommandRunner — Boost.Process + Boost.Asio (run_for с дедлайном)
// В тестах подставляется фейк с заранее записанным выводом утилит.

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cstddef>

struct CommandResult {
    bool launched = false;    // Процесс удалось запустить
    bool timed_out = false;   // Убит по таймауту
    bool truncated = false;   // Вывод превысил лимит, процесс остановлен
    int exit_code = -1;
    std::string output;       // stdout (stderr отбрасывается)

    bool ok() const { return launched && !timed_out && !truncated && exit_code == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // program ищется в PATH; args передаются без участия shell
    virtual CommandResult run(const std::string& program,
                              const std::vector<std::string>& args,
                              std::chrono::seconds timeout) = 0;

    static std::unique_ptr<CommandRunner> create();
};

class ProcessCommandRunner : public CommandRunner {
public:
    // max_output_bytes: верхняя граница stdout в памяти
    explicit ProcessCommandRunner(size_t max_output_bytes = 4 * 1024 * 1024);
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args,
                      std::chrono::seconds timeout) override;
private:
    size_t m_max_output_bytes;
};
