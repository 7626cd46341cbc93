#pragma once
#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>

// Журнал работы сканера. До вызова init() пишет только в stderr (warn/error).
// Пробы работают параллельно, поэтому запись защищена мьютексом.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    static void init(const std::string& dir = "logs") { instance().do_init(dir); }
    static void info(const std::string& msg)  { instance().log("INFO",  msg, false); }
    static void warn(const std::string& msg)  { instance().log("WARN",  msg, true);  }
    static void error(const std::string& msg) { instance().log("ERROR", msg, true);  }
    static std::string path() {
        Logger& l = instance();
        std::lock_guard<std::mutex> lock(l.m_mutex);
        return l.m_path;
    }

    // Тихий режим для CLI: stdout занят JSON, stderr оставляем для ошибок
    static void set_stderr_warnings(bool enabled) {
        Logger& l = instance();
        std::lock_guard<std::mutex> lock(l.m_mutex);
        l.m_warn_to_stderr = enabled;
    }

    static bool stderr_warnings() {
        Logger& l = instance();
        std::lock_guard<std::mutex> lock(l.m_mutex);
        return l.m_warn_to_stderr;
    }

private:
    std::ofstream m_file;
    std::string m_path;
    std::mutex m_mutex;
    bool m_warn_to_stderr = true;

    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::tm local_now() {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        return tm_buf;
    }

    static std::string timestamp() {
        std::tm tm_buf = local_now();
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    static std::string file_timestamp() {
        std::tm tm_buf = local_now();
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
        return ss.str();
    }

    void do_init(const std::string& dir_name) {
        namespace fs = std::filesystem;
        std::lock_guard<std::mutex> lock(m_mutex);
        fs::path dir = dir_name;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[Logger] Cannot create log directory " << dir.string()
                      << ": " << ec.message() << "\n";
            return;
        }
        std::string filename = "privascan_" + file_timestamp() + ".log";
        m_path = (dir / filename).string();
        if (m_file.is_open()) m_file.close();
        m_file.open(m_path, std::ios::out | std::ios::app);
    }

    void log(const char* level, const std::string& msg, bool also_stderr) {
        std::string line = "[" + timestamp() + "] [" + level + "] " + msg;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file << line << "\n";
            m_file.flush();
        }
        if (also_stderr && (m_warn_to_stderr || level[0] == 'E')) {
            std::cerr << line << "\n";
        }
    }
};
