#pragma once
#include <fstream>
#include <sstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <string>
#include <ctime>
#include <atomic>

namespace PeerBeam {

    class Logger {
    public:
        static Logger& Instance() {
            static Logger instance;
            return instance;
        }

        // Opens (appends to) a log file in addition to the console sink.
        bool Initialize(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_File.is_open()) m_File.close();
            m_File.open(filePath, std::ios::app);
            return m_File.is_open();
        }

        void SetConsole(bool enabled) { m_Console.store(enabled, std::memory_order_relaxed); }
        void SetVerbose(bool enabled) { m_Verbose.store(enabled, std::memory_order_relaxed); }
        bool IsVerbose() const { return m_Verbose.load(std::memory_order_relaxed); }

        void Log(const std::string& prefix, const std::string& message) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            struct tm localTime {};
#ifdef _WIN32
            localtime_s(&localTime, &time);
#else
            localtime_r(&time, &localTime);
#endif
            std::stringstream ss;
            ss << std::put_time(&localTime, "%H:%M:%S")
               << "." << std::setfill('0') << std::setw(3) << ms.count()
               << " [" << prefix << "] " << message << "\n";
            const std::string line = ss.str();

            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_Console.load(std::memory_order_relaxed)) std::cerr << line;
            if (m_File.is_open()) {
                m_File << line;
                m_File.flush();
            }
        }

        void Debug(const std::string& prefix, const std::string& message) {
            if (IsVerbose()) Log(prefix, message);
        }

        void Shutdown() {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_File.is_open()) m_File.close();
        }

    private:
        Logger() = default;
        ~Logger() { Shutdown(); }
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        std::ofstream     m_File;
        std::mutex        m_Mutex;
        std::atomic<bool> m_Console{ true };
        std::atomic<bool> m_Verbose{ false };
    };

} // namespace PeerBeam

#define LOG_INFO(msg)      PeerBeam::Logger::Instance().Log("INFO", msg)
#define LOG_WARN(msg)      PeerBeam::Logger::Instance().Log("WARN", msg)
#define LOG_ERROR(msg)     PeerBeam::Logger::Instance().Log("ERROR", msg)
#define LOG_DEBUG(msg)     PeerBeam::Logger::Instance().Debug("DEBUG", msg)
#define LOG_SIGNAL(msg)    PeerBeam::Logger::Instance().Log("SIGNAL", msg)
#define LOG_NEGOTIATE(msg) PeerBeam::Logger::Instance().Log("NEGOTIATE", msg)
#define LOG_TRANSFER(msg)  PeerBeam::Logger::Instance().Log("TRANSFER", msg)
