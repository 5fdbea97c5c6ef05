#include "logger.h"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "utils.h"

namespace fs = std::filesystem;

Logger::Logger(const std::string& logDir, bool echoToConsole)
    : logDir(logDir), echoToConsole(echoToConsole) {
    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logDir << ": " << ec.message() << std::endl;
    }

    logFile = logDir + "/monitor_log_" + formatLocalTime("%Y%m%d_%H%M%S") + ".log";
    logStream.open(logFile, std::ios::out | std::ios::app);
    if (!logStream.is_open()) {
        std::cerr << "Could not open log file " << logFile << ", logging to console only" << std::endl;
    }
}

Logger::~Logger() {
    if (logStream.is_open()) {
        logStream.close();
    }
}

void Logger::write(const std::string& entry, bool echo) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::string line = formatLocalTime("%Y-%m-%d %H:%M:%S") + " - " + entry;

    if (logStream.is_open()) {
        logStream << line << std::endl;
    }
    if (echo && echoToConsole) {
        std::cout << line << std::endl;
    }
}

void Logger::logAlert(const ViolationAlert& alert, int violationCount, int maxViolations) {
    std::stringstream ss;
    ss << "ALERT " << violationKindName(alert.kind) << ": " << alert.message
       << " (Confidence: " << std::fixed << std::setprecision(2) << alert.confidence
       << ", Violation " << violationCount << "/" << maxViolations << ")";
    write(ss.str(), true);
}

void Logger::logSnapshot(const DetectionSnapshot& snapshot) {
    std::stringstream ss;
    ss << "Snapshot: persons=" << snapshot.personCount
       << ", device=" << (snapshot.deviceDetected ? "yes" : "no")
       << ", confidence=" << std::fixed << std::setprecision(2) << snapshot.confidence
       << ", objects=" << snapshot.objects.size();
    write(ss.str(), false);
}

void Logger::logPerformance(double fps, double processingTimeMs) {
    std::stringstream ss;
    ss << "Performance: Ticks/s: " << std::fixed << std::setprecision(2) << fps
       << ", Processing time: " << processingTimeMs << "ms";
    write(ss.str(), false);
}

void Logger::logEvent(const std::string& message) {
    write(message, true);
}
