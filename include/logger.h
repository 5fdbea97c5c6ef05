#ifndef LOGGER_H
#define LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include "detection_types.h"

/**
 * @brief Logger class to record alerts, snapshots and performance metrics
 */
class Logger {
public:
    /**
     * @brief Open a timestamped log file inside logDir (created if missing)
     * @param logDir Log directory
     * @param echoToConsole Mirror alert and event lines to stdout
     */
    explicit Logger(const std::string& logDir = "logs", bool echoToConsole = true);
    ~Logger();

    /**
     * @brief Log a violation alert
     * @param alert Alert to record
     * @param violationCount Running count including this alert
     * @param maxViolations Count at which the session ends
     */
    void logAlert(const ViolationAlert& alert, int violationCount, int maxViolations);

    // File only
    void logSnapshot(const DetectionSnapshot& snapshot);

    /**
     * @brief Log performance metrics (file only)
     * @param fps Current tick rate
     * @param processingTimeMs Duration of the last tick in milliseconds
     */
    void logPerformance(double fps, double processingTimeMs);

    void logEvent(const std::string& message);

    const std::string& getLogFile() const { return logFile; }

private:
    void write(const std::string& entry, bool echo);

    std::string logDir;
    std::string logFile;
    std::ofstream logStream;
    std::mutex logMutex;
    bool echoToConsole;
};

#endif // LOGGER_H
