#ifndef MONITOR_CONFIG_H
#define MONITOR_CONFIG_H

#include <cstdint>
#include <set>
#include <string>

/**
 * @brief Process-wide monitoring configuration.
 *
 * Set once at startup. Changing the smoothing parameters of a running
 * session without calling MonitoringSession::reset() leaves windows sized
 * for the old values.
 */
struct MonitorConfig {
    // Detection vocabulary and thresholds
    int allowedPersons = 1;
    float minPersonScore = 0.55f;
    float minDeviceScore = 0.60f;
    std::set<std::string> deviceClassNames = {"cell phone"};

    // Temporal smoothing
    int smoothingWindowLength = 12;
    double triggerRatio = 0.35;
    int64_t cooldownMs = 4000;

    // Drop boxes smaller than this fraction of the frame (0.4%)
    double minBoxAreaRatio = 0.004;
    int64_t cacheFreshnessMs = 300;

    // Detector
    std::string modelPath = "models/ssd_mobilenet_v2_coco_quant_postprocess_edgetpu.tflite";
    std::string labelsPath = "models/coco_labels.txt";
    float detectorMinScore = 0.5f;
    int maxDetections = 20;
    bool forceCPU = false;

    // Driver
    std::string source = "0";
    int64_t monitorIntervalMs = 2000;
    int maxViolations = 5;
    std::string logDir = "logs";
    std::string journalPath = "output/violations.jsonl";
    bool display = true;
    bool showHelp = false;

    /**
     * @brief Check every field against its admissible range
     * @throws std::invalid_argument naming the first offending option
     */
    void validate() const;
};

/**
 * @brief Parse command line options on top of the defaults
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration (not yet validated)
 * @throws std::invalid_argument on unknown options or malformed numbers
 */
MonitorConfig parseArgs(int argc, char** argv);

/**
 * @brief Split a comma-separated class list, trimming and lower-casing each name
 */
std::set<std::string> parseClassList(const std::string& list);

std::string toLower(const std::string& s);

void printUsage(const char* programName);

#endif // MONITOR_CONFIG_H
