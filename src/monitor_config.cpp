#include "monitor_config.h"

#include <algorithm>
#include <cctype>
#include <getopt.h>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

float parseFloat(const char* value, const std::string& option) {
    try {
        size_t used = 0;
        float parsed = std::stof(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + option + ": expected a number, got '" + value + "'");
    }
}

double parseDouble(const char* value, const std::string& option) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + option + ": expected a number, got '" + value + "'");
    }
}

int64_t parseInt(const char* value, const std::string& option) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + option + ": expected an integer, got '" + value + "'");
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

std::string toLower(const std::string& s) {
    std::string lowered = s;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::set<std::string> parseClassList(const std::string& list) {
    std::set<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            names.insert(toLower(item));
        }
    }
    return names;
}

void MonitorConfig::validate() const {
    require(allowedPersons >= 0, "--allowed-persons must be >= 0");
    require(minPersonScore >= 0.0f && minPersonScore <= 1.0f, "--min-person-score must be in [0, 1]");
    require(minDeviceScore >= 0.0f && minDeviceScore <= 1.0f, "--min-device-score must be in [0, 1]");
    require(!deviceClassNames.empty(), "--device-classes must name at least one class");
    require(deviceClassNames.count("person") == 0, "--device-classes must not contain 'person'");
    require(smoothingWindowLength >= 1, "--window must be >= 1");
    require(triggerRatio > 0.0 && triggerRatio <= 1.0, "--trigger-ratio must be in (0, 1]");
    require(cooldownMs >= 0, "--cooldown-ms must be >= 0");
    require(minBoxAreaRatio >= 0.0 && minBoxAreaRatio < 1.0, "--min-box-area must be in [0, 1)");
    require(cacheFreshnessMs >= 0, "--cache-ms must be >= 0");
    require(detectorMinScore >= 0.0f && detectorMinScore <= 1.0f, "--detector-min-score must be in [0, 1]");
    require(maxDetections >= 1, "--max-detections must be >= 1");
    require(monitorIntervalMs > 0, "--interval-ms must be > 0");
    require(maxViolations >= 1, "--max-violations must be >= 1");
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -m, --model PATH             TFLite detection model" << std::endl;
    std::cout << "  -l, --labels PATH            Labels file" << std::endl;
    std::cout << "  -s, --source SOURCE          Camera index or video file (default: 0)" << std::endl;
    std::cout << "  -c, --force-cpu              Force CPU mode (no TPU)" << std::endl;
    std::cout << "  -n, --no-display             Disable preview window" << std::endl;
    std::cout << "      --allowed-persons N      Persons allowed in view (default: 1)" << std::endl;
    std::cout << "      --min-person-score F     Person score threshold (default: 0.55)" << std::endl;
    std::cout << "      --min-device-score F     Device score threshold (default: 0.60)" << std::endl;
    std::cout << "      --device-classes LIST    Comma-separated device labels (default: cell phone)" << std::endl;
    std::cout << "      --window N               Smoothing window length (default: 12)" << std::endl;
    std::cout << "      --trigger-ratio F        Fraction of window that triggers (default: 0.35)" << std::endl;
    std::cout << "      --cooldown-ms MS         Per-kind alert cooldown (default: 4000)" << std::endl;
    std::cout << "      --min-box-area F         Minimum box/frame area ratio (default: 0.004)" << std::endl;
    std::cout << "      --cache-ms MS            Prediction reuse window (default: 300)" << std::endl;
    std::cout << "      --detector-min-score F   Detector score floor (default: 0.5)" << std::endl;
    std::cout << "      --max-detections N       Boxes kept per frame (default: 20)" << std::endl;
    std::cout << "      --interval-ms MS         Monitoring tick interval (default: 2000)" << std::endl;
    std::cout << "      --max-violations N       Violations before termination (default: 5)" << std::endl;
    std::cout << "      --log-dir DIR            Log directory (default: logs)" << std::endl;
    std::cout << "      --journal PATH           Alert journal (default: output/violations.jsonl)" << std::endl;
    std::cout << "  -h, --help                   Show this help message" << std::endl;
}

MonitorConfig parseArgs(int argc, char** argv) {
    MonitorConfig config;

    enum LongOnly {
        kAllowedPersons = 1000,
        kMinPersonScore,
        kMinDeviceScore,
        kDeviceClasses,
        kWindow,
        kTriggerRatio,
        kCooldownMs,
        kMinBoxArea,
        kCacheMs,
        kDetectorMinScore,
        kMaxDetections,
        kIntervalMs,
        kMaxViolations,
        kLogDir,
        kJournal
    };

    static struct option long_options[] = {
        {"model", required_argument, 0, 'm'},
        {"labels", required_argument, 0, 'l'},
        {"source", required_argument, 0, 's'},
        {"force-cpu", no_argument, 0, 'c'},
        {"no-display", no_argument, 0, 'n'},
        {"help", no_argument, 0, 'h'},
        {"allowed-persons", required_argument, 0, kAllowedPersons},
        {"min-person-score", required_argument, 0, kMinPersonScore},
        {"min-device-score", required_argument, 0, kMinDeviceScore},
        {"device-classes", required_argument, 0, kDeviceClasses},
        {"window", required_argument, 0, kWindow},
        {"trigger-ratio", required_argument, 0, kTriggerRatio},
        {"cooldown-ms", required_argument, 0, kCooldownMs},
        {"min-box-area", required_argument, 0, kMinBoxArea},
        {"cache-ms", required_argument, 0, kCacheMs},
        {"detector-min-score", required_argument, 0, kDetectorMinScore},
        {"max-detections", required_argument, 0, kMaxDetections},
        {"interval-ms", required_argument, 0, kIntervalMs},
        {"max-violations", required_argument, 0, kMaxViolations},
        {"log-dir", required_argument, 0, kLogDir},
        {"journal", required_argument, 0, kJournal},
        {0, 0, 0, 0}
    };

    // Full rescan so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "m:l:s:cnh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'm':
                config.modelPath = optarg;
                break;
            case 'l':
                config.labelsPath = optarg;
                break;
            case 's':
                config.source = optarg;
                break;
            case 'c':
                config.forceCPU = true;
                break;
            case 'n':
                config.display = false;
                break;
            case 'h':
                config.showHelp = true;
                break;
            case kAllowedPersons:
                config.allowedPersons = static_cast<int>(parseInt(optarg, "allowed-persons"));
                break;
            case kMinPersonScore:
                config.minPersonScore = parseFloat(optarg, "min-person-score");
                break;
            case kMinDeviceScore:
                config.minDeviceScore = parseFloat(optarg, "min-device-score");
                break;
            case kDeviceClasses:
                config.deviceClassNames = parseClassList(optarg);
                break;
            case kWindow:
                config.smoothingWindowLength = static_cast<int>(parseInt(optarg, "window"));
                break;
            case kTriggerRatio:
                config.triggerRatio = parseDouble(optarg, "trigger-ratio");
                break;
            case kCooldownMs:
                config.cooldownMs = parseInt(optarg, "cooldown-ms");
                break;
            case kMinBoxArea:
                config.minBoxAreaRatio = parseDouble(optarg, "min-box-area");
                break;
            case kCacheMs:
                config.cacheFreshnessMs = parseInt(optarg, "cache-ms");
                break;
            case kDetectorMinScore:
                config.detectorMinScore = parseFloat(optarg, "detector-min-score");
                break;
            case kMaxDetections:
                config.maxDetections = static_cast<int>(parseInt(optarg, "max-detections"));
                break;
            case kIntervalMs:
                config.monitorIntervalMs = parseInt(optarg, "interval-ms");
                break;
            case kMaxViolations:
                config.maxViolations = static_cast<int>(parseInt(optarg, "max-violations"));
                break;
            case kLogDir:
                config.logDir = optarg;
                break;
            case kJournal:
                config.journalPath = optarg;
                break;
            default:
                throw std::invalid_argument(std::string("Unknown or incomplete option: ") +
                                            (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }

    return config;
}
