#include "alert_journal.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string escapeJson(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

} // namespace

AlertJournal::AlertJournal(const std::string& path) : path(path) {}

std::string AlertJournal::toJson(const AlertDecision& decision) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"" << violationKindName(decision.alert.kind) << "\",";
    oss << "\"message\":\"" << escapeJson(decision.alert.message) << "\",";
    oss << "\"timestamp\":" << decision.alert.timestampMs << ",";
    oss << "\"confidence\":" << std::fixed << std::setprecision(3) << decision.alert.confidence << ",";
    oss << "\"violation_count\":" << decision.violationCount << ",";
    oss << "\"level\":\"" << warningLevelName(decision.level) << "\"";
    oss << "}";
    return oss.str();
}

bool AlertJournal::append(const AlertDecision& decision) {
    std::string line = toJson(decision);

    std::lock_guard<std::mutex> lock(mu);
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[WARN] Unable to create journal directory " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream f(path, std::ios::app);
    if (!f) {
        std::cerr << "[WARN] Unable to open alert journal: " << path << std::endl;
        return false;
    }
    f << line << "\n";
    return static_cast<bool>(f);
}
