#include "alert_system.h"
#include <algorithm>
#include <iostream>

const char* warningLevelName(WarningLevel level) {
    switch (level) {
        case WarningLevel::Serious: return "serious";
        case WarningLevel::Final: return "final";
        case WarningLevel::Terminated: return "terminated";
        default: return "notice";
    }
}

void ConsoleNotifier::notify(WarningLevel level, const std::string& message) {
    switch (level) {
        case WarningLevel::Terminated:
            std::cout << "SESSION TERMINATED: " << message << std::endl;
            break;
        case WarningLevel::Final:
            std::cout << "FINAL WARNING: " << message << std::endl;
            break;
        case WarningLevel::Serious:
            std::cout << "SERIOUS WARNING: " << message << std::endl;
            break;
        default:
            std::cout << "ALERT: " << message << std::endl;
            break;
    }
}

AlertSystem::AlertSystem(int maxViolations)
    : maxViolations(std::max(maxViolations, 1)), violationCount(0) {
}

void AlertSystem::addNotifier(std::shared_ptr<AlertNotifier> notifier) {
    if (notifier) {
        notifiers.push_back(notifier);
    }
}

WarningLevel AlertSystem::levelFor(int count) const {
    if (count >= maxViolations) {
        return WarningLevel::Terminated;
    }
    if (count >= maxViolations - 1) {
        return WarningLevel::Final;
    }
    if (count >= maxViolations - 2) {
        return WarningLevel::Serious;
    }
    return WarningLevel::Notice;
}

std::vector<AlertDecision> AlertSystem::process(const std::vector<ViolationAlert>& alerts) {
    std::vector<AlertDecision> decisions;
    for (const auto& alert : alerts) {
        if (isTerminated()) {
            break;
        }

        violationCount++;
        alertLog.push_back(alert);

        AlertDecision decision;
        decision.alert = alert;
        decision.violationCount = violationCount;
        decision.level = levelFor(violationCount);
        decision.notification = alert.message + " (AI Violation " + std::to_string(violationCount) +
                                "/" + std::to_string(maxViolations) + ")";

        dispatch(decision.level, decision.notification);
        if (decision.level == WarningLevel::Terminated) {
            dispatch(WarningLevel::Terminated, "Session terminated - Maximum AI violations exceeded");
        }
        decisions.push_back(decision);
    }
    return decisions;
}

void AlertSystem::dispatch(WarningLevel level, const std::string& message) {
    for (const auto& notifier : notifiers) {
        try {
            notifier->notify(level, message);
        } catch (const std::exception& e) {
            std::cerr << "Notifier failed: " << e.what() << std::endl;
        }
    }
}
