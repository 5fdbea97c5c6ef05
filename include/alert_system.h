#ifndef ALERT_SYSTEM_H
#define ALERT_SYSTEM_H

#include <memory>
#include <string>
#include <vector>
#include "detection_types.h"

enum class WarningLevel {
    Notice,
    Serious,
    Final,
    Terminated
};

const char* warningLevelName(WarningLevel level);

/**
 * @brief Outbound notification channel (console, mail relay, ...)
 */
class AlertNotifier {
public:
    virtual ~AlertNotifier() = default;
    virtual void notify(WarningLevel level, const std::string& message) = 0;
};

/**
 * @brief Prints notifications to stdout
 */
class ConsoleNotifier : public AlertNotifier {
public:
    void notify(WarningLevel level, const std::string& message) override;
};

/**
 * @brief What the session policy made of one alert
 */
struct AlertDecision {
    ViolationAlert alert;
    int violationCount = 0;
    WarningLevel level = WarningLevel::Notice;
    std::string notification;
};

/**
 * @brief Session policy over the alert stream: counts violations, escalates
 *        warnings and ends the session at the configured maximum.
 */
class AlertSystem {
public:
    explicit AlertSystem(int maxViolations);
    ~AlertSystem() = default;

    void addNotifier(std::shared_ptr<AlertNotifier> notifier);

    /**
     * @brief Count a batch of alerts and notify for each one.
     *
     * Alerts arriving after termination are ignored.
     * @param alerts Alerts of one tick, in emission order
     * @return One decision per accepted alert
     */
    std::vector<AlertDecision> process(const std::vector<ViolationAlert>& alerts);

    /**
     * @brief Escalation level for a running count
     */
    WarningLevel levelFor(int violationCount) const;

    int getViolationCount() const { return violationCount; }
    int getMaxViolations() const { return maxViolations; }
    int remaining() const { return maxViolations > violationCount ? maxViolations - violationCount : 0; }
    bool isTerminated() const { return violationCount >= maxViolations; }

    // Full history of accepted alerts
    const std::vector<ViolationAlert>& getAlertLog() const { return alertLog; }

private:
    void dispatch(WarningLevel level, const std::string& message);

    int maxViolations;
    int violationCount;
    std::vector<ViolationAlert> alertLog;
    std::vector<std::shared_ptr<AlertNotifier>> notifiers;
};

#endif // ALERT_SYSTEM_H
