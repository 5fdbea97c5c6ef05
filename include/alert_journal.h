#ifndef ALERT_JOURNAL_H
#define ALERT_JOURNAL_H

#include <mutex>
#include <string>
#include "alert_system.h"

/**
 * @brief Appends accepted alerts to a JSON Lines file
 */
class AlertJournal {
public:
    explicit AlertJournal(const std::string& path);

    /**
     * @brief Append one line for the decision
     * @return False if the file could not be written
     */
    bool append(const AlertDecision& decision);

    const std::string& getPath() const { return path; }

    /**
     * @brief JSON object for one decision, without a trailing newline
     */
    static std::string toJson(const AlertDecision& decision);

private:
    std::string path;
    std::mutex mu;
};

#endif // ALERT_JOURNAL_H
