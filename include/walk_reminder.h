#ifndef WALKAWARE_WALK_REMINDER_H
#define WALKAWARE_WALK_REMINDER_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"
#include "walk_store.h"
#include "walk_detector.h"

/**
 * @brief "Time for a walk" reminder
 *
 * Every REMINDER_CHECK_INTERVAL_MS, while reminders are enabled and no
 * walk is in progress, checks whether the last walk ended at least
 * `hours` ago. Fires at most once per last walk; the walk id that fired
 * is held in RAM only, so a reboot may remind again.
 */
class WalkReminder {
public:
    /**
     * @param store Source of settings and walk history
     * @param detector Source of walking state
     */
    WalkReminder(const WalkStore* store, const WalkDetector* detector);

    /**
     * @brief Run the periodic check (call every loop)
     *
     * The first check happens one interval after the first call.
     *
     * @param nowMs Current millis()
     * @param epochMs Current epoch ms (0 = wall clock unknown, skip)
     * @return true if the reminder fired on this call
     */
    bool update(uint32_t nowMs, uint64_t epochMs);

    /**
     * @brief Check immediately, ignoring the interval
     *
     * @return true if the reminder fired
     */
    bool check(uint64_t epochMs);

    /**
     * @brief Format the reminder text
     */
    void formatMessage(char* buffer, size_t size) const;

    /** Id of the walk the last reminder was for ("" if none). */
    const char* getNotifiedWalkId() const { return m_notifiedWalkId; }

    uint32_t getReminderCount() const { return m_reminderCount; }

private:
    const WalkStore* m_store;
    const WalkDetector* m_detector;

    bool m_started;                             ///< First update() seen
    uint32_t m_lastCheckMs;                     ///< millis() of last periodic check
    char m_notifiedWalkId[WALK_ID_MAX_LEN];     ///< Walk already reminded about
    uint32_t m_reminderCount;
};

#endif // WALKAWARE_WALK_REMINDER_H
