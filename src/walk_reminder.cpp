#include "walk_reminder.h"
#include "logger.h"
#include "debug_logger.h"
#include <stdio.h>
#include <string.h>

#define MS_PER_HOUR 3600000ULL

WalkReminder::WalkReminder(const WalkStore* store, const WalkDetector* detector)
    : m_store(store)
    , m_detector(detector)
    , m_started(false)
    , m_lastCheckMs(0)
    , m_reminderCount(0)
{
    memset(m_notifiedWalkId, 0, sizeof(m_notifiedWalkId));
}

bool WalkReminder::update(uint32_t nowMs, uint64_t epochMs) {
    if (!m_started) {
        m_started = true;
        m_lastCheckMs = nowMs;
        return false;
    }

    if (nowMs - m_lastCheckMs < REMINDER_CHECK_INTERVAL_MS) {
        return false;
    }

    m_lastCheckMs = nowMs;
    return check(epochMs);
}

bool WalkReminder::check(uint64_t epochMs) {
    const NotificationSettings& settings = m_store->getNotificationSettings();
    if (!settings.enabled || m_detector->isWalking() || epochMs == 0) {
        return false;
    }

    const Walk* last = m_store->getLastWalk();
    if (!last || last->endTime == 0) {
        return false;
    }

    if (epochMs < last->endTime || epochMs - last->endTime < settings.hours * MS_PER_HOUR) {
        return false;
    }

    if (strcmp(m_notifiedWalkId, last->id) == 0) {
        return false;
    }

    snprintf(m_notifiedWalkId, sizeof(m_notifiedWalkId), "%s", last->id);
    m_reminderCount++;

    LOG_INFO("Reminder: over %u hours since walk %s", settings.hours, last->id);
    return true;
}

void WalkReminder::formatMessage(char* buffer, size_t size) const {
    if (!buffer || size == 0) {
        return;
    }

    snprintf(buffer, size, "Time for a walk! It's been over %u hours!",
             (unsigned)m_store->getNotificationSettings().hours);
}
