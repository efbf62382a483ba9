#ifndef WORKBOOK_LOCK_MANAGER_H
#define WORKBOOK_LOCK_MANAGER_H

#include "core/CalcError.h"
#include <QHash>
#include <QString>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace SheetCalc {

/**
 * @brief Shared flag a caller sets to abandon an execute() still waiting
 *        for its workbook lock
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/**
 * @brief One exclusive lock per workbook id
 *
 * Different workbooks never contend. Locks are created on first use and
 * live as long as the manager.
 */
class WorkbookLockManager {
public:
    // Held lock; released on destruction
    class Guard {
    public:
        Guard() = default;
        Guard(Guard &&other) noexcept;
        Guard &operator=(Guard &&other) noexcept;
        ~Guard();

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        bool ownsLock() const { return m_mutex != nullptr; }
        void release();

    private:
        friend class WorkbookLockManager;
        explicit Guard(std::shared_ptr<std::timed_mutex> mutex) : m_mutex(std::move(mutex)) {}

        std::shared_ptr<std::timed_mutex> m_mutex;
    };

    static constexpr std::chrono::milliseconds kWaitForever{-1};

    /**
     * @brief Acquire the workbook's lock
     *
     * Waits at most `timeout` (negative = no limit), polling `cancel` while
     * waiting. Fails with LockTimeout or Cancelled; in both cases nothing is
     * held.
     */
    bool acquire(const QString &workbookId, std::chrono::milliseconds timeout,
                 const CancellationToken *cancel, Guard *guard, CalcError *error = nullptr);

    int lockCount() const;

private:
    std::shared_ptr<std::timed_mutex> mutexFor(const QString &workbookId);

    mutable std::mutex m_mapMutex;
    QHash<QString, std::shared_ptr<std::timed_mutex>> m_locks;
};

} // namespace SheetCalc

#endif // WORKBOOK_LOCK_MANAGER_H
