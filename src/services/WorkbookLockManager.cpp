#include "services/WorkbookLockManager.h"
#include <QDebug>
#include <algorithm>

namespace SheetCalc {

namespace {
// Cancellation is noticed within one slice
constexpr std::chrono::milliseconds kWaitSlice{20};
}

WorkbookLockManager::Guard::Guard(Guard &&other) noexcept
    : m_mutex(std::move(other.m_mutex))
{
    other.m_mutex.reset();
}

WorkbookLockManager::Guard &WorkbookLockManager::Guard::operator=(Guard &&other) noexcept
{
    if (this != &other) {
        release();
        m_mutex = std::move(other.m_mutex);
        other.m_mutex.reset();
    }
    return *this;
}

WorkbookLockManager::Guard::~Guard()
{
    release();
}

void WorkbookLockManager::Guard::release()
{
    if (m_mutex) {
        m_mutex->unlock();
        m_mutex.reset();
    }
}

std::shared_ptr<std::timed_mutex> WorkbookLockManager::mutexFor(const QString &workbookId)
{
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_locks.find(workbookId);
    if (it != m_locks.end())
        return it.value();
    auto mutex = std::make_shared<std::timed_mutex>();
    m_locks.insert(workbookId, mutex);
    return mutex;
}

bool WorkbookLockManager::acquire(const QString &workbookId, std::chrono::milliseconds timeout,
                                  const CancellationToken *cancel, Guard *guard,
                                  CalcError *error)
{
    if (cancel && cancel->isCancelled()) {
        return fail(error, ErrorCode::Cancelled,
                    QString("Cancelled before acquiring the lock for '%1'").arg(workbookId),
                    {workbookId});
    }

    std::shared_ptr<std::timed_mutex> mutex = mutexFor(workbookId);
    const bool unlimited = timeout.count() < 0;
    const auto deadline = std::chrono::steady_clock::now() + (unlimited ? kWaitSlice : timeout);

    for (;;) {
        auto slice = kWaitSlice;
        if (!unlimited) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            slice = std::max(std::chrono::milliseconds(0), std::min(slice, left));
        }

        if (mutex->try_lock_for(slice)) {
            if (cancel && cancel->isCancelled()) {
                mutex->unlock();
                return fail(error, ErrorCode::Cancelled,
                            QString("Cancelled before acquiring the lock for '%1'").arg(workbookId),
                            {workbookId});
            }
            if (guard)
                *guard = Guard(mutex);
            else
                mutex->unlock();
            return true;
        }

        if (cancel && cancel->isCancelled()) {
            qDebug() << "[LockManager] Wait for" << workbookId << "cancelled";
            return fail(error, ErrorCode::Cancelled,
                        QString("Cancelled while waiting for the lock on '%1'").arg(workbookId),
                        {workbookId});
        }

        if (!unlimited && std::chrono::steady_clock::now() >= deadline) {
            qWarning() << "[LockManager] Timed out after" << timeout.count()
                       << "ms waiting for" << workbookId;
            return fail(error, ErrorCode::LockTimeout,
                        QString("Timed out after %1 ms waiting for workbook '%2'")
                            .arg(timeout.count()).arg(workbookId),
                        {workbookId});
        }
    }
}

int WorkbookLockManager::lockCount() const
{
    std::lock_guard<std::mutex> lock(m_mapMutex);
    return m_locks.size();
}

} // namespace SheetCalc
