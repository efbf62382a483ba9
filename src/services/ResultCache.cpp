#include "services/ResultCache.h"
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <mutex>

namespace SheetCalc {

ResultCache::ResultCache(std::chrono::milliseconds ttl)
    : m_ttl(ttl)
{
    m_cache.reserve(64);
}

QString ResultCache::makeKey(const QString &calculator, const QMap<QString, CellValue> &inputs) {
    QJsonArray parts;
    parts.append(calculator);
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {  // QMap: sorted by name
        parts.append(it.key());
        parts.append(it.value().canonicalString());
    }
    return QString::fromUtf8(QJsonDocument(parts).toJson(QJsonDocument::Compact));
}

bool ResultCache::isExpired(const CachedResult &entry,
                            std::chrono::steady_clock::time_point now) const {
    return now - entry.timestamp >= m_ttl;
}

std::optional<CalculationResult> ResultCache::lookup(const QString &key) {
    const auto now = std::chrono::steady_clock::now();
    bool expired = false;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_cache.constFind(key);
        if (it != m_cache.constEnd()) {
            if (!isExpired(it.value(), now)) {
                ++m_hits;
                CalculationResult result = it->result;
                result.fromCache = true;
                return result;
            }
            expired = true;
        }
    }

    if (expired) {
        std::unique_lock lock(m_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end() && isExpired(it.value(), now)) {
            m_cache.erase(it);
            ++m_evictions;
        }
    }
    ++m_misses;
    return std::nullopt;
}

void ResultCache::store(const QString &key, const QString &workbookKey,
                        const CalculationResult &result, const QSet<CellAddress> &dependsOn) {
    std::unique_lock lock(m_mutex);
    if (m_ttl.count() <= 0)
        return;
    CachedResult entry;
    entry.result = result;
    entry.result.fromCache = false;
    entry.workbookKey = workbookKey;
    entry.dependsOn = dependsOn;
    entry.timestamp = std::chrono::steady_clock::now();
    m_cache.insert(key, entry);
    ++m_stores;
}

int ResultCache::invalidateWorkbook(const QString &workbookKey) {
    std::unique_lock lock(m_mutex);
    int removed = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it->workbookKey == workbookKey) {
            it = m_cache.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_evictions += removed;
    if (removed > 0)
        qDebug() << "[ResultCache] Invalidated" << removed << "entries for" << workbookKey;
    return removed;
}

int ResultCache::invalidateCells(const QString &workbookKey, const QSet<CellAddress> &written) {
    if (written.isEmpty())
        return 0;
    std::unique_lock lock(m_mutex);
    int removed = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it->workbookKey == workbookKey && it->dependsOn.intersects(written)) {
            it = m_cache.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_evictions += removed;
    if (removed > 0)
        qDebug() << "[ResultCache] Invalidated" << removed << "entries reading cells written in" << workbookKey;
    return removed;
}

int ResultCache::clearStale() {
    std::unique_lock lock(m_mutex);
    const auto now = std::chrono::steady_clock::now();
    int removed = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (isExpired(it.value(), now)) {
            it = m_cache.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_evictions += removed;
    if (removed > 0)
        qDebug() << "[ResultCache] Cleared" << removed << "stale results";
    return removed;
}

void ResultCache::clear() {
    std::unique_lock lock(m_mutex);
    const int count = m_cache.size();
    m_cache.clear();
    m_evictions += count;
    qDebug() << "[ResultCache] Cleared all cached results (" << count << "items)";
}

int ResultCache::size() const {
    std::shared_lock lock(m_mutex);
    return m_cache.size();
}

ResultCache::Stats ResultCache::stats() const {
    Stats s;
    s.hits = m_hits.load();
    s.misses = m_misses.load();
    s.stores = m_stores.load();
    s.evictions = m_evictions.load();
    s.size = size();
    return s;
}

void ResultCache::setTtl(std::chrono::milliseconds ttl) {
    std::unique_lock lock(m_mutex);
    m_ttl = ttl;
}

std::chrono::milliseconds ResultCache::ttl() const {
    std::shared_lock lock(m_mutex);
    return m_ttl;
}

} // namespace SheetCalc
