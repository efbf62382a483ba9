#ifndef RESULTCACHE_H
#define RESULTCACHE_H

#include "services/CalculationResult.h"
#include <QHash>
#include <QMap>
#include <QSet>
#include <QString>
#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>

namespace SheetCalc {

/**
 * @brief Successful calculation results keyed by (calculator, canonical inputs)
 *
 * Entries expire after the configured TTL and can be dropped per backing
 * workbook when the orchestrator sees a write it did not make. A result may
 * also depend on cells its key does not fix (an optional input the caller
 * left untouched, a literal shared with another calculator); such entries
 * are dropped as soon as one of those cells is written. A TTL of zero
 * disables caching.
 *
 * Lookups take a shared lock; only store/evict take the exclusive lock.
 */
class ResultCache {
public:
    struct Stats {
        quint64 hits = 0;
        quint64 misses = 0;
        quint64 stores = 0;
        quint64 evictions = 0;
        int size = 0;
    };

    explicit ResultCache(std::chrono::milliseconds ttl = std::chrono::seconds(300));

    /**
     * @brief Canonical key: calculator name plus inputs sorted by name with
     *        typed, full-precision values (8 and "8" are different keys)
     */
    static QString makeKey(const QString &calculator, const QMap<QString, CellValue> &inputs);

    std::optional<CalculationResult> lookup(const QString &key);

    // dependsOn: cells read to produce the result whose content the key does not fix
    void store(const QString &key, const QString &workbookKey, const CalculationResult &result,
               const QSet<CellAddress> &dependsOn = QSet<CellAddress>());

    /**
     * @brief Drop every entry computed against the workbook
     * @return Number of entries removed
     */
    int invalidateWorkbook(const QString &workbookKey);

    /**
     * @brief Drop entries of the workbook that depend on any of the written cells
     * @return Number of entries removed
     */
    int invalidateCells(const QString &workbookKey, const QSet<CellAddress> &written);

    /**
     * @brief Drop expired entries
     * @return Number of entries removed
     */
    int clearStale();

    void clear();
    int size() const;
    Stats stats() const;

    void setTtl(std::chrono::milliseconds ttl);
    std::chrono::milliseconds ttl() const;

private:
    struct CachedResult {
        CalculationResult result;
        QString workbookKey;
        QSet<CellAddress> dependsOn;
        std::chrono::steady_clock::time_point timestamp;
    };

    bool isExpired(const CachedResult &entry, std::chrono::steady_clock::time_point now) const;

    QHash<QString, CachedResult> m_cache;
    mutable std::shared_mutex m_mutex;
    std::chrono::milliseconds m_ttl;

    std::atomic<quint64> m_hits{0};
    std::atomic<quint64> m_misses{0};
    std::atomic<quint64> m_stores{0};
    std::atomic<quint64> m_evictions{0};
};

} // namespace SheetCalc

#endif // RESULTCACHE_H
