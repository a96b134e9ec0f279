#pragma once

#include <QString>
#include <optional>

#include "PadTypes.h"

// Record of a pad swap in progress, written before the first store write and
// removed once the swap has finished or been rolled back. A record left on
// disk means the previous session died mid-swap.
class SwapJournal {
public:
    struct Record {
        PadAddress from;
        PadAddress to;
        std::optional<PadConfiguration> fromSnapshot;
        std::optional<PadConfiguration> toSnapshot;
        int completedSteps = 0;
    };

    // An empty path disables the journal.
    explicit SwapJournal(const QString &path = QString());

    bool isEnabled() const { return !m_path.isEmpty(); }
    QString path() const { return m_path; }
    bool exists() const;

    bool write(const Record &record, QString *errorText = nullptr);
    std::optional<Record> read(QString *errorText = nullptr) const;
    bool remove();

private:
    QString m_path;
};
