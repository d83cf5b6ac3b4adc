#pragma once

#include "storage/database.hpp"
#include <QObject>

namespace sparkle::storage {

/**
 * ChangeNotifier - Re-emits committed table changes as Qt signals.
 *
 * Attach it to a Database with attach(); signals are emitted on the thread
 * that committed, once per commit.
 */
class ChangeNotifier : public QObject {
    Q_OBJECT

public:
    explicit ChangeNotifier(QObject* parent = nullptr)
        : QObject(parent) {}

    void attach(Database& db);

    void publish(Table tables);

signals:
    // Bitmask of storage::Table values changed by one commit.
    void tablesChanged(unsigned tables);
    void themesChanged();
    void inspirationsChanged();
};

} // namespace sparkle::storage
