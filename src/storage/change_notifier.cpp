#include "storage/change_notifier.hpp"

namespace sparkle::storage {

void ChangeNotifier::attach(Database& db) {
    db.set_change_hook([this](Table tables) { publish(tables); });
}

void ChangeNotifier::publish(Table tables) {
    if (tables == Table::None) return;

    emit tablesChanged(static_cast<unsigned>(tables));
    if (contains(tables, Table::Themes)) {
        emit themesChanged();
    }
    if (contains(tables, Table::Inspirations)) {
        emit inspirationsChanged();
    }
}

} // namespace sparkle::storage
