#pragma once

#include "storage/change_notifier.hpp"
#include "storage/database.hpp"
#include "storage/logging.hpp"
#include "core/result.hpp"
#include <QMetaObject>
#include <functional>
#include <utility>

namespace sparkle::storage {

/**
 * LiveQuery - A restartable subscription to the result of a read.
 *
 * start() delivers the current snapshot, then a fresh snapshot after every
 * commit that touches one of the watched tables. stop() (or destruction)
 * unsubscribes. Rolled-back transactions produce nothing.
 *
 * Snapshots are fetched on the committing thread.
 */
template<typename T>
class LiveQuery {
public:
    using Fetch = std::function<Result<T, Error>()>;
    using Consumer = std::function<void(const T&)>;
    using ErrorConsumer = std::function<void(const Error&)>;

    LiveQuery(ChangeNotifier& notifier,
              Table watched,
              Fetch fetch,
              Consumer consumer,
              ErrorConsumer on_error = {})
        : notifier_(notifier)
        , watched_(watched)
        , fetch_(std::move(fetch))
        , consumer_(std::move(consumer))
        , on_error_(std::move(on_error)) {}

    ~LiveQuery() { stop(); }

    LiveQuery(const LiveQuery&) = delete;
    LiveQuery& operator=(const LiveQuery&) = delete;

    void start() {
        stop();
        connection_ = QObject::connect(
            &notifier_, &ChangeNotifier::tablesChanged, &notifier_,
            [this](unsigned tables) {
                if (contains(static_cast<Table>(tables), watched_)) {
                    refresh();
                }
            },
            Qt::DirectConnection);
        refresh();
    }

    void stop() {
        if (connection_) {
            QObject::disconnect(connection_);
            connection_ = QMetaObject::Connection{};
        }
    }

    [[nodiscard]] bool is_active() const { return static_cast<bool>(connection_); }

    /**
     * Fetch and deliver a snapshot now.
     */
    void refresh() {
        auto result = fetch_();
        if (result.is_err()) {
            qCWarning(sparkleStorageLog) << "live query fetch failed:"
                                         << result.unwrap_err().message.c_str();
            if (on_error_) on_error_(result.unwrap_err());
            return;
        }
        if (consumer_) consumer_(result.unwrap());
    }

private:
    ChangeNotifier& notifier_;
    Table watched_;
    Fetch fetch_;
    Consumer consumer_;
    ErrorConsumer on_error_;
    QMetaObject::Connection connection_;
};

} // namespace sparkle::storage
