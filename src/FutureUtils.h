#pragma once

#include <QFuture>
#include <QFutureWatcher>
#include <QObject>
#include <QPromise>
#include <utility>

// Small helpers over QFuture so async collaborators read the same everywhere.
// Results are always delivered through the watcher's queued signals, never inline.

template <typename T>
QFuture<T> makeReadyFuture(T value) {
    QPromise<T> promise;
    QFuture<T> future = promise.future();
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return future;
}

// Calls fn(result) in context's thread once future finishes. A future that finishes
// without a result hands a default constructed T. The call is dropped if context dies.
template <typename T, typename Fn>
void onFinished(const QFuture<T> &future, QObject *context, Fn fn) {
    auto *watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcher<T>::finished, context,
                     [watcher, fn = std::move(fn)]() mutable {
                         const QFuture<T> done = watcher->future();
                         watcher->deleteLater();
                         if (done.resultCount() > 0) {
                             fn(done.result());
                         } else {
                             fn(T());
                         }
                     });
    watcher->setFuture(future);
}

// Forwards progress of future (in its own progress range) as a 0..1 ratio.
template <typename T, typename Fn>
void onProgress(const QFuture<T> &future, QObject *context, Fn fn) {
    auto *watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcher<T>::progressValueChanged, context,
                     [watcher, fn](int value) {
                         const int lo = watcher->progressMinimum();
                         const int hi = watcher->progressMaximum();
                         if (hi <= lo) {
                             return;
                         }
                         fn(static_cast<float>(value - lo) / static_cast<float>(hi - lo));
                     });
    QObject::connect(watcher, &QFutureWatcher<T>::finished, watcher, &QObject::deleteLater);
    watcher->setFuture(future);
}
