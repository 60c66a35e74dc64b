#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QPointer>
#include <QMetaObject>
#include <QTimer>

#include <functional>
#include <memory>
#include <utility>

#include <rill/core/observable.hpp>
#include <rill/core/scheduler.hpp>
#include <rill/drivers/driver.hpp>

namespace rill {
namespace qt {

// ====================================================================================
// qt_executor - posts work onto the thread of a QObject (the application by default)
// ====================================================================================
class qt_executor : public executor {
public:
  explicit qt_executor(QObject* target = QCoreApplication::instance())
  : target_(target ? target : QCoreApplication::instance()) {}

  void post(std::function<void()> f) override {
    QObject* tgt = target_.data();
    // Target already destroyed: the work has nowhere to run.
    if (!tgt) return;

#if QT_VERSION >= QT_VERSION_CHECK(5, 10, 0)
    QMetaObject::invokeMethod(
      tgt,
      [fn = std::move(f)]() mutable { fn(); },
      Qt::QueuedConnection
    );
#else
    QTimer::singleShot(0, tgt, [fn = std::move(f)]() mutable { fn(); });
#endif
  }

  QObject* target() const { return target_.data(); }

private:
  QPointer<QObject> target_;
};

// ====================================================================================
// as_driver(source, fallback, QObject*) - driver whose callbacks run on target's thread
// ====================================================================================
template <class T>
inline driver<T> as_driver(observable<T> source, T fallback,
                           QObject* target = QCoreApplication::instance()) {
  return ::rill::as_driver(std::move(source), std::move(fallback),
                           std::make_shared<qt_executor>(target));
}

} // namespace qt
} // namespace rill
