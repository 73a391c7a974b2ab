#pragma once

#include <QObject>
#include <QTimer>

namespace sbr {

    // Turns SIGINT/SIGTERM into a Qt signal on the event loop thread.
    // The POSIX handler only flips an atomic flag; a timer polls it.
    class SignalWatcher : public QObject {
        Q_OBJECT

      public:
        explicit SignalWatcher(QObject* parent = nullptr);

        // False when the handlers could not be installed
        [[nodiscard]] bool install();

      signals:
        void terminationRequested(int signalNumber);

      private:
        QTimer m_pollTimer;
    };

} // namespace sbr
