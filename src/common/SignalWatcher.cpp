#include "SignalWatcher.hpp"

#include <atomic>
#include <csignal>

namespace sbr {

    namespace {

        std::atomic<int> g_pendingSignal{0};

        void onSignal(int signalNumber) {
            g_pendingSignal.store(signalNumber);
        }

    } // namespace

    SignalWatcher::SignalWatcher(QObject* parent) : QObject(parent) {
        m_pollTimer.setInterval(200);
        connect(&m_pollTimer, &QTimer::timeout, this, [this]() {
            const int signalNumber = g_pendingSignal.exchange(0);
            if (signalNumber != 0) {
                emit terminationRequested(signalNumber);
            }
        });
    }

    bool SignalWatcher::install() {
        if (std::signal(SIGINT, onSignal) == SIG_ERR || std::signal(SIGTERM, onSignal) == SIG_ERR) {
            return false;
        }
        m_pollTimer.start();
        return true;
    }

} // namespace sbr
