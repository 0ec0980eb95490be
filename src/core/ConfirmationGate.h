#pragma once
#include <QObject>
#include <QTimer>

#include <optional>

#include "../common/Types.h"

/**
 * ConfirmationGate
 * --------------------
 * Holds the latest raw candidate for a fixed window before it becomes a
 * final answer. A new submit() replaces the held candidate and restarts
 * the window; cancel() drops it silently.
 */

class ConfirmationGate : public QObject
{
    Q_OBJECT
public:
    explicit ConfirmationGate(int holdMs, QObject *parent = nullptr);

    void submit(const RawCandidate &candidate);
    void cancel();

    bool hasPending() const { return pending_.has_value(); }
    std::optional<RawCandidate> pending() const { return pending_; }
    int holdMs() const { return timer_.interval(); }

signals:
    void finalized(const FinalSignal &result);
    void pendingChanged(bool pending);

private slots:
    void onHoldElapsed();

private:
    QTimer timer_;
    std::optional<RawCandidate> pending_;
};
