#include "ConfirmationGate.h"

#include <QDebug>

#include "../common/Utils.h"

ConfirmationGate::ConfirmationGate(int holdMs, QObject *parent)
    : QObject(parent)
{
    timer_.setSingleShot(true);
    timer_.setInterval(holdMs);

    connect(&timer_, &QTimer::timeout,
            this, &ConfirmationGate::onHoldElapsed);
}

void ConfirmationGate::submit(const RawCandidate &candidate)
{
    const bool wasPending = pending_.has_value();

    if (wasPending)
    {
        qDebug() << "[Gate]" << Utils::answerKey(pending_->value)
                 << "replaced by" << Utils::answerKey(candidate.value);
    }

    pending_ = candidate;

    // start() on a running timer stops it first, so the old hold never fires
    timer_.start();

    if (!wasPending)
        emit pendingChanged(true);
}

void ConfirmationGate::cancel()
{
    timer_.stop();

    if (!pending_)
        return;

    qDebug() << "[Gate] cancelled pending" << Utils::answerKey(pending_->value);
    pending_.reset();
    emit pendingChanged(false);
}

void ConfirmationGate::onHoldElapsed()
{
    if (!pending_)
        return;

    FinalSignal result;
    result.value = pending_->value;
    result.gesture = pending_->gesture;
    result.timestampMs = pending_->timestampMs;

    pending_.reset();
    emit pendingChanged(false);
    emit finalized(result);
}
