#include "Calibrator.h"

#include <QDebug>

#include "../common/Constants.h"

Calibrator::Calibrator(int stepMs, QObject *parent)
    : QObject(parent)
{
    stepTimer_.setInterval(stepMs);
    connect(&stepTimer_, &QTimer::timeout, this, &Calibrator::onStep);
}

bool Calibrator::start()
{
    if (running_)
    {
        qWarning() << "[Calibrator] already running at" << progress_ << "%, request ignored";
        return false;
    }

    running_ = true;
    progress_ = 0;

    emit started();
    emit progressChanged(progress_);
    stepTimer_.start();
    return true;
}

void Calibrator::cancel()
{
    if (!running_)
        return;

    stepTimer_.stop();
    running_ = false;
    emit cancelled();
}

void Calibrator::onStep()
{
    if (progress_ >= 100)
    {
        stepTimer_.stop();
        running_ = false;
        qDebug() << "[Calibrator] done";
        emit finished();
        return;
    }

    progress_ += CALIBRATION_STEP_PERCENT;
    emit progressChanged(progress_);
}
