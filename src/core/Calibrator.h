#pragma once
#include <QObject>
#include <QTimer>

/**
 * Calibrator
 * --------------------
 * Drives the "hold still" progress shown to the user:
 * 0, 20, 40, 60, 80, 100 percent, one step per interval, then finished.
 * Baselines are not touched here; smile and nod capture theirs lazily.
 *
 * A start() while a run is in progress is rejected.
 */

class Calibrator : public QObject
{
    Q_OBJECT
public:
    explicit Calibrator(int stepMs, QObject *parent = nullptr);

    bool start();
    void cancel();

    bool isRunning() const { return running_; }
    int progress() const { return progress_; }

signals:
    void started();
    void progressChanged(int percent);
    void finished();
    void cancelled();

private slots:
    void onStep();

private:
    QTimer stepTimer_;
    bool running_ = false;
    int progress_ = 0;
};
