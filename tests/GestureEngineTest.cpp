#include <QSignalSpy>
#include <QTest>

#include <gtest/gtest.h>

#include "TestFrames.h"
#include "core/Detectors/BlinkDetector.h"
#include "core/Detectors/NodDetector.h"
#include "core/Detectors/SmileDetector.h"
#include "core/GestureEngine.h"

using namespace TestFrames;

namespace
{
    EngineConfig testConfig()
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.holdMs = 50;
        cfg.calibrationStepMs = 10;
        cfg.minFrameIntervalMs = 0;
        return cfg;
    }

    class GestureEngineTest : public ::testing::Test
    {
    protected:
        GestureEngineTest()
            : engine_(testConfig()),
              answers_(&engine_, &GestureEngine::answerConfirmed),
              candidates_(&engine_, &GestureEngine::candidateRaised)
        {
        }

        void eyesFrames(qint64 from, qint64 to, float score)
        {
            for (qint64 t = from; t <= to; t += 10)
                engine_.onFrame(eyes(t, score));
        }

        // Closed for 100 ms starting at `start`, then open until `openUntil`
        void blinkThenOpen(qint64 start, qint64 openUntil)
        {
            eyesFrames(start, start + 90, 0.9f);
            eyesFrames(start + 100, openUntil, 0.0f);
        }

        FinalSignal answerAt(int i) const
        {
            return answers_.at(i).at(0).value<FinalSignal>();
        }

        RawCandidate candidateAt(int i) const
        {
            return candidates_.at(i).at(0).value<RawCandidate>();
        }

        GestureEngine engine_;
        QSignalSpy answers_;
        QSignalSpy candidates_;
    };
}

TEST_F(GestureEngineTest, StartsWaitingWithBlinkActive)
{
    EXPECT_EQ(engine_.activeGesture(), GestureType::Blink);
    EXPECT_EQ(engine_.status(), DetectionStatus::Waiting);
    EXPECT_TRUE(engine_.isListening());
    ASSERT_NE(engine_.activeDetector(), nullptr);
    EXPECT_EQ(engine_.activeDetector()->type(), GestureType::Blink);
}

TEST_F(GestureEngineTest, FaceAbsenceReportsSearchingWithoutTouchingDetector)
{
    QSignalSpy status(&engine_, &GestureEngine::statusChanged);

    engine_.onFrame(eyes(0, 0.9f));
    EXPECT_EQ(engine_.status(), DetectionStatus::Detected);

    engine_.onFrame(noFace(10));
    EXPECT_EQ(engine_.status(), DetectionStatus::Searching);

    // the closure started before the gap is still in progress
    const auto *blink = dynamic_cast<const BlinkDetector *>(engine_.activeDetector());
    ASSERT_NE(blink, nullptr);
    EXPECT_TRUE(blink->isBlinking());

    engine_.onFrame(eyes(100, 0.0f));
    EXPECT_EQ(engine_.status(), DetectionStatus::Detected);
    EXPECT_EQ(blink->blinkHistory().size(), 1);

    ASSERT_EQ(status.count(), 3);
    EXPECT_EQ(status.at(1).at(0).value<DetectionStatus>(), DetectionStatus::Searching);
}

TEST_F(GestureEngineTest, SingleBlinkConfirmsYes)
{
    blinkThenOpen(0, 1000);

    ASSERT_EQ(candidates_.count(), 1);
    EXPECT_EQ(candidateAt(0).value, Answer::Yes);
    EXPECT_EQ(candidateAt(0).timestampMs, 900); // blink end + confirmation delay
    EXPECT_TRUE(engine_.hasPendingCandidate());

    ASSERT_TRUE(answers_.wait(2000));
    ASSERT_EQ(answers_.count(), 1);
    EXPECT_EQ(answerAt(0).value, Answer::Yes);
    EXPECT_EQ(answerAt(0).gesture, GestureType::Blink);
    EXPECT_EQ(answerAt(0).timestampMs, 900);
}

TEST_F(GestureEngineTest, DoubleBlinkConfirmsNoAndNeverYes)
{
    blinkThenOpen(0, 390);
    blinkThenOpen(400, 1400);

    ASSERT_TRUE(answers_.wait(2000));
    QTest::qWait(100);

    ASSERT_EQ(answers_.count(), 1);
    EXPECT_EQ(answerAt(0).value, Answer::No);
    for (int i = 0; i < candidates_.count(); ++i)
        EXPECT_EQ(candidateAt(i).value, Answer::No);
}

TEST_F(GestureEngineTest, SustainedSmileConfirmsYesOnce)
{
    engine_.setActiveGesture(GestureType::Smile);

    engine_.onFrame(mouth(0, 0.40));
    for (qint64 t = 20; t <= 2120; t += 20)
        engine_.onFrame(mouth(t, 0.50));

    EXPECT_EQ(candidates_.count(), 1);

    ASSERT_TRUE(answers_.wait(2000));
    for (qint64 t = 2140; t <= 3000; t += 20)
        engine_.onFrame(mouth(t, 0.50));
    QTest::qWait(150);

    ASSERT_EQ(answers_.count(), 1);
    EXPECT_EQ(answerAt(0).value, Answer::Yes);
    EXPECT_EQ(answerAt(0).gesture, GestureType::Smile);
    EXPECT_EQ(candidates_.count(), 1);
}

TEST_F(GestureEngineTest, SwitchingGestureCancelsPendingCandidate)
{
    blinkThenOpen(0, 1000);
    ASSERT_TRUE(engine_.hasPendingCandidate());

    engine_.setActiveGesture(GestureType::Nod);

    EXPECT_FALSE(engine_.hasPendingCandidate());
    EXPECT_FALSE(answers_.wait(300));
    EXPECT_EQ(answers_.count(), 0);
    EXPECT_EQ(engine_.activeDetector()->type(), GestureType::Nod);
}

TEST_F(GestureEngineTest, DoubleBlinkOverridesPendingYes)
{
    blinkThenOpen(0, 1000);
    ASSERT_EQ(candidates_.count(), 1);

    blinkThenOpen(1000, 1290);
    blinkThenOpen(1300, 1500);

    ASSERT_EQ(candidates_.count(), 2);
    EXPECT_EQ(candidateAt(1).value, Answer::No);

    ASSERT_TRUE(answers_.wait(2000));
    QTest::qWait(100);
    ASSERT_EQ(answers_.count(), 1);
    EXPECT_EQ(answerAt(0).value, Answer::No);
}

TEST_F(GestureEngineTest, ResetTwiceMatchesResetOnce)
{
    engine_.setActiveGesture(GestureType::Smile);
    engine_.onFrame(mouth(0, 0.40));
    for (qint64 t = 20; t <= 1300; t += 20)
        engine_.onFrame(mouth(t, 0.50));
    ASSERT_TRUE(engine_.hasPendingCandidate());

    engine_.reset();
    engine_.reset();

    const auto *smile = dynamic_cast<const SmileDetector *>(engine_.activeDetector());
    ASSERT_NE(smile, nullptr);
    EXPECT_EQ(smile->neutralMouthWidth(), 0.0);
    EXPECT_FALSE(smile->isSmiling());
    EXPECT_FALSE(engine_.hasPendingCandidate());
    EXPECT_TRUE(engine_.isListening());
    EXPECT_EQ(engine_.status(), DetectionStatus::Waiting);
    EXPECT_EQ(engine_.activeGesture(), GestureType::Smile);
}

TEST_F(GestureEngineTest, SettingSameGestureTwiceGivesFreshDetector)
{
    QSignalSpy changed(&engine_, &GestureEngine::activeGestureChanged);

    engine_.setActiveGesture(GestureType::Nod);
    engine_.onFrame(headPitch(0, 0.20));
    engine_.onFrame(headPitch(100, 0.26));

    engine_.setActiveGesture(GestureType::Nod);
    engine_.setActiveGesture(GestureType::Nod);

    const auto *nod = dynamic_cast<const NodDetector *>(engine_.activeDetector());
    ASSERT_NE(nod, nullptr);
    EXPECT_EQ(nod->neutralHeadPitch(), 0.0);
    EXPECT_EQ(nod->nodCount(), 0);
    EXPECT_FALSE(engine_.hasPendingCandidate());
    EXPECT_EQ(changed.count(), 1);
}

TEST_F(GestureEngineTest, BaselineCapturedAgainAfterReset)
{
    engine_.setActiveGesture(GestureType::Nod);
    engine_.onFrame(headPitch(0, 0.20));

    const auto *nod = dynamic_cast<const NodDetector *>(engine_.activeDetector());
    ASSERT_NE(nod, nullptr);
    EXPECT_NEAR(nod->neutralHeadPitch(), 0.20, 1e-6);

    engine_.reset();
    engine_.onFrame(headPitch(100, 0.25));

    nod = dynamic_cast<const NodDetector *>(engine_.activeDetector());
    ASSERT_NE(nod, nullptr);
    EXPECT_NEAR(nod->neutralHeadPitch(), 0.25, 1e-6);
    EXPECT_EQ(candidates_.count(), 0);
}

TEST_F(GestureEngineTest, AnsweredQuestionIgnoresFramesUntilReset)
{
    blinkThenOpen(0, 1000);
    ASSERT_TRUE(answers_.wait(2000));
    EXPECT_FALSE(engine_.isListening());
    EXPECT_EQ(engine_.status(), DetectionStatus::Waiting);

    blinkThenOpen(2000, 3000);
    EXPECT_EQ(candidates_.count(), 1);

    engine_.reset();
    EXPECT_TRUE(engine_.isListening());

    blinkThenOpen(4000, 5000);
    EXPECT_EQ(candidates_.count(), 2);
}

TEST_F(GestureEngineTest, ErrorStopsProcessingUntilReset)
{
    QSignalSpy errors(&engine_, &GestureEngine::errorOccurred);

    eyesFrames(0, 90, 0.9f);
    engine_.onFrame(eyes(100, 0.0f));

    engine_.setError(QStringLiteral("camera unavailable"));
    ASSERT_EQ(errors.count(), 1);
    EXPECT_EQ(errors.at(0).at(0).toString(), QStringLiteral("camera unavailable"));
    EXPECT_EQ(engine_.status(), DetectionStatus::Error);

    eyesFrames(110, 1000, 0.0f);
    engine_.onFrame(noFace(1010));
    EXPECT_EQ(engine_.status(), DetectionStatus::Error);
    EXPECT_EQ(candidates_.count(), 0);

    engine_.reset();
    EXPECT_EQ(engine_.status(), DetectionStatus::Waiting);
    EXPECT_TRUE(engine_.lastError().isEmpty());

    engine_.onFrame(eyes(1100, 0.0f));
    EXPECT_EQ(engine_.status(), DetectionStatus::Detected);
}

TEST_F(GestureEngineTest, ErrorCancelsPendingCandidate)
{
    blinkThenOpen(0, 1000);
    ASSERT_TRUE(engine_.hasPendingCandidate());

    engine_.setError(QStringLiteral("model crashed"));

    EXPECT_FALSE(engine_.hasPendingCandidate());
    EXPECT_FALSE(answers_.wait(300));
}

TEST_F(GestureEngineTest, MalformedFrameIsSkipped)
{
    engine_.setActiveGesture(GestureType::Smile);

    MeasurementFrame frame;
    frame.timestampMs = 0;
    frame.faceDetected = true;

    engine_.onFrame(frame);

    EXPECT_EQ(engine_.status(), DetectionStatus::Detected);
    const auto *smile = dynamic_cast<const SmileDetector *>(engine_.activeDetector());
    ASSERT_NE(smile, nullptr);
    EXPECT_EQ(smile->neutralMouthWidth(), 0.0);
    EXPECT_EQ(candidates_.count(), 0);
}

TEST_F(GestureEngineTest, CalibrationReportsProgressAndRejectsOverlap)
{
    QSignalSpy progress(&engine_, &GestureEngine::calibrationProgress);
    QSignalSpy finished(&engine_, &GestureEngine::calibrationFinished);

    ASSERT_TRUE(engine_.startCalibration());
    EXPECT_TRUE(engine_.isCalibrating());
    EXPECT_FALSE(engine_.startCalibration());

    ASSERT_TRUE(finished.wait(2000));
    ASSERT_EQ(progress.count(), 6);
    EXPECT_EQ(progress.at(0).at(0).toInt(), 0);
    EXPECT_EQ(progress.at(5).at(0).toInt(), 100);
    EXPECT_FALSE(engine_.isCalibrating());
}

TEST(GestureEngineThrottleTest, DropsFramesArrivingTooSoon)
{
    EngineConfig cfg = EngineConfig::defaults();
    cfg.minFrameIntervalMs = 16;
    GestureEngine engine(cfg);

    engine.onFrame(noFace(0));
    EXPECT_EQ(engine.status(), DetectionStatus::Searching);

    engine.onFrame(eyes(10, 0.0f));
    EXPECT_EQ(engine.status(), DetectionStatus::Searching);

    engine.onFrame(eyes(16, 0.0f));
    EXPECT_EQ(engine.status(), DetectionStatus::Detected);
}
