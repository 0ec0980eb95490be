#pragma once

// MediaPipe face mesh landmark indices
static constexpr int LANDMARK_NOSE_TIP = 1;
static constexpr int LANDMARK_FOREHEAD = 10;
static constexpr int LANDMARK_MOUTH_LEFT = 61;
static constexpr int LANDMARK_MOUTH_RIGHT = 291;
static constexpr int LANDMARK_FACE_LEFT_EDGE = 234;
static constexpr int LANDMARK_FACE_RIGHT_EDGE = 454;

// Blendshape categories
static constexpr const char *BLENDSHAPE_EYE_BLINK_LEFT = "eyeBlinkLeft";
static constexpr const char *BLENDSHAPE_EYE_BLINK_RIGHT = "eyeBlinkRight";

// Nod detector leaves the "nodding" state below this fraction of the threshold
static constexpr double NOD_RELEASE_FACTOR = 0.9;

// Wave detector leaves the "waving" state below this fraction of the threshold
static constexpr double WAVE_RELEASE_FACTOR = 0.5;

// Points needed before wave movement is measured
static constexpr int WAVE_MIN_HISTORY = 5;

// Calibration progress increment (percent)
static constexpr int CALIBRATION_STEP_PERCENT = 20;

// Networking defaults for the face tracker process
static constexpr int TRACKER_SERVER_PORT = 5556;
static constexpr const char *TRACKER_SERVER_IP = "127.0.0.1";

// How long a confirmed answer stays on screen (ms)
static constexpr int ANSWER_DISPLAY_MS = 3000;
