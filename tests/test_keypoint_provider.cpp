// test_keypoint_provider.cpp - Provider interface, factory and timeouts
// Copyright (c) 2025 Biometric Security Systems

#include <gtest/gtest.h>
#include <thread>
#include <type_traits>

#include "biometrics/keypoint_provider.h"
#include "test_helpers.h"

namespace palm_testing {

class KeypointProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_ = std::make_shared<MockKeypointProvider>();
        ASSERT_TRUE(mock_->initialize("mock.tflite"));
    }

    void TearDown() override {
        EXPECT_TRUE(mock_->waitForWorkers(std::chrono::seconds(5)));
    }

    std::shared_ptr<MockKeypointProvider> mock_;
};

TEST_F(KeypointProviderTest, InterfaceIsAbstractAndPinned) {
    EXPECT_TRUE(std::is_abstract<KeypointProvider>::value);
    EXPECT_TRUE(std::has_virtual_destructor<KeypointProvider>::value);
    EXPECT_FALSE(std::is_copy_constructible<KeypointProvider>::value);
    EXPECT_FALSE(std::is_move_assignable<KeypointProvider>::value);
}

TEST_F(KeypointProviderTest, FactoryRejectsUnknownType) {
    EXPECT_EQ(createKeypointProvider("mediapipe", ProviderSettings()), nullptr);
    EXPECT_EQ(createKeypointProvider("", ProviderSettings()), nullptr);
}

TEST_F(KeypointProviderTest, DetectionReturnsLandmarks) {
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::SUCCESS);
    EXPECT_DOUBLE_EQ(landmarks[9].position.y, 95.0);
}

TEST_F(KeypointProviderTest, ZeroTimeoutRunsInline) {
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(0), landmarks),
              DetectionError::SUCCESS);
    EXPECT_EQ(mock_->detectCalls(), 1);
}

TEST_F(KeypointProviderTest, PropagatesNotFound) {
    mock_->setResult(DetectionError::NOT_FOUND);
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::NOT_FOUND);
}

TEST_F(KeypointProviderTest, UninitializedProviderIsUnavailable) {
    mock_->release();
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::UNAVAILABLE);
    EXPECT_EQ(detectWithTimeout(nullptr, makeImage(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::UNAVAILABLE);
    EXPECT_EQ(mock_->detectCalls(), 0);
}

TEST_F(KeypointProviderTest, EmptyImageIsInvalid) {
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, cv::Mat(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::INVALID_IMAGE);
}

TEST_F(KeypointProviderTest, SlowProviderTimesOutAndIsCancelled) {
    mock_->setDelay(std::chrono::milliseconds(5000));

    HandLandmarks landmarks = makeOtherHand();
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(50), landmarks),
              DetectionError::TIMEOUT);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    // Late result never reaches the caller
    EXPECT_DOUBLE_EQ(landmarks[0].position.x, 300.0);

    ASSERT_TRUE(mock_->waitForWorkers(std::chrono::seconds(2)));
    EXPECT_EQ(mock_->cancelledCalls(), 1);
    EXPECT_EQ(mock_->completedRuns(), 0);
}

TEST_F(KeypointProviderTest, TimeoutCancelsOnlyItsOwnCall) {
    mock_->setDelay(std::chrono::milliseconds(300));

    // The first call holds the provider; the second queues behind it
    DetectionError first_result = DetectionError::UNAVAILABLE;
    HandLandmarks first_landmarks;
    std::thread first([&]() {
        first_result = detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(3000),
                                         first_landmarks);
    });
    for (int i = 0; i < 200 && !mock_->isRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(mock_->isRunning());

    HandLandmarks second_landmarks;
    EXPECT_EQ(detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(50),
                                second_landmarks),
              DetectionError::TIMEOUT);

    first.join();
    EXPECT_EQ(first_result, DetectionError::SUCCESS);
    EXPECT_DOUBLE_EQ(first_landmarks[9].position.y, 95.0);

    // The abandoned call gives up before doing any work
    ASSERT_TRUE(mock_->waitForWorkers(std::chrono::seconds(2)));
    EXPECT_EQ(mock_->completedRuns(), 1);
    EXPECT_EQ(mock_->cancelledCalls(), 1);
    EXPECT_EQ(mock_->workers()->active(), 0u);
}

TEST_F(KeypointProviderTest, WaitForWorkersReportsBusyProvider) {
    mock_->setDelay(std::chrono::milliseconds(400));

    std::thread caller([this]() {
        HandLandmarks landmarks;
        detectWithTimeout(mock_, makeImage(), std::chrono::milliseconds(3000), landmarks);
    });
    for (int i = 0; i < 200 && !mock_->isRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_FALSE(mock_->waitForWorkers(std::chrono::milliseconds(20)));
    EXPECT_TRUE(mock_->waitForWorkers(std::chrono::seconds(3)));
    caller.join();
}

TEST_F(KeypointProviderTest, ThrowingProviderIsUnavailable) {
    std::shared_ptr<KeypointProvider> throwing = std::make_shared<ThrowingKeypointProvider>();
    HandLandmarks landmarks;
    EXPECT_EQ(detectWithTimeout(throwing, makeImage(), std::chrono::milliseconds(1000), landmarks),
              DetectionError::UNAVAILABLE);
    EXPECT_EQ(detectWithTimeout(throwing, makeImage(), std::chrono::milliseconds(0), landmarks),
              DetectionError::UNAVAILABLE);
    EXPECT_TRUE(throwing->waitForWorkers(std::chrono::seconds(2)));
}

} // namespace palm_testing
