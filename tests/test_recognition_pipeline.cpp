// test_recognition_pipeline.cpp - Registration and recognition end to end
// Copyright (c) 2025 Biometric Security Systems

#include <gtest/gtest.h>
#include <cmath>
#include <thread>

#include "biometrics/recognition_pipeline.h"
#include "test_helpers.h"

namespace palm_testing {

class RecognitionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<TemplateStore>(dir_.file("palm_data"));
        ASSERT_TRUE(store_->open());

        provider_ = std::make_shared<MockKeypointProvider>();
        ASSERT_TRUE(provider_->initialize("mock.tflite"));

        PipelineSettings settings;
        settings.detection_timeout = std::chrono::milliseconds(1000);
        pipeline_ = std::make_unique<RecognitionPipeline>(*store_, provider_, settings);
    }

    void TearDown() override {
        pipeline_.reset();
        EXPECT_TRUE(provider_->waitForWorkers(std::chrono::seconds(5)));
    }

    static PalmTemplate templateFrom(const DistanceVector& normalized) {
        PalmTemplate result;
        result.normalized_distances = normalized;
        result.raw_distances = normalized;
        result.signature = TemplateBuilder::deriveSignature(normalized);
        result.created_at = currentUtcTime();
        return result;
    }

    static DistanceVector tenEntryVector(double offset) {
        DistanceVector v;
        const char* keys[] = {
            "index_knuckle_middle_knuckle", "index_knuckle_pinky_knuckle",
            "index_knuckle_ring_knuckle", "index_knuckle_wrist",
            "middle_knuckle_pinky_knuckle", "middle_knuckle_ring_knuckle",
            "middle_knuckle_wrist", "pinky_knuckle_ring_knuckle",
            "pinky_knuckle_wrist", "ring_knuckle_wrist"
        };
        double value = 1.0;
        for (const char* key : keys) {
            v[key] = value + offset;
            value -= 0.05;
        }
        return v;
    }

    TempDirectory dir_;
    std::unique_ptr<TemplateStore> store_;
    std::shared_ptr<MockKeypointProvider> provider_;
    std::unique_ptr<RecognitionPipeline> pipeline_;
};

TEST_F(RecognitionPipelineTest, NearbyProbeMatchesRegisteredIdentity) {
    RegistrationOutcome registered =
        pipeline_->registerTemplate(templateFrom(tenEntryVector(0.0)), "555-1111");
    ASSERT_EQ(registered.status, PipelineStatus::SUCCESS);

    RecognitionDecision decision =
        pipeline_->recognizeTemplate(templateFrom(tenEntryVector(0.01)), std::nullopt, 0.13);

    EXPECT_EQ(decision.status, PipelineStatus::SUCCESS);
    EXPECT_EQ(decision.mode, RecognitionMode::OPEN_SET);
    EXPECT_TRUE(decision.matched);
    EXPECT_EQ(decision.matched_identity, "555-1111");
    EXPECT_LE(decision.best_distance, 0.13);
    EXPECT_NEAR(decision.best_distance, std::sqrt(10 * 0.01 * 0.01), 1e-9);
    EXPECT_NEAR(decision.confidence, 1.0 - decision.best_distance, 1e-12);
    EXPECT_EQ(decision.candidates_compared, 1u);
}

TEST_F(RecognitionPipelineTest, EmptyStoreIsSuccessfulNoMatch) {
    for (double threshold : {0.0, 0.13, 1.0e6}) {
        RecognitionDecision decision =
            pipeline_->recognizeTemplate(templateFrom(tenEntryVector(0.0)), std::nullopt, threshold);
        EXPECT_EQ(decision.status, PipelineStatus::SUCCESS);
        EXPECT_FALSE(decision.matched);
        EXPECT_EQ(decision.candidates_compared, 0u);
        EXPECT_EQ(decision.message, "No registered palms in database");
    }
}

TEST_F(RecognitionPipelineTest, RegisterAndRecognizeFromImage) {
    RegistrationOutcome registered = pipeline_->registerPalm(makeImage(), "555-1111");
    ASSERT_EQ(registered.status, PipelineStatus::SUCCESS);
    EXPECT_EQ(registered.registration.signature, "d4a7e546f144ab79");
    EXPECT_EQ(registered.message, "Palm registered successfully");

    // Same hand seen larger and shifted in the frame
    provider_->setHand(makeHand(1.5, 20.0, 10.0));
    RecognitionDecision decision = pipeline_->recognize(makeImage());
    EXPECT_TRUE(decision.matched);
    EXPECT_EQ(decision.matched_identity, "555-1111");
    EXPECT_NEAR(decision.best_distance, 0.0, 1e-9);
    EXPECT_EQ(decision.threshold, MatchConfig::DEFAULT_MATCH_THRESHOLD);
    EXPECT_EQ(decision.probe_signature, "d4a7e546f144ab79");
}

TEST_F(RecognitionPipelineTest, DifferentHandIsNotRecognized) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);
    std::string before = readFile(store_->recordPath("555-1111"));

    provider_->setHand(makeOtherHand());
    RecognitionDecision decision = pipeline_->recognize(makeImage());
    EXPECT_EQ(decision.status, PipelineStatus::SUCCESS);
    EXPECT_FALSE(decision.matched);
    EXPECT_GT(decision.best_distance, 0.13);
    EXPECT_EQ(decision.message, "Palm not recognized");
    EXPECT_EQ(readFile(store_->recordPath("555-1111")), before);
}

TEST_F(RecognitionPipelineTest, MatchUpdatesLastUsed) {
    RegistrationOutcome registered = pipeline_->registerPalm(makeImage(), "555-1111");
    ASSERT_EQ(registered.status, PipelineStatus::SUCCESS);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    RecognitionDecision decision = pipeline_->recognize(makeImage(), std::string("555-1111"));
    ASSERT_TRUE(decision.matched);
    EXPECT_EQ(decision.mode, RecognitionMode::TARGETED);

    auto loaded = store_->load("555-1111");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_GT(loaded->last_used, registered.registration.last_used);
    EXPECT_EQ(loaded->registered_at, registered.registration.registered_at);
}

TEST_F(RecognitionPipelineTest, TargetedRecognitionOfUnknownIdentity) {
    RecognitionDecision decision = pipeline_->recognize(makeImage(), std::string("555-0000"));
    EXPECT_EQ(decision.status, PipelineStatus::NOT_REGISTERED);
    EXPECT_FALSE(decision.matched);
}

TEST_F(RecognitionPipelineTest, UnreadableRecordIsStorageErrorNotUnregistered) {
    // A directory where the record file belongs cannot be read or replaced
    ASSERT_EQ(::mkdir(store_->recordPath("555-1111").c_str(), 0755), 0);

    RecognitionDecision decision = pipeline_->recognize(makeImage(), std::string("555-1111"));
    EXPECT_EQ(decision.status, PipelineStatus::STORAGE_IO_ERROR);
    EXPECT_FALSE(decision.matched);
    EXPECT_EQ(decision.candidates_compared, 0u);

    RegistrationOutcome outcome = pipeline_->registerPalm(makeImage(), "555-1111");
    EXPECT_EQ(outcome.status, PipelineStatus::STORAGE_IO_ERROR);
    EXPECT_TRUE(pathExists(store_->recordPath("555-1111")));
}

TEST_F(RecognitionPipelineTest, TargetedRecognitionComparesOnlyThatIdentity) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);
    provider_->setHand(makeOtherHand());
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-2222").status, PipelineStatus::SUCCESS);

    RecognitionDecision decision = pipeline_->recognize(makeImage(), std::string("555-1111"));
    EXPECT_EQ(decision.status, PipelineStatus::SUCCESS);
    EXPECT_FALSE(decision.matched);
    EXPECT_EQ(decision.candidates_compared, 1u);
}

TEST_F(RecognitionPipelineTest, DuplicateRegistrationIsRefused) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-3333").status, PipelineStatus::SUCCESS);
    std::string before = readFile(store_->recordPath("555-3333"));

    provider_->setHand(makeOtherHand());
    RegistrationOutcome second = pipeline_->registerPalm(makeImage(), "555-3333");
    EXPECT_EQ(second.status, PipelineStatus::DUPLICATE_REGISTRATION);
    EXPECT_EQ(readFile(store_->recordPath("555-3333")), before);
}

TEST_F(RecognitionPipelineTest, NoHandIsDetectionFailure) {
    provider_->setResult(DetectionError::NOT_FOUND);
    RegistrationOutcome outcome = pipeline_->registerPalm(makeImage(), "555-1111");
    EXPECT_EQ(outcome.status, PipelineStatus::DETECTION_FAILED);
    EXPECT_FALSE(store_->load("555-1111").has_value());
    EXPECT_EQ(pipeline_->statistics().detection_failures, 1u);
}

TEST_F(RecognitionPipelineTest, LowConfidenceIsDetectionFailure) {
    provider_->setHand(makeHand(1.0, 0.0, 0.0, 0.3));
    RecognitionDecision decision = pipeline_->recognize(makeImage());
    EXPECT_EQ(decision.status, PipelineStatus::DETECTION_FAILED);
}

TEST_F(RecognitionPipelineTest, MissingProviderIsUnavailable) {
    RecognitionPipeline without_provider(*store_, nullptr);
    RegistrationOutcome outcome = without_provider.registerPalm(makeImage(), "555-1111");
    EXPECT_EQ(outcome.status, PipelineStatus::DETECTION_UNAVAILABLE);
    EXPECT_EQ(without_provider.recognize(makeImage()).status,
              PipelineStatus::DETECTION_UNAVAILABLE);
}

TEST_F(RecognitionPipelineTest, DetectionTimeoutPersistsNothing) {
    provider_->setDelay(std::chrono::milliseconds(5000));

    PipelineSettings settings;
    settings.detection_timeout = std::chrono::milliseconds(50);
    RecognitionPipeline impatient(*store_, provider_, settings);

    RegistrationOutcome outcome = impatient.registerPalm(makeImage(), "555-1111");
    EXPECT_EQ(outcome.status, PipelineStatus::DETECTION_TIMEOUT);
    EXPECT_TRUE(store_->listAll().empty());
    EXPECT_EQ(countFilesWithSuffix(store_->dataDirectory(), ".json"), 0);
}

TEST_F(RecognitionPipelineTest, RejectsInvalidInputs) {
    EXPECT_EQ(pipeline_->registerPalm(makeImage(), "../etc/passwd").status,
              PipelineStatus::INVALID_IDENTITY);
    EXPECT_EQ(pipeline_->registerPalm(cv::Mat(), "555-1111").status,
              PipelineStatus::INVALID_ARGUMENT);
    EXPECT_EQ(pipeline_->recognize(makeImage(), std::nullopt, -0.1).status,
              PipelineStatus::INVALID_ARGUMENT);
}

TEST_F(RecognitionPipelineTest, DeleteTransitionsBackToUnregistered) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);

    DeletionOutcome deleted = pipeline_->deleteRegistration("555-1111");
    EXPECT_EQ(deleted.status, PipelineStatus::SUCCESS);
    EXPECT_TRUE(deleted.deleted);

    DeletionOutcome again = pipeline_->deleteRegistration("555-1111");
    EXPECT_EQ(again.status, PipelineStatus::NOT_REGISTERED);
    EXPECT_FALSE(again.deleted);

    EXPECT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);
}

TEST_F(RecognitionPipelineTest, CorruptRecordIsDroppedFromScans) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);
    writeFile(store_->recordPath("555-2222"), "{not json");

    RecognitionDecision decision = pipeline_->recognize(makeImage());
    EXPECT_TRUE(decision.matched);
    EXPECT_EQ(decision.candidates_compared, 1u);

    std::vector<RegistrationSummary> listed = pipeline_->listRegistrations();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].identity, "555-1111");
}

TEST_F(RecognitionPipelineTest, StatisticsCountOutcomes) {
    ASSERT_EQ(pipeline_->registerPalm(makeImage(), "555-1111").status, PipelineStatus::SUCCESS);
    pipeline_->recognize(makeImage());
    provider_->setHand(makeOtherHand());
    pipeline_->recognize(makeImage());

    PipelineStatistics stats = pipeline_->statistics();
    EXPECT_EQ(stats.registrations, 1u);
    EXPECT_EQ(stats.recognitions, 2u);
    EXPECT_EQ(stats.matches, 1u);
    EXPECT_EQ(stats.detection_failures, 0u);
}

} // namespace palm_testing
