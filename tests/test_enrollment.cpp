#include <gtest/gtest.h>
#include "services/EnrollmentService.hpp"
#include "test_fakes.hpp"

using testutil::axis;

namespace {

class EnrollmentTest : public ::testing::Test {
	protected:
		void SetUp() override {
			cfg.qualityThreshold = 0.6;
			cfg.detectorScoreThreshold = 0.5;
			cfg.minRegistrationSamples = 3;
			cfg.maxRegistrationSamples = 5;
			cfg.duplicateThreshold = 0.6;
			settings.update(cfg);

			frame = cv::Mat(480, 640, CV_8UC3, cv::Scalar::all(127));
			testutil::fillNoise(frame, cv::Rect(200, 120, 180, 180), 7);

			detector = std::make_shared<FakeDetector>();
			detector->dets = { testutil::det(200, 120, 180, 180) };
			embedder = std::make_shared<FakeEmbedder>(8);
			enroll = std::make_unique<EnrollmentService>(detector, embedder, &gallery, &store, &settings);
		}

		RecognitionConfig cfg;
		RecognitionSettings settings;
		Gallery gallery;
		MemoryGalleryStore store;
		cv::Mat frame;
		std::shared_ptr<FakeDetector> detector;
		std::shared_ptr<FakeEmbedder> embedder;
		std::unique_ptr<EnrollmentService> enroll;
};

} // namespace

TEST_F(EnrollmentTest, ThreeDistinctSamplesRegister)
{
	ASSERT_TRUE(enroll->begin("alice", { { "name", "Alice" } }));
	for (int k = 0; k < 3; ++k) {
		embedder->push(axis(8, k));
		EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Captured);
	}
	EXPECT_EQ(enroll->sampleCount(), 3);

	const RegistrationResult r = enroll->finish();
	EXPECT_TRUE(r.success) << r.reason.toStdString();
	EXPECT_EQ(r.templates, 3);
	EXPECT_FALSE(enroll->isActive());

	EXPECT_TRUE(gallery.contains("alice"));
	EXPECT_EQ(gallery.templatesOf("alice").size(), 3u);
	ASSERT_EQ(store.records.size(), 1u);
	EXPECT_EQ(store.records[0].metadata.value("num_templates").toInt(), 3);
	EXPECT_EQ(store.records[0].metadata.value("name").toString(), QString("Alice"));
	EXPECT_TRUE(store.records[0].metadata.contains("registered_at"));
}

TEST_F(EnrollmentTest, FrameWithoutRegistrationIsIgnored)
{
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::NotRegistering);
	EXPECT_FALSE(enroll->finish().success);
	EXPECT_FALSE(enroll->begin("   "));
}

TEST_F(EnrollmentTest, MultipleFacesAreRejected)
{
	testutil::fillNoise(frame, cv::Rect(420, 120, 180, 180), 8);
	detector->dets.push_back(testutil::det(420, 120, 180, 180));

	enroll->begin("alice");
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::MultipleFaces);
	EXPECT_EQ(embedder->calls.load(), 0);
	EXPECT_EQ(enroll->sampleCount(), 0);
}

TEST_F(EnrollmentTest, NoFaceAndLowQualityAreRejected)
{
	enroll->begin("alice");
	detector->perCall.push_back({});
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::FaceNotDetected);

	detector->perCall.push_back({ testutil::det(10, 10, 150, 150) });		// 단색 영역
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::LowQuality);
	EXPECT_EQ(embedder->calls.load(), 0);
}

TEST_F(EnrollmentTest, FaceBelowMinimumSizeIsNotSampled)
{
	cfg.minFaceSize = 80;
	settings.update(cfg);

	enroll->begin("alice");
	detector->perCall.push_back({ testutil::det(200, 120, 60, 60) });
	embedder->push(axis(8, 0));
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::FaceNotDetected);
	EXPECT_EQ(embedder->calls.load(), 0);
	EXPECT_EQ(enroll->sampleCount(), 0);

	// 같은 위치의 충분히 큰 얼굴은 통과
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Captured);
	EXPECT_EQ(enroll->sampleCount(), 1);
}

TEST_F(EnrollmentTest, TooFewSamplesLeaveGalleryUntouched)
{
	enroll->begin("alice");
	embedder->push(axis(8, 0));
	embedder->push(axis(8, 1));
	enroll->addFrame(frame);
	enroll->addFrame(frame);

	const RegistrationResult r = enroll->finish();
	EXPECT_FALSE(r.success);
	EXPECT_TRUE(r.reason.contains("too few"));
	EXPECT_FALSE(gallery.contains("alice"));
	EXPECT_EQ(store.saveAllCalls, 0);
	EXPECT_FALSE(enroll->isActive());
}

TEST_F(EnrollmentTest, SamePoseIsRejected)
{
	enroll->begin("alice");
	embedder->push(axis(8, 0));
	embedder->push({ 1.f, 0.01f, 0.f, 0.f, 0.f, 0.f, 0.f, 0.f });
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Captured);
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::TooSimilar);
	EXPECT_EQ(enroll->sampleCount(), 1);
}

TEST_F(EnrollmentTest, FaceOfAnotherIdentityIsRejected)
{
	ASSERT_TRUE(gallery.add("bob", axis(8, 3)));

	enroll->begin("alice");
	embedder->push({ 0.f, 0.1f, 0.f, 1.f, 0.f, 0.f, 0.f, 0.f });		// bob 과 ~0.995
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::DuplicateFace);
	EXPECT_EQ(enroll->sampleCount(), 0);
}

TEST_F(EnrollmentTest, StoreFailureLeavesGalleryUnchanged)
{
	store.failWrites = true;
	enroll->begin("alice");
	for (int k = 0; k < 3; ++k) {
		embedder->push(axis(8, k));
		enroll->addFrame(frame);
	}

	const RegistrationResult r = enroll->finish();
	EXPECT_FALSE(r.success);
	EXPECT_EQ(store.saveAllCalls, 1);
	EXPECT_FALSE(gallery.contains("alice"));
	EXPECT_EQ(gallery.size(), 0);
}

TEST_F(EnrollmentTest, CaptureStopsAtMaximum)
{
	cfg.maxRegistrationSamples = 3;
	settings.update(cfg);

	enroll->begin("alice");
	embedder->push(axis(8, 0));
	embedder->push(axis(8, 1));
	embedder->push(axis(8, 2));
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Captured);
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Captured);
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Complete);
	EXPECT_EQ(enroll->addFrame(frame), CaptureStatus::Complete);
	EXPECT_EQ(embedder->calls.load(), 3);
}

TEST_F(EnrollmentTest, RegisterImagesCommitsBatch)
{
	for (int k = 0; k < 4; ++k) embedder->push(axis(8, k));
	const std::vector<cv::Mat> imgs(4, frame);

	const RegistrationResult r = enroll->registerImages("carol", imgs, { { "email", "c@example.com" } });
	EXPECT_TRUE(r.success) << r.reason.toStdString();
	EXPECT_EQ(r.templates, 4);
	EXPECT_EQ(gallery.templatesOf("carol").size(), 4u);
}

TEST_F(EnrollmentTest, RegisterImagesFailsWholeBatchOnBadImage)
{
	embedder->push(axis(8, 0));
	embedder->push(axis(8, 1));
	detector->perCall = { detector->dets, detector->dets, {} };
	const std::vector<cv::Mat> imgs(3, frame);

	const RegistrationResult r = enroll->registerImages("dave", imgs);
	EXPECT_FALSE(r.success);
	EXPECT_TRUE(r.reason.startsWith("image 3"));
	EXPECT_FALSE(gallery.contains("dave"));
	EXPECT_EQ(store.saveAllCalls, 0);
	EXPECT_FALSE(enroll->isActive());
}
