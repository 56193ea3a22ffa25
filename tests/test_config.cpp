#include <gtest/gtest.h>
#include <QFile>
#include <QTemporaryDir>
#include "config/ConfigLoader.hpp"
#include "config/ConfigWatcher.hpp"
#include "config/RecognitionSettings.hpp"

TEST(ConfigLoaderTest, MissingKeysKeepDefaults)
{
	RecognitionConfig cfg;
	ASSERT_TRUE(ConfigLoader::parse(R"({"recognition":{"frame_skip":3},
		"session":{"session_duration_sec":120}})", cfg));

	EXPECT_EQ(cfg.frameSkip, 3);
	EXPECT_EQ(cfg.sessionDurationSec, 120);
	EXPECT_DOUBLE_EQ(cfg.recognitionThreshold, recog::COS_THR);
	EXPECT_DOUBLE_EQ(cfg.qualityThreshold, recog::QUALITY_THR);
	EXPECT_EQ(cfg.minRegistrationSamples, recog::MIN_REG_SAMPLES);
	EXPECT_EQ(cfg.cameraIndex, 0);
}

TEST(ConfigLoaderTest, InvalidValuesAreIgnored)
{
	RecognitionConfig cfg;
	ASSERT_TRUE(ConfigLoader::parse(R"({"recognition":{
		"quality_threshold":1.5, "frame_skip":0, "recognition_threshold":"high",
		"min_face_size":64}})", cfg));

	EXPECT_DOUBLE_EQ(cfg.qualityThreshold, recog::QUALITY_THR);
	EXPECT_EQ(cfg.frameSkip, recog::FRAME_SKIP);
	EXPECT_DOUBLE_EQ(cfg.recognitionThreshold, recog::COS_THR);
	EXPECT_EQ(cfg.minFaceSize, 64);
}

TEST(ConfigLoaderTest, MalformedJsonLeavesConfigUntouched)
{
	RecognitionConfig cfg;
	cfg.frameSkip = 4;
	EXPECT_FALSE(ConfigLoader::parse("{ \"recognition\": ", cfg));
	EXPECT_FALSE(ConfigLoader::parse("[1, 2, 3]", cfg));
	EXPECT_EQ(cfg.frameSkip, 4);
}

TEST(ConfigLoaderTest, DuplicateThresholdFollowsRecognitionThreshold)
{
	RecognitionConfig cfg;
	ASSERT_TRUE(ConfigLoader::parse(R"({"recognition":{"recognition_threshold":0.55}})", cfg));
	EXPECT_DOUBLE_EQ(cfg.duplicateThreshold, 0.55);

	ASSERT_TRUE(ConfigLoader::parse(R"({"registration":{"duplicate_threshold":0.8}})", cfg));
	EXPECT_DOUBLE_EQ(cfg.duplicateThreshold, 0.8);
	EXPECT_DOUBLE_EQ(cfg.recognitionThreshold, 0.55);
}

TEST(ConfigLoaderTest, InconsistentSampleBoundsAreRejected)
{
	RecognitionConfig cfg;
	ASSERT_TRUE(ConfigLoader::parse(R"({"registration":{"min_samples":9,"max_samples":4}})", cfg));
	EXPECT_EQ(cfg.minRegistrationSamples, recog::MIN_REG_SAMPLES);
	EXPECT_EQ(cfg.maxRegistrationSamples, recog::MAX_REG_SAMPLES);
}

TEST(ConfigLoaderTest, DumpIsReadableByParse)
{
	RecognitionConfig a;
	a.recognitionThreshold = 0.42;
	a.frameSkip = 5;
	a.livenessForUnknown = true;
	a.galleryFile = "/tmp/g.json";

	RecognitionConfig b;
	ASSERT_TRUE(ConfigLoader::parse(ConfigLoader::dump(a), b));
	EXPECT_DOUBLE_EQ(b.recognitionThreshold, 0.42);
	EXPECT_EQ(b.frameSkip, 5);
	EXPECT_TRUE(b.livenessForUnknown);
	EXPECT_EQ(b.galleryFile, QString("/tmp/g.json"));
}

TEST(ConfigLoaderTest, LoadFileReportsMissingFile)
{
	QTemporaryDir dir;
	RecognitionConfig cfg;
	EXPECT_FALSE(ConfigLoader::loadFile(dir.filePath("nope.json"), cfg));

	const QString path = dir.filePath("attendance.json");
	QFile f(path);
	ASSERT_TRUE(f.open(QIODevice::WriteOnly));
	f.write(R"({"camera":{"index":2,"fps":15}})");
	f.close();

	ASSERT_TRUE(ConfigLoader::loadFile(path, cfg));
	EXPECT_EQ(cfg.cameraIndex, 2);
	EXPECT_EQ(cfg.fps, 15);
}

TEST(RecognitionSettingsTest, UpdateClampsFrameSkip)
{
	RecognitionSettings s;
	RecognitionConfig c;
	c.frameSkip = 0;
	s.update(c);
	EXPECT_EQ(s.snapshot().frameSkip, 1);
}

TEST(ConfigWatcherTest, ReloadAppliesFileToSettings)
{
	QTemporaryDir dir;
	const QString path = dir.filePath("attendance.json");
	{
		QFile f(path);
		ASSERT_TRUE(f.open(QIODevice::WriteOnly));
		f.write(R"({"recognition":{"recognition_threshold":0.5,"frame_skip":1}})");
	}

	RecognitionSettings settings;
	ConfigWatcher watcher(path, &settings);
	int reloaded = 0;
	int failed = 0;
	QObject::connect(&watcher, &ConfigWatcher::reloaded, [&](const RecognitionConfig&) { ++reloaded; });
	QObject::connect(&watcher, &ConfigWatcher::reloadFailed, [&](const QString&) { ++failed; });

	ASSERT_TRUE(watcher.reload());
	EXPECT_EQ(reloaded, 1);
	EXPECT_DOUBLE_EQ(settings.snapshot().recognitionThreshold, 0.5);
	EXPECT_EQ(settings.snapshot().frameSkip, 1);

	{
		QFile f(path);
		ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
		f.write("{ broken");
	}
	EXPECT_FALSE(watcher.reload());
	EXPECT_EQ(failed, 1);
	EXPECT_DOUBLE_EQ(settings.snapshot().recognitionThreshold, 0.5);		// 이전 값 유지
}
