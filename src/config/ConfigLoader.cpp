#include "config/ConfigLoader.hpp"
#include <fstream>
#include <sstream>
#include <QtCore/QDebug>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T, typename Pred>
void readKey(const json& sec, const char* key, T& dst, Pred valid)
{
	auto it = sec.find(key);
	if (it == sec.end() || it->is_null()) return;

	try {
		T v = it->template get<T>();
		if (!valid(v)) {
			qWarning() << "[Config] invalid value for" << key << "-> keep" << dst;
			return;
		}
		dst = v;
	} catch (const json::exception& e) {
		qWarning() << "[Config] type error for" << key << ":" << e.what();
	}
}

void readPath(const json& sec, const char* key, QString& dst)
{
	auto it = sec.find(key);
	if (it == sec.end() || !it->is_string()) return;
	dst = QString::fromStdString(it->get<std::string>());
}

const json& section(const json& root, const char* name)
{
	static const json empty = json::object();
	auto it = root.find(name);
	if (it == root.end() || !it->is_object()) return empty;
	return *it;
}

auto unit    = [](double v) { return v >= 0.0 && v <= 1.0; };
auto cosine  = [](double v) { return v >= -1.0 && v <= 1.0; };
auto positive = [](int v) { return v >= 1; };
auto nonNeg  = [](int v) { return v >= 0; };
auto any     = [](bool) { return true; };

} // namespace

bool ConfigLoader::parse(const std::string& text, RecognitionConfig& cfg)
{
	json root;
	try {
		root = json::parse(text);
	} catch (const json::parse_error& e) {
		qWarning() << "[Config] parse error:" << e.what();
		return false;
	}
	if (!root.is_object()) {
		qWarning() << "[Config] root is not an object";
		return false;
	}

	RecognitionConfig c = cfg;

	const json& rec = section(root, "recognition");
	readKey(rec, "recognition_threshold",	  c.recognitionThreshold, cosine);
	readKey(rec, "quality_threshold",		  c.qualityThreshold, unit);
	readKey(rec, "frame_skip",				  c.frameSkip, positive);
	readKey(rec, "min_face_size",			  c.minFaceSize, nonNeg);
	readKey(rec, "detector_score_threshold",  c.detectorScoreThreshold, unit);
	readKey(rec, "liveness_for_unknown",	  c.livenessForUnknown, any);

	const json& ses = section(root, "session");
	readKey(ses, "session_duration_sec",	  c.sessionDurationSec, positive);
	readKey(ses, "accept_spoofed",			  c.acceptSpoofed, any);

	const json& reg = section(root, "registration");
	readKey(reg, "min_samples",				  c.minRegistrationSamples, positive);
	readKey(reg, "max_samples",				  c.maxRegistrationSamples, positive);
	// 중복 임계값은 명시하지 않으면 인식 임계값을 따름
	c.duplicateThreshold = c.recognitionThreshold;
	readKey(reg, "duplicate_threshold",		  c.duplicateThreshold, cosine);

	if (c.minRegistrationSamples > c.maxRegistrationSamples) {
		qWarning() << "[Config] min_samples > max_samples, keep"
				   << cfg.minRegistrationSamples << "/" << cfg.maxRegistrationSamples;
		c.minRegistrationSamples = cfg.minRegistrationSamples;
		c.maxRegistrationSamples = cfg.maxRegistrationSamples;
	}

	const json& paths = section(root, "paths");
	readPath(paths, "detector_model",	c.detectorModel);
	readPath(paths, "embedder_model",	c.embedderModel);
	readPath(paths, "face_mesh_model",	c.faceMeshModel);
	readPath(paths, "gallery_file",		c.galleryFile);
	readPath(paths, "database_file",	c.databaseFile);
	readPath(paths, "log_dir",			c.logDir);

	const json& cam = section(root, "camera");
	readKey(cam, "index",	c.cameraIndex, nonNeg);
	readKey(cam, "width",	c.frameWidth, positive);
	readKey(cam, "height",	c.frameHeight, positive);
	readKey(cam, "fps",		c.fps, positive);

	cfg = c;
	return true;
}

bool ConfigLoader::loadFile(const QString& path, RecognitionConfig& cfg)
{
	std::ifstream in(path.toStdString());
	if (!in.is_open()) {
		qWarning() << "[Config] open failed:" << path;
		return false;
	}
	std::stringstream ss;
	ss << in.rdbuf();

	if (!parse(ss.str(), cfg)) {
		qWarning() << "[Config] load failed:" << path;
		return false;
	}
	qInfo() << "[Config] loaded" << path
			<< "thr=" << cfg.recognitionThreshold << "quality=" << cfg.qualityThreshold
			<< "skip=" << cfg.frameSkip << "duration=" << cfg.sessionDurationSec;
	return true;
}

std::string ConfigLoader::dump(const RecognitionConfig& c)
{
	json root;
	root["recognition"] = {
		{ "recognition_threshold",	  c.recognitionThreshold },
		{ "quality_threshold",		  c.qualityThreshold },
		{ "frame_skip",				  c.frameSkip },
		{ "min_face_size",			  c.minFaceSize },
		{ "detector_score_threshold", c.detectorScoreThreshold },
		{ "liveness_for_unknown",	  c.livenessForUnknown },
	};
	root["session"] = {
		{ "session_duration_sec", c.sessionDurationSec },
		{ "accept_spoofed",		  c.acceptSpoofed },
	};
	root["registration"] = {
		{ "min_samples",		 c.minRegistrationSamples },
		{ "max_samples",		 c.maxRegistrationSamples },
		{ "duplicate_threshold", c.duplicateThreshold },
	};
	root["paths"] = {
		{ "detector_model",	 c.detectorModel.toStdString() },
		{ "embedder_model",	 c.embedderModel.toStdString() },
		{ "face_mesh_model", c.faceMeshModel.toStdString() },
		{ "gallery_file",	 c.galleryFile.toStdString() },
		{ "database_file",	 c.databaseFile.toStdString() },
		{ "log_dir",		 c.logDir.toStdString() },
	};
	root["camera"] = {
		{ "index",	c.cameraIndex },
		{ "width",	c.frameWidth },
		{ "height", c.frameHeight },
		{ "fps",	c.fps },
	};
	return root.dump(2);
}
