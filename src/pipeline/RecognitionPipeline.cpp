#include "pipeline/RecognitionPipeline.hpp"
#include "match/FaceMatcher.hpp"
#include "log/attendance_logging.hpp"
#include <QtCore/QDebug>
#include <algorithm>

namespace {
constexpr quint64 kStatsLogEvery = 300;		// 처리 프레임 기준
}

RecognitionPipeline::RecognitionPipeline(std::shared_ptr<IFaceDetector> detector,
										 std::shared_ptr<IEmbedder> embedder,
										 std::shared_ptr<LivenessGate> liveness,
										 const Gallery* gallery,
										 const RecognitionSettings* settings)
	: detector_(std::move(detector)),
	  embedder_(std::move(embedder)),
	  liveness_(std::move(liveness)),
	  gallery_(gallery),
	  settings_(settings)
{
}

std::vector<MatchResult> RecognitionPipeline::process(const cv::Mat& frame)
{
	const quint64 n = ++framesSeen_;
	const int skip = settings_ ? std::max(1, settings_->snapshot().frameSkip) : 1;
	if (n % static_cast<quint64>(skip) != 0) return {};

	return analyze(frame);
}

std::vector<FaceDet> RecognitionPipeline::detect(const cv::Mat& frame, const RecognitionConfig& cfg) const
{
	std::vector<FaceDet> out;
	if (!detector_) return out;

	const cv::Rect bounds(0, 0, frame.cols, frame.rows);
	for (auto& d : detector_->detectAll(frame)) {
		if (d.score < cfg.detectorScoreThreshold) continue;
		if (d.box.width < cfg.minFaceSize || d.box.height < cfg.minFaceSize) continue;
		if ((d.box & bounds).area() <= 0) continue;
		out.push_back(std::move(d));
	}

	std::sort(out.begin(), out.end(), [](const FaceDet& a, const FaceDet& b) {
		if (a.box.x != b.box.x) return a.box.x < b.box.x;
		return a.box.y < b.box.y;
	});
	return out;
}

std::vector<MatchResult> RecognitionPipeline::analyze(const cv::Mat& frame)
{
	std::vector<MatchResult> results;
	if (frame.empty()) return results;

	const RecognitionConfig cfg = settings_ ? settings_->snapshot() : RecognitionConfig{};
	const quint64 processed = ++framesProcessed_;

	const auto dets = detect(frame, cfg);
	if (!dets.empty()) {
		// 프레임 단위로 갤러리 스냅샷 1회
		const GallerySnapshot gallery = gallery_ ? gallery_->snapshot() : GallerySnapshot{};
		results.reserve(dets.size());
		for (const auto& d : dets) {
			results.push_back(judge(frame, d, gallery, cfg));
		}
	}

	if (processed % kStatsLogEvery == 0) {
		const Stats s = stats();
		qCInfo(LC_PIPELINE) << "[Pipeline] frames" << s.framesProcessed << "/" << s.framesSeen
							<< "faces=" << s.faces << "lowQ=" << s.lowQuality
							<< "extractFail=" << s.extractionFailed << "match=" << s.matchCalls
							<< "recognized=" << s.recognized << "spoof=" << s.spoofSuspected;
	}
	return results;
}

MatchResult RecognitionPipeline::judge(const cv::Mat& frame, const FaceDet& det,
									   const GallerySnapshot& gallery, const RecognitionConfig& cfg)
{
	++faces_;

	MatchResult r;
	r.box = det.box & cv::Rect(0, 0, frame.cols, frame.rows);

	// ── 1) 품질 게이트 ──
	const cv::Mat raw = frame(r.box);
	r.quality = quality_.assess(raw, det.hasLandmarks ? &det.lmk : nullptr);
	if (r.quality.overall < cfg.qualityThreshold) {
		r.status = FaceStatus::LowQuality;
		++lowQuality_;
		qCDebug(LC_PIPELINE) << "[Pipeline] low quality" << r.quality.overall << "<" << cfg.qualityThreshold;
		return r;
	}

	// ── 2) 정렬 + 임베딩 ──
	const cv::Mat aligned = aligner_.cropFace(frame, det, cv::Size(recog::EMB_INPUT, recog::EMB_INPUT));
	std::vector<float> probe;
	try {
		if (!embedder_) throw ExtractionError("no embedder");
		if (aligned.empty()) throw ExtractionError("alignment and fallback crop failed");
		probe = embedder_->extract(aligned);
	} catch (const ExtractionError& e) {
		r.status = FaceStatus::ExtractionFailed;
		++extractionFailed_;
		qCWarning(LC_PIPELINE) << "[Pipeline] extraction failed:" << e.what();
		return r;
	}
	r.faceCrop = aligned;

	// ── 3) 매칭 ──
	++matchCalls_;
	const MatchDecision m = FaceMatcher::match(probe, gallery,
											   static_cast<float>(cfg.recognitionThreshold));
	if (!m.identity.isEmpty()) {
		r.status = FaceStatus::Recognized;
		r.identity = m.identity;
		r.confidence = m.confidence;
		++recognized_;
	} else {
		r.status = FaceStatus::Unknown;
		r.confidence = 0.0f;
	}

	// ── 4) 라이브니스 (인식된 얼굴만, 설정 시 전부) ──
	if (liveness_ && (r.known() || cfg.livenessForUnknown)) {
		r.liveness = liveness_->check(frame, r.box);
		if (!r.liveness.isReal) ++spoofSuspected_;
	}

	return r;
}

RecognitionPipeline::Stats RecognitionPipeline::stats() const
{
	Stats s;
	s.framesSeen	   = framesSeen_.load();
	s.framesProcessed  = framesProcessed_.load();
	s.faces			   = faces_.load();
	s.lowQuality	   = lowQuality_.load();
	s.extractionFailed = extractionFailed_.load();
	s.matchCalls	   = matchCalls_.load();
	s.recognized	   = recognized_.load();
	s.spoofSuspected   = spoofSuspected_.load();
	return s;
}

void RecognitionPipeline::resetStats()
{
	framesSeen_ = 0;
	framesProcessed_ = 0;
	faces_ = 0;
	lowQuality_ = 0;
	extractionFailed_ = 0;
	matchCalls_ = 0;
	recognized_ = 0;
	spoofSuspected_ = 0;
}
