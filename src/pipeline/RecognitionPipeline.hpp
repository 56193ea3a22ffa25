#pragma once
#include <atomic>
#include <memory>
#include <vector>
#include <opencv2/opencv.hpp>

#include "include/types.hpp"
#include "detect/FaceDetector.hpp"
#include "detect/LandmarkAligner.hpp"
#include "ai/Embedder.hpp"
#include "quality/QualityAssessor.hpp"
#include "liveness/LivenessGate.hpp"
#include "gallery/Gallery.hpp"
#include "config/RecognitionSettings.hpp"

// 프레임 1장 -> 얼굴별 판정 (왼쪽에서 오른쪽 순)
// detect -> quality gate -> embed -> match -> liveness
class RecognitionPipeline {
	public:
		struct Stats {
			quint64 framesSeen		 = 0;
			quint64 framesProcessed	 = 0;
			quint64 faces			 = 0;
			quint64 lowQuality		 = 0;
			quint64 extractionFailed = 0;
			quint64 matchCalls		 = 0;
			quint64 recognized		 = 0;
			quint64 spoofSuspected	 = 0;
		};

		RecognitionPipeline(std::shared_ptr<IFaceDetector> detector,
							std::shared_ptr<IEmbedder> embedder,
							std::shared_ptr<LivenessGate> liveness,
							const Gallery* gallery,
							const RecognitionSettings* settings);

		// frame_skip 적용. 건너뛴 프레임은 빈 결과
		std::vector<MatchResult> process(const cv::Mat& frame);
		// frame_skip 없이 바로 처리
		std::vector<MatchResult> analyze(const cv::Mat& frame);

		Stats stats() const;
		void resetStats();

	private:
		std::vector<FaceDet> detect(const cv::Mat& frame, const RecognitionConfig& cfg) const;
		MatchResult judge(const cv::Mat& frame, const FaceDet& det,
						  const GallerySnapshot& gallery, const RecognitionConfig& cfg);

		std::shared_ptr<IFaceDetector> detector_;
		std::shared_ptr<IEmbedder> embedder_;
		std::shared_ptr<LivenessGate> liveness_;
		const Gallery* gallery_ = nullptr;
		const RecognitionSettings* settings_ = nullptr;

		QualityAssessor quality_;
		LandmarkAligner aligner_;

		std::atomic<quint64> framesSeen_{0};
		std::atomic<quint64> framesProcessed_{0};
		std::atomic<quint64> faces_{0};
		std::atomic<quint64> lowQuality_{0};
		std::atomic<quint64> extractionFailed_{0};
		std::atomic<quint64> matchCalls_{0};
		std::atomic<quint64> recognized_{0};
		std::atomic<quint64> spoofSuspected_{0};
};
