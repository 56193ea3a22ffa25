#pragma once
#include <memory>
#include <vector>
#include <QMutex>
#include <QString>
#include <QVariantMap>
#include <opencv2/opencv.hpp>

#include "include/types.hpp"
#include "detect/FaceDetector.hpp"
#include "detect/LandmarkAligner.hpp"
#include "ai/Embedder.hpp"
#include "quality/QualityAssessor.hpp"
#include "gallery/Gallery.hpp"
#include "services/IGalleryStore.hpp"
#include "config/RecognitionSettings.hpp"

struct RegistrationResult {
	bool	success = false;
	QString reason;				// 실패 사유 (성공 시 비어 있음)
	int		templates = 0;
};

// 다중 샘플 등록: begin -> addFrame x N -> finish
// 저장소와 갤러리는 finish 에서 한 번에 커밋 (실패 시 둘 다 그대로)
class EnrollmentService {
	public:
		EnrollmentService(std::shared_ptr<IFaceDetector> detector,
						  std::shared_ptr<IEmbedder> embedder,
						  Gallery* gallery,
						  IGalleryStore* store,
						  const RecognitionSettings* settings);

		bool begin(const QString& identity, const QVariantMap& metadata = {});
		CaptureStatus addFrame(const cv::Mat& frame);
		RegistrationResult finish();
		void cancel();

		bool isActive() const;
		int sampleCount() const;
		QString identity() const;

		// 이미지 묶음으로 한 번에 등록. 한 장이라도 샘플이 안 되면 전체 실패
		RegistrationResult registerImages(const QString& identity,
										  const std::vector<cv::Mat>& images,
										  const QVariantMap& metadata = {});

	private:
		CaptureStatus captureLocked(const cv::Mat& frame, const RecognitionConfig& cfg);
		bool isDuplicate(const std::vector<float>& emb, const RecognitionConfig& cfg,
						 QString* who, float* sim) const;
		void resetLocked();

		std::shared_ptr<IFaceDetector> detector_;
		std::shared_ptr<IEmbedder> embedder_;
		Gallery* gallery_ = nullptr;
		IGalleryStore* store_ = nullptr;
		const RecognitionSettings* settings_ = nullptr;

		QualityAssessor quality_;
		LandmarkAligner aligner_;

		mutable QMutex mu_;
		bool active_ = false;
		QString identity_;
		QVariantMap metadata_;
		std::vector<std::vector<float>> samples_;
		QString lastReason_;
};
