#pragma once
#include <vector>
#include <array>
#include <memory>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QVariantMap>
#include <opencv2/opencv.hpp>

#include "include/states.hpp"

// 검출 결과 (얼굴 1개)
struct FaceDet {
	cv::Rect box;
	std::array<cv::Point2f, 5> lmk;				// leftEye, right Eye, nose, mouthL, mouthR
	bool hasLandmarks = false;
	float score = 0.0f;
};

// 얼굴 품질 (모든 값 0~1)
struct QualityReport {
	double sharpness	= 0.0;
	double brightness	= 0.0;
	double contrast		= 0.0;
	double resolution	= 0.0;
	double frontal		= 0.0;
	double overall		= 0.0;
};

// 라이브니스 결과
struct LivenessReport {
	bool evaluated	  = false;		// 이 얼굴에 대해 검사를 수행했는지
	bool isReal		  = false;
	double confidence = 0.0;
	QMap<QString, bool> checks;		// "texture", "depth_variance", "color_distribution"
};

// 얼굴 1개에 대한 최종 판정
struct MatchResult {
	cv::Rect	   box;
	FaceStatus	   status = FaceStatus::Unknown;
	QString		   identity;			// 비어 있으면 Unknown
	float		   confidence = 0.0f;
	QualityReport  quality;
	LivenessReport liveness;
	cv::Mat		   faceCrop;			// 정렬된 얼굴 (출석 스냅샷용)

	bool known() const { return !identity.isEmpty(); }
};

// 매처 결과 (identity 부분만)
struct MatchDecision {
	QString identity;
	float	confidence = 0.0f;		// 수락된 경우 avg_similarity, 아니면 0
	float	bestAvg	   = -1.0f;		// 진단용: 최고 평균 유사도
	float	secondAvg  = -1.0f;		// 진단용: 2위 평균 유사도
	QString bestCandidate;			// threshold와 무관한 최고 후보
};

// 갤러리 한 사람 분량 (저장소와 주고받는 단위)
struct GalleryRecord {
	QString							identity;
	std::vector<std::vector<float>> templates;		// 각 템플릿은 L2=1
	QVariantMap						metadata;
};

using GallerySnapshot = std::shared_ptr<const std::vector<GalleryRecord>>;

// 출석 이벤트
struct PresenceEvent {
	QString	  identity;
	QDateTime timestamp;
	float	  confidence	 = 0.0f;
	double	  qualityOverall = 0.0;
	cv::Mat	  snapshot;
};

struct AbsenceEvent {
	QString	  identity;
	QDateTime timestamp;
};

// 세션 종료 요약
struct SessionSummary {
	QStringList present;
	QStringList absent;
	int			total				= 0;
	double		attendanceRate		= 0.0;		// %
	double		averageConfidence	= 0.0;
};

// 카메라 프레임 + 캡처 시각
struct Frame {
	cv::Mat	  bgr;
	QDateTime capturedAt;
	quint64	  seq = 0;
};
