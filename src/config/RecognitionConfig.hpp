#pragma once
#include <QString>
#include "include/recog_params.hpp"
#include "include/common_path.hpp"

// 실행 중 바꿀 수 있는 인식/세션 파라미터 + 경로
struct RecognitionConfig {
	// recognition
	double recognitionThreshold		= recog::COS_THR;
	double qualityThreshold			= recog::QUALITY_THR;
	int	   frameSkip				= recog::FRAME_SKIP;		// >= 1
	int	   minFaceSize				= recog::MIN_FACE_PX;
	double detectorScoreThreshold	= recog::DETECT_THR;
	bool   livenessForUnknown		= false;

	// session
	int	   sessionDurationSec		= recog::SESSION_SEC;
	bool   acceptSpoofed			= false;

	// registration
	int	   minRegistrationSamples	= recog::MIN_REG_SAMPLES;
	int	   maxRegistrationSamples	= recog::MAX_REG_SAMPLES;
	double duplicateThreshold		= recog::COS_THR;

	// paths
	QString detectorModel			= YNMODEL_PATH YNMODEL;
	QString embedderModel			= SFACE_RECOGNIZER_PATH SFACE_RECOGNIZER;
	QString faceMeshModel			= FACEMESH_PATH FACEMESH;	// 비어 있으면 depth 검사 생략
	QString galleryFile				= GALLERY_JSON_PATH GALLERY_JSON;
	QString databaseFile			= DB_PATH DB;
	QString logDir					= LOG_DIR;

	// camera
	int	   cameraIndex				= 0;
	int	   frameWidth				= 640;
	int	   frameHeight				= 480;
	int	   fps						= 30;
};
