#pragma once
#include <QObject>

// 얼굴별 처리 상태
enum class FaceStatus {
	Recognized,			// 갤러리와 매칭됨
	Unknown,			// threshold 미달
	LowQuality,			// 품질 게이트 탈락 (임베딩/매칭 생략)
	ExtractionFailed	// 임베딩 추출 실패 (건너뜀)
};

// 출석 세션 상태
enum class SessionState {
	Idle = 0,
	Active,				// 1
	Ended				// 2 (terminal)
};

// 등록 중 프레임 처리 결과
enum class CaptureStatus {
	NotRegistering,
	FaceNotDetected,
	MultipleFaces,
	LowQuality,
	TooSimilar,			// 직전 샘플과 거의 동일 (자세 변화 없음)
	ExtractionFailed,
	DuplicateFace,		// 다른 사람으로 이미 등록된 얼굴
	Captured,
	Complete			// 최대 샘플 수 도달
};

inline const char* toString(FaceStatus s)
{
	switch (s) {
		case FaceStatus::Recognized:		return "Recognized";
		case FaceStatus::Unknown:			return "Unknown";
		case FaceStatus::LowQuality:		return "Low Quality";
		case FaceStatus::ExtractionFailed:	return "Extraction Failed";
	}
	return "?";
}

inline const char* toString(SessionState s)
{
	switch (s) {
		case SessionState::Idle:	return "Idle";
		case SessionState::Active:	return "Active";
		case SessionState::Ended:	return "Ended";
	}
	return "?";
}

Q_DECLARE_METATYPE(FaceStatus)
Q_DECLARE_METATYPE(SessionState)
Q_DECLARE_METATYPE(CaptureStatus)
