#pragma once

namespace recog {
	// Quality
	inline constexpr double K_SHARP			 = 500.0;	// Laplacian variance 정규화 상수
	inline constexpr double MIN_USABLE_PX	 = 160.0;	// 이 이상이면 resolution=1
	inline constexpr double IDEAL_EYE_RATIO	 = 0.30;	// 눈 사이 거리 / 얼굴 폭 (정면)
	inline constexpr double NEUTRAL_FRONTAL	 = 0.80;	// 랜드마크 없을 때

	// Liveness
	inline constexpr double TEXTURE_FLOOR	 = 20.0;	// Laplacian variance
	inline constexpr double DEPTH_VAR_FLOOR	 = 0.001;	// face-mesh z variance
	inline constexpr double HIST_CHISQR_MAX	 = 100.0;
	inline constexpr int	HIST_MIN_BINS	 = 2;		// 단색/빈 입력 방지

	// Embedding / Matching
	inline constexpr int	MIN_CROP_PX		 = 32;
	inline constexpr int	EMB_INPUT		 = 112;
	inline constexpr int	TOP_K			 = 3;

	// Defaults (config로 덮어씀)
	inline constexpr double COS_THR			 = 0.70;
	inline constexpr double QUALITY_THR		 = 0.60;
	inline constexpr double DETECT_THR		 = 0.60;
	inline constexpr int	FRAME_SKIP		 = 2;
	inline constexpr int	MIN_FACE_PX		 = 80;
	inline constexpr int	SESSION_SEC		 = 600;
	inline constexpr int	MIN_REG_SAMPLES	 = 3;
	inline constexpr int	MAX_REG_SAMPLES	 = 7;
	inline constexpr double SAME_POSE_SIM	 = 0.98;	// 등록 시 동일 자세 판정
}
