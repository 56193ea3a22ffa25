#pragma once
#include <vector>
#include "include/types.hpp"

// 앙상블 코사인 매칭기. 갤러리는 호출 시점 스냅샷을 받는다(소유권 없음)
class FaceMatcher {
	public:
		// identity 별 top-k(k = min(3, n)) 유사도 평균 중 최고를 고르고,
		// 평균 > threshold 일 때만 수락. 동점은 먼저 등록된 identity.
		static MatchDecision match(const std::vector<float>& probe,
								   const GallerySnapshot& gallery,
								   float threshold);

		// 한 identity 의 top-k 평균. 쓸 수 있는 템플릿이 없으면 false
		static bool scoreIdentity(const std::vector<float>& unitProbe,
								  const std::vector<std::vector<float>>& templates,
								  float& avgOut);
};
