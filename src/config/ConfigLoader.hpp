#pragma once
#include <string>
#include <QString>
#include "config/RecognitionConfig.hpp"

// JSON 설정 파일 -> RecognitionConfig
// 없는 키는 기본값 유지, 범위를 벗어난 값은 경고 후 무시
class ConfigLoader {
	public:
		// 파일을 읽지 못하거나 JSON 파싱 실패 시 false (cfg 변경 없음)
		static bool loadFile(const QString& path, RecognitionConfig& cfg);
		static bool parse(const std::string& text, RecognitionConfig& cfg);

		// 현재 값을 같은 구조의 JSON 으로
		static std::string dump(const RecognitionConfig& cfg);
};
