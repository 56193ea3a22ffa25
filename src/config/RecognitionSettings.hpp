#pragma once
#include <QReadWriteLock>
#include "config/RecognitionConfig.hpp"

// 실행 중 설정 보관소. 파이프라인은 프레임마다 snapshot() 을 읽는다
class RecognitionSettings {
	public:
		RecognitionSettings() = default;
		explicit RecognitionSettings(const RecognitionConfig& cfg) : cfg_(cfg) {}

		RecognitionConfig snapshot() const {
			QReadLocker lk(&lock_);
			return cfg_;
		}

		void update(const RecognitionConfig& cfg) {
			QWriteLocker lk(&lock_);
			cfg_ = cfg;
			if (cfg_.frameSkip < 1) cfg_.frameSkip = 1;
		}

	private:
		mutable QReadWriteLock lock_;
		RecognitionConfig cfg_;
};
