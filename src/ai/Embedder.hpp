#pragma once
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <QString>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// 임베딩 추출 실패 (모델 미로딩, 너무 작은 크롭, 추론 실패, norm 0)
class ExtractionError : public std::runtime_error {
	public:
		explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

class IEmbedder {
	public:
		virtual ~IEmbedder() = default;

		// 얼굴 크롭(BGR, 8UC3) -> L2 정규화된 템플릿. 실패 시 ExtractionError
		virtual std::vector<float> extract(const cv::Mat& face) const = 0;
		virtual int dim() const = 0;
};

// ONNX 얼굴 임베딩 (ArcFace/MobileFaceNet 계열, 112x112 입력)
class Embedder : public IEmbedder {
	public:
		struct Options {
			QString modelPath;
			int inputSize	  = 112;
			bool swapRB		  = true;	// 모델이 RGB 입력
			bool normalizeIn  = false;	// (x-127.5)/128 를 blob 단계에서 적용
			bool flipAverage  = true;	// 원본 + 좌우반전 평균
		};

		explicit Embedder(Options opt);

		bool isReady() const { return ready_; }
		const QString& modelPath() const { return opt_.modelPath; }

		std::vector<float> extract(const cv::Mat& face) const override;
		// 첫 추출 전에는 0
		int dim() const override;

		static float cosine(const std::vector<float>& a, const std::vector<float>& b);
		// 제자리 L2 정규화. norm 이 0 이면 false
		static bool l2normInPlace(std::vector<float>& v);

	private:
		bool load();
		cv::Mat makeBlob(const cv::Mat& face) const;
		cv::Mat infer(const cv::Mat& face) const;

		Options opt_;
		bool ready_ = false;

		mutable std::mutex mtx_;
		mutable cv::dnn::Net net_;
		mutable int dim_ = 0;
};
