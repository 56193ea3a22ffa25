#include "Embedder.hpp"
#include "include/recog_params.hpp"
#include <opencv2/imgproc.hpp>
#include <QtCore/QDebug>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>
#include <algorithm>
#include <cmath>

// #define DEBUG

Embedder::Embedder(Options opt) : opt_(std::move(opt))
{
	ready_ = load();
}

bool Embedder::load()
{
	if (!QFileInfo::exists(opt_.modelPath)) {
		qCritical() << "[Embedder] model not found:" << opt_.modelPath;
		return false;
	}

	try {
		net_ = cv::dnn::readNetFromONNX(opt_.modelPath.toStdString());
	} catch (const cv::Exception& e) {
		qCritical() << "[Embedder] ONNX load failed:" << e.what();
		return false;
	}
	if (net_.empty()) return false;

	net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
	net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

	QStringList outs;
	for (const auto& s : net_.getUnconnectedOutLayersNames()) outs << QString::fromStdString(s);
	qDebug() << "[Embedder] loaded" << opt_.modelPath << "outputs=" << outs;
	return true;
}

int Embedder::dim() const
{
	std::lock_guard<std::mutex> lk(mtx_);
	return dim_;
}

cv::Mat Embedder::makeBlob(const cv::Mat& face) const
{
	const double scale	 = opt_.normalizeIn ? 1.0 / 128.0 : 1.0;
	const cv::Scalar mean = opt_.normalizeIn ? cv::Scalar::all(127.5) : cv::Scalar();
	const int S = opt_.inputSize;

	cv::Mat blob = cv::dnn::blobFromImage(face, scale, cv::Size(S, S), mean, opt_.swapRB,
										  /*crop=*/false, CV_32F);
	// NCHW 1x3xSxS 가 아니면 모델/입력 불일치
	const bool shapeOk = blob.dims == 4 && blob.size[0] == 1 && blob.size[1] == 3
						 && blob.size[2] == S && blob.size[3] == S;
	if (!shapeOk) throw ExtractionError("unexpected input blob shape");
	return blob;
}

cv::Mat Embedder::infer(const cv::Mat& face) const
{
	net_.setInput(makeBlob(face));
	cv::Mat out = net_.forward();
	if (out.empty()) throw ExtractionError("inference returned no output");

	cv::Mat row = out.reshape(1, 1);
	cv::Mat f32;
	row.convertTo(f32, CV_32F);
	return f32;
}

std::vector<float> Embedder::extract(const cv::Mat& face) const
{
	if (!ready_) throw ExtractionError("embedding model not loaded");
	if (face.empty() || face.type() != CV_8UC3)
		throw ExtractionError("face crop must be 8-bit 3-channel");
	if (std::min(face.cols, face.rows) < recog::MIN_CROP_PX)
		throw ExtractionError("face crop smaller than " + std::to_string(recog::MIN_CROP_PX) + " px");

	std::lock_guard<std::mutex> lk(mtx_);

	cv::Mat acc;
	try {
		acc = infer(face);
		if (opt_.flipAverage) {
			cv::Mat mirrored;
			cv::flip(face, mirrored, 1);
			const cv::Mat second = infer(mirrored);
			if (second.cols != acc.cols) throw ExtractionError("flip output size mismatch");
			acc = (acc + second) * 0.5;
		}
	} catch (const cv::Exception& e) {
		throw ExtractionError(std::string("inference failed: ") + e.what());
	}

	std::vector<float> tpl(acc.begin<float>(), acc.end<float>());
	if (!l2normInPlace(tpl)) throw ExtractionError("embedding norm is zero");

	// 모델 출력 차원은 고정이어야 한다
	if (dim_ != 0 && dim_ != static_cast<int>(tpl.size()))
		throw ExtractionError("embedding dimension changed");
	dim_ = static_cast<int>(tpl.size());

#ifdef DEBUG
	qDebug() << "[Embedder] dim=" << dim_;
#endif
	return tpl;
}

bool Embedder::l2normInPlace(std::vector<float>& v)
{
	double sq = 0.0;
	for (float x : v) sq += double(x) * x;
	const double n = std::sqrt(sq);
	if (!std::isfinite(n) || n < 1e-12) return false;
	const double inv = 1.0 / n;
	for (auto& x : v) x = static_cast<float>(x * inv);
	return true;
}

float Embedder::cosine(const std::vector<float>& a, const std::vector<float>& b)
{
	if (a.empty() || a.size() != b.size()) return -1.f;

	double dot = 0.0, aa = 0.0, bb = 0.0;
	for (size_t i = 0; i < a.size(); ++i) {
		dot += double(a[i]) * b[i];
		aa	+= double(a[i]) * a[i];
		bb	+= double(b[i]) * b[i];
	}
	if (aa <= 0.0 || bb <= 0.0) return 0.f;
	return static_cast<float>(dot / std::sqrt(aa * bb));
}
