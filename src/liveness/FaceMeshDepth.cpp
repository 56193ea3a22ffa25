#include "liveness/FaceMeshDepth.hpp"
#include <filesystem>
#include <QtCore/QDebug>

namespace fs = std::filesystem;

const std::vector<int> DnnFaceMeshDepth::kDepthIndices = { 1, 33, 61, 199, 263, 291 };

DnnFaceMeshDepth::DnnFaceMeshDepth(const std::string& modelPath)
{
	if (!fs::exists(modelPath)) {
		qWarning() << "[FaceMesh] model not found:" << QString::fromStdString(modelPath);
		return;
	}

	try {
		net_ = cv::dnn::readNetFromONNX(modelPath);
		net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
		net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
		ready_ = !net_.empty();
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceMesh] readNetFromONNX failed:" << e.what();
		ready_ = false;
	}

	qInfo() << "[FaceMesh] ready=" << ready_ << "model=" << QString::fromStdString(modelPath);
}

bool DnnFaceMeshDepth::depthOf(const cv::Mat& face, std::vector<float>& zs) const
{
	zs.clear();
	if (!ready_ || face.empty() || face.type() != CV_8UC3) return false;

	std::lock_guard<std::mutex> lk(mtx_);
	try {
		// 0~1 스케일, RGB, 192x192
		cv::Mat blob = cv::dnn::blobFromImage(face, 1.0 / 255.0, cv::Size(kInput, kInput),
											  cv::Scalar(), /*swapRB=*/true, /*crop=*/false, CV_32F);
		net_.setInput(blob);
		cv::Mat out = net_.forward();
		if (out.empty() || out.total() < static_cast<size_t>(kPoints * 3)) {
			qWarning() << "[FaceMesh] unexpected output size=" << (int)out.total();
			return false;
		}

		out = out.reshape(1, 1);
		if (out.type() != CV_32F) out.convertTo(out, CV_32F);
		const float* p = out.ptr<float>(0);

		zs.reserve(kDepthIndices.size());
		for (int idx : kDepthIndices) {
			zs.push_back(p[idx * 3 + 2] / static_cast<float>(kInput));
		}
		return true;
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceMesh] forward failed:" << e.what();
		zs.clear();
		return false;
	}
}
