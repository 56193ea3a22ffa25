#include "LandmarkAligner.hpp"
#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

// ArcFace 112x112 기준점
const LandmarkAligner::Points5 kArcFace112 = {{
	{38.2946f, 51.6963f},
	{73.5318f, 50.5014f},
	{56.0252f, 71.7366f},
	{41.5493f, 92.3655f},
	{70.7299f, 92.2041f}
}};

const cv::Scalar kPadGray(127, 127, 127);

} // namespace

cv::Mat LandmarkAligner::warpToTemplate(const cv::Mat& srcBgr, Points5 pts, const cv::Size& outSize)
{
	if (srcBgr.empty() || outSize.area() <= 0) return {};

	// 좌우가 뒤바뀐 검출 보정
	if (pts[0].x > pts[1].x) std::swap(pts[0], pts[1]);
	if (pts[3].x > pts[4].x) std::swap(pts[3], pts[4]);

	// 템플릿을 출력 크기에 맞춰 스케일
	const float sx = outSize.width / 112.f;
	const float sy = outSize.height / 112.f;
	std::vector<cv::Point2f> dst;
	dst.reserve(kArcFace112.size());
	for (const auto& p : kArcFace112) dst.emplace_back(p.x * sx, p.y * sy);

	const std::vector<cv::Point2f> src(pts.begin(), pts.end());

	cv::Mat M;
	try {
		M = cv::estimateAffinePartial2D(src, dst, cv::noArray(), cv::LMEDS);
	} catch (const cv::Exception& e) {
		qWarning() << "[Aligner] similarity estimate failed:" << e.what();
		return {};
	}
	if (M.empty()) return {};

	cv::Mat out;
	cv::warpAffine(srcBgr, out, M, outSize, cv::INTER_LINEAR, cv::BORDER_CONSTANT, kPadGray);
	return out;
}

cv::Rect LandmarkAligner::squareRoi(const cv::Rect& box, float scale, const cv::Size& imgSz)
{
	if (box.area() <= 0) return {};
	const float cx	 = box.x + box.width * 0.5f;
	const float cy	 = box.y + box.height * 0.5f;
	const float half = 0.5f * scale * static_cast<float>(std::max(box.width, box.height));

	const cv::Rect sq(cv::Point(cvRound(cx - half), cvRound(cy - half)),
					  cv::Point(cvRound(cx + half), cvRound(cy + half)));
	return sq & cv::Rect(cv::Point(0, 0), imgSz);
}

cv::Mat LandmarkAligner::padToSquare(const cv::Mat& src, int side)
{
	if (src.empty() || side <= 0) return {};

	const int n		= std::max(src.cols, src.rows);
	const int padY	= n - src.rows;
	const int padX	= n - src.cols;

	cv::Mat square;
	cv::copyMakeBorder(src, square, padY / 2, padY - padY / 2, padX / 2, padX - padX / 2,
					   cv::BORDER_CONSTANT, kPadGray);
	if (n == side) return square;

	cv::Mat out;
	cv::resize(square, out, cv::Size(side, side), 0, 0, n > side ? cv::INTER_AREA : cv::INTER_LINEAR);
	return out;
}

cv::Mat LandmarkAligner::cropFace(const cv::Mat& srcBgr, const FaceDet& det, const cv::Size& outSize) const
{
	if (srcBgr.empty()) return {};

	if (det.hasLandmarks) {
		cv::Mat aligned = warpToTemplate(srcBgr, det.lmk, outSize);
		if (!aligned.empty()) return aligned;
		qDebug() << "[Aligner] landmark warp failed, falling back to box crop";
	}

	const cv::Rect roi = squareRoi(det.box, kFallbackScale, srcBgr.size());
	if (roi.area() <= 0) return {};

	cv::Mat crop = padToSquare(srcBgr(roi), outSize.width);
	if (crop.empty() || outSize.width == outSize.height) return crop;

	cv::Mat out;
	cv::resize(crop, out, outSize);
	return out;
}
