#include "match/FaceMatcher.hpp"
#include "include/recog_params.hpp"
#include "log/attendance_logging.hpp"

#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>
#include <functional>

bool FaceMatcher::scoreIdentity(const std::vector<float>& unitProbe,
								const std::vector<std::vector<float>>& templates,
								float& avgOut)
{
	const std::size_t dim = unitProbe.size();
	std::vector<float> sims;
	sims.reserve(templates.size());

	for (const auto& t : templates) {
		if (t.size() != dim) {
			qCWarning(LC_MATCH) << "[FaceMatcher] dim mismatch" << (int)t.size() << "vs" << (int)dim;
			continue;
		}
		double dot = 0.0;
		for (std::size_t i = 0; i < dim; ++i) dot += static_cast<double>(unitProbe[i]) * t[i];
		sims.push_back(static_cast<float>(dot));
	}
	if (sims.empty()) return false;

	const std::size_t k = std::min<std::size_t>(recog::TOP_K, sims.size());
	std::partial_sort(sims.begin(), sims.begin() + k, sims.end(), std::greater<float>());

	double sum = 0.0;
	for (std::size_t i = 0; i < k; ++i) sum += sims[i];
	avgOut = static_cast<float>(sum / static_cast<double>(k));
	return true;
}

MatchDecision FaceMatcher::match(const std::vector<float>& probe,
								 const GallerySnapshot& gallery,
								 float threshold)
{
	MatchDecision r;
	if (!gallery || gallery->empty()) {
		qCDebug(LC_MATCH) << "[FaceMatcher] gallery is empty";
		return r;
	}
	if (probe.empty()) {
		qCWarning(LC_MATCH) << "[FaceMatcher] input embedding is empty";
		return r;
	}

	// probe 정규화 (추출기가 이미 정규화하지만 외부 입력 대비)
	double s = 0.0;
	for (float x : probe) s += static_cast<double>(x) * x;
	const double nq = std::sqrt(s);
	if (!std::isfinite(nq) || nq <= 0.0) return r;
	std::vector<float> q(probe.size());
	for (std::size_t i = 0; i < probe.size(); ++i) q[i] = static_cast<float>(probe[i] / nq);

	// 등록 순서대로 스캔, strict '>' 로 동점은 먼저 등록된 쪽 유지
	for (const auto& rec : *gallery) {
		float avg = 0.0f;
		if (!scoreIdentity(q, rec.templates, avg)) continue;

		if (avg > r.bestAvg) {
			r.secondAvg = r.bestAvg;
			r.bestAvg = avg;
			r.bestCandidate = rec.identity;
		} else if (avg > r.secondAvg) {
			r.secondAvg = avg;
		}
	}

	if (!r.bestCandidate.isEmpty() && r.bestAvg > threshold) {
		r.identity = r.bestCandidate;
		r.confidence = r.bestAvg;
	}

	qCDebug(LC_MATCH) << "[FaceMatcher] best=" << r.bestCandidate << "avg=" << r.bestAvg
					  << "second=" << r.secondAvg << "thr=" << threshold
					  << (r.identity.isEmpty() ? "-> Unknown" : "-> accept");
	return r;
}
