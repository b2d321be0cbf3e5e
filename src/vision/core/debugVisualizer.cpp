#include "vision/core/debugVisualizer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace kibitz::vision::core {

bool debugLoggingEnabled() {
	const char* env = std::getenv("KIBITZ_VISION_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		return;
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});
}

std::size_t DebugVisualizer::stageCount() const {
	return m_stages.size() + (m_hasActiveStage ? 1u : 0u);
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_SIZE     = 320;
	static constexpr int STAGE_LABEL_W = 180;
	static constexpr int STEP_LABEL_H  = 26;
	static constexpr int TILE_PAD      = 4;

	static const cv::Scalar BG(24, 24, 24);
	static const cv::Scalar LABEL_BG(0, 0, 0);
	static const cv::Scalar LABEL_FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	std::size_t maxSteps = 0u;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}
	if (maxSteps == 0u) {
		return {};
	}

	const int rows    = static_cast<int>(m_stages.size());
	const int mosaicW = STAGE_LABEL_W + static_cast<int>(maxSteps) * TILE_SIZE;
	const int mosaicH = rows * TILE_SIZE;
	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	for (int r = 0; r < rows; ++r) {
		const auto& stage = m_stages[static_cast<std::size_t>(r)];
		const int y       = r * TILE_SIZE;

		// Stage label column on the left.
		cv::Mat label = mosaic(cv::Rect(0, y, STAGE_LABEL_W, TILE_SIZE));
		label.setTo(LABEL_BG);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(r + 1) : stage.name;
		cv::putText(label, stageName, cv::Point(8, TILE_SIZE / 2), cv::FONT_HERSHEY_SIMPLEX, 0.6, LABEL_FG, 1, cv::LINE_AA);

		for (std::size_t s = 0u; s < stage.steps.size(); ++s) {
			const auto& step = stage.steps[s];
			cv::Mat cell     = mosaic(cv::Rect(STAGE_LABEL_W + static_cast<int>(s) * TILE_SIZE, y, TILE_SIZE, TILE_SIZE));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, STEP_LABEL_H), LABEL_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 18), cv::FONT_HERSHEY_SIMPLEX, 0.5, LABEL_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW = TILE_SIZE - 2 * TILE_PAD;
			const int availH = TILE_SIZE - STEP_LABEL_H - 2 * TILE_PAD;

			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = STEP_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}
	}

	return mosaic;
}

bool DebugVisualizer::saveMosaic(const std::filesystem::path& path) {
	const cv::Mat mosaic = buildMosaic();
	if (mosaic.empty()) {
		std::cerr << "[Warning] No debug images collected, nothing written to " << path << '\n';
		return false;
	}
	try {
		if (!cv::imwrite(path.string(), mosaic)) {
			std::cerr << "[Error] Could not write debug mosaic to " << path << '\n';
			return false;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not write debug mosaic to " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// Stretch non 8 bit images (masks, float maps) to the full range.
	if (in.depth() != CV_8U) {
		double minV = 0.0;
		double maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		const double range = maxV - minV;
		in.convertTo(out, CV_8U, range < 1e-9 ? 1.0 : 255.0 / range, range < 1e-9 ? 0.0 : -minV * 255.0 / range);
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace kibitz::vision::core
