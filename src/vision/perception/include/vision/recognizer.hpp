#pragma once

#include "vision/core/board.hpp"
#include "vision/core/boardLocator.hpp"
#include "vision/core/classModelStore.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/orientation.hpp"
#include "vision/core/pieceClassifier.hpp"
#include "vision/training/feedbackStore.hpp"
#include "vision/training/retrainingEngine.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string>

namespace kibitz::vision {

//! Every tunable of the recognition pipeline.
struct RecognizerConfig {
	core::LocatorConfig locator{};
	core::ClassifierConfig classifier{};
	core::OrientationConfig orientation{};
};

//! Outcome of reading one board photograph.
struct BoardReading {
	bool success{false};
	cv::Rect region{};                            //!< Board region in the input image.
	cv::Mat board;                                //!< Cropped (and, if located, normalised) board image as captured.
	core::SquareGrid squares{};                   //!< Canonical: row 0 is rank 8, col 0 is file a.
	core::Grid<core::RecognitionResult> results{}; //!< Canonical, like squares.
	core::OrientationDecision orientation{};       //!< Side that was at the bottom of the photograph.
	std::string placement;                        //!< Placement string with placeholder suffix.
};

/*! Photograph -> board placement.
 *  Process: locate (or take the manual region) -> segment -> classify -> resolve orientation -> rotate to canonical -> encode.
 *  Prototypes learned through retrain() are used by every following recognize() call.
 */
class BoardRecognizer {
public:
	explicit BoardRecognizer(RecognizerConfig config = {});

	BoardRecognizer(const BoardRecognizer&)            = delete;
	BoardRecognizer& operator=(const BoardRecognizer&) = delete;

	//! \param [in] manualRegion Board rectangle chosen by the user. Skips the locator; the crop is not resized.
	//! \returns    success is false if no board was found or the board is too small to segment.
	BoardReading recognize(const cv::Mat& image, core::OrientationMode mode = core::OrientationMode::Auto,
	                       std::optional<cv::Rect> manualRegion = std::nullopt, core::DebugVisualizer* debugger = nullptr) const;

	//! Learn from the active corrections of a feedback store.
	training::RetrainReport retrain(const training::FeedbackStore& feedback);

	core::ClassModelStore& models() {
		return m_models;
	}
	const core::ClassModelStore& models() const {
		return m_models;
	}
	const RecognizerConfig& config() const {
		return m_config;
	}

private:
	RecognizerConfig m_config;
	core::ClassModelStore m_models{};
	training::RetrainingEngine m_engine;
	core::PieceClassifier m_classifier;
};

} // namespace kibitz::vision
