#pragma once

#include "vision/core/board.hpp"
#include "vision/core/classModelStore.hpp"
#include "vision/core/featureExtractor.hpp"
#include "vision/core/pieceType.hpp"

#include <opencv2/core/mat.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace kibitz::vision::core {

//! Weighted emptiness rule. Each satisfied condition adds its weight to the empty score.
struct EmptinessConfig {
	double edgeDensityMax{0.1};
	double varianceMax{500.0};
	double centerDarknessMax{0.3};
	float edgeDensityWeight{0.4f};
	float varianceWeight{0.3f};
	float centerDarknessWeight{0.3f};
	float emptyScoreMin{0.5f}; //!< Score must exceed this to call the square empty.
};

//! Piece color from the brightness of the square center.
struct ColorConfig {
	double whiteBrightnessMin{150.0};
	double blackBrightnessMax{100.0};
	double splitBrightness{125.0};  //!< Tie break between the two thresholds.
	float strongConfidence{0.7f};
	float weakConfidence{0.5f};
	float hintConfidence{0.7f};     //!< Confidence assigned to a caller supplied color.
};

//! Coarse edge density bands for the heuristic type estimate.
struct HeuristicTypeConfig {
	double pawnEdgeMax{0.15};
	double rookEdgeMax{0.25};
	double knightEdgeMax{0.35};
	float confidence{0.4f};
};

struct PrototypeConfig {
	double distanceScale{0.25}; //!< Descriptor distance at which the confidence drops to one half.
};

struct ClassifierConfig {
	EmptinessConfig emptiness{};
	ColorConfig color{};
	HeuristicTypeConfig heuristic{};
	PrototypeConfig prototype{};
	FeatureConfig features{};
	float minConfidence{0.5f}; //!< Below this the result is reported as Unknown.
};

struct EmptinessEstimate {
	bool empty{false};
	float score{0.0f};      //!< Weighted empty score [0, 1].
	float confidence{0.0f}; //!< score when empty, 1 - score when occupied.
};

struct ColorEstimate {
	PieceColor color{PieceColor::White};
	float confidence{0.0f};
};

struct TypeEstimate {
	PieceType type{PieceType::Unknown};
	float confidence{0.0f};
	std::vector<std::pair<PieceType, float>> alternatives{};
};

//! One way of guessing the piece type of an occupied square.
class TypeEstimator {
public:
	virtual ~TypeEstimator() = default;

	//! \returns Null if this estimator has nothing to say for the given color.
	virtual std::optional<TypeEstimate> estimate(const FeatureVector& features, PieceColor color) const = 0;
};

//! Maps edge density into fixed bands (pawn, rook, knight, queen). Always produces an estimate.
class HeuristicTypeEstimator : public TypeEstimator {
public:
	explicit HeuristicTypeEstimator(HeuristicTypeConfig config = {});
	std::optional<TypeEstimate> estimate(const FeatureVector& features, PieceColor color) const override;

private:
	HeuristicTypeConfig m_config;
};

//! Nearest learned prototype among the pieces of the estimated color (and Empty, if learned).
//! Produces no estimate while no prototype of that color exists.
class PrototypeTypeEstimator : public TypeEstimator {
public:
	PrototypeTypeEstimator(const ClassModelStore& models, PrototypeConfig config = {});
	std::optional<TypeEstimate> estimate(const FeatureVector& features, PieceColor color) const override;

private:
	const ClassModelStore& m_models;
	PrototypeConfig m_config;
};

/*! Classifies square images into piece types.
 *  Steps: emptiness rule -> color estimate -> type estimate -> combined confidence.
 *  Type estimators are consulted in order; learned prototypes come before the heuristic when a model store is attached.
 */
class PieceClassifier {
public:
	//! \param [in] models Learned prototypes. Must outlive the classifier. Null -> heuristic only.
	explicit PieceClassifier(ClassifierConfig config = {}, const ClassModelStore* models = nullptr);

	RecognitionResult classify(const FeatureVector& features, std::optional<PieceColor> colorHint = std::nullopt) const;
	RecognitionResult classifySquare(const cv::Mat& square, std::optional<PieceColor> colorHint = std::nullopt) const;

	//! Classify every square independently. No cross-square consistency is enforced.
	Grid<RecognitionResult> classifyBoard(const SquareGrid& squares) const;

	EmptinessEstimate estimateEmptiness(const FeatureVector& features) const;
	ColorEstimate estimateColor(const FeatureVector& features) const;

	const ClassifierConfig& config() const {
		return m_config;
	}

private:
	ClassifierConfig m_config;
	std::vector<std::unique_ptr<TypeEstimator>> m_estimators; //!< Consulted in order, first estimate wins.
};

} // namespace kibitz::vision::core
