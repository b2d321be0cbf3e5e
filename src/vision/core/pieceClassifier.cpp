#include "vision/core/pieceClassifier.hpp"

#include "vision/core/debugVisualizer.hpp"

#include <algorithm>
#include <iostream>

namespace kibitz::vision::core {

namespace {

static bool confidenceGreater(const std::pair<PieceType, float>& left, const std::pair<PieceType, float>& right) {
	return left.second > right.second;
}

} // namespace

HeuristicTypeEstimator::HeuristicTypeEstimator(HeuristicTypeConfig config) : m_config(config) {
}

std::optional<TypeEstimate> HeuristicTypeEstimator::estimate(const FeatureVector& features, const PieceColor color) const {
	// Placeholder mapping: more edges -> more complex silhouette.
	PieceKind kind = PieceKind::Queen;
	if (features.edgeDensity < m_config.pawnEdgeMax) {
		kind = PieceKind::Pawn;
	} else if (features.edgeDensity < m_config.rookEdgeMax) {
		kind = PieceKind::Rook;
	} else if (features.edgeDensity < m_config.knightEdgeMax) {
		kind = PieceKind::Knight;
	}

	return TypeEstimate{makePiece(color, kind), m_config.confidence, {}};
}

PrototypeTypeEstimator::PrototypeTypeEstimator(const ClassModelStore& models, PrototypeConfig config) : m_models(models), m_config(config) {
}

std::optional<TypeEstimate> PrototypeTypeEstimator::estimate(const FeatureVector& features, const PieceColor color) const {
	std::vector<PieceType> candidates = m_models.learnedTypes(color);
	if (candidates.empty()) {
		return std::nullopt;
	}
	if (m_models.contains(PieceType::Empty)) {
		candidates.push_back(PieceType::Empty);
	}

	const Descriptor descriptor = toDescriptor(features);
	const double scale          = std::max(1e-6, m_config.distanceScale);

	std::vector<std::pair<PieceType, float>> scored;
	scored.reserve(candidates.size());
	for (PieceType type: candidates) {
		const ClassPrototype* prototype = m_models.find(type);
		const double distance           = descriptorDistance(descriptor, prototype->mean);
		scored.emplace_back(type, static_cast<float>(1.0 / (1.0 + distance / scale)));
	}
	std::sort(scored.begin(), scored.end(), confidenceGreater);

	TypeEstimate result{scored.front().first, scored.front().second, {}};
	result.alternatives.assign(std::next(scored.begin()), scored.end());
	return result;
}

PieceClassifier::PieceClassifier(ClassifierConfig config, const ClassModelStore* models) : m_config(config) {
	if (models != nullptr) {
		m_estimators.push_back(std::make_unique<PrototypeTypeEstimator>(*models, m_config.prototype));
	}
	m_estimators.push_back(std::make_unique<HeuristicTypeEstimator>(m_config.heuristic));
}

EmptinessEstimate PieceClassifier::estimateEmptiness(const FeatureVector& features) const {
	const EmptinessConfig& cfg = m_config.emptiness;

	float score = 0.0f;
	if (features.edgeDensity < cfg.edgeDensityMax) {
		score += cfg.edgeDensityWeight;
	}
	if (features.brightnessVariance < cfg.varianceMax) {
		score += cfg.varianceWeight;
	}
	if (features.centerDarkness < cfg.centerDarknessMax) {
		score += cfg.centerDarknessWeight;
	}

	EmptinessEstimate result{};
	result.score      = score;
	result.empty      = score > cfg.emptyScoreMin;
	result.confidence = result.empty ? score : 1.0f - score;
	return result;
}

ColorEstimate PieceClassifier::estimateColor(const FeatureVector& features) const {
	const ColorConfig& cfg  = m_config.color;
	const double brightness = features.centerBrightness;

	if (brightness > cfg.whiteBrightnessMin) {
		return {PieceColor::White, cfg.strongConfidence};
	}
	if (brightness < cfg.blackBrightnessMax) {
		return {PieceColor::Black, cfg.strongConfidence};
	}
	return {brightness > cfg.splitBrightness ? PieceColor::White : PieceColor::Black, cfg.weakConfidence};
}

RecognitionResult PieceClassifier::classify(const FeatureVector& features, const std::optional<PieceColor> colorHint) const {
	const EmptinessEstimate emptiness = estimateEmptiness(features);
	if (emptiness.empty) {
		return {PieceType::Empty, emptiness.confidence, {}};
	}

	const ColorEstimate color = colorHint ? ColorEstimate{*colorHint, m_config.color.hintConfidence} : estimateColor(features);

	std::optional<TypeEstimate> type;
	for (const auto& estimator: m_estimators) {
		type = estimator->estimate(features, color.color);
		if (type) {
			break;
		}
	}
	if (!type) {
		return {PieceType::Unknown, 0.0f, {}};
	}

	RecognitionResult result{};
	result.type         = type->type;
	result.confidence   = std::clamp(0.5f * (color.confidence + type->confidence), 0.0f, 1.0f);
	result.alternatives = std::move(type->alternatives);
	if (result.type != PieceType::Empty) {
		result.alternatives.emplace_back(PieceType::Empty, emptiness.score);
	}

	if (result.confidence < m_config.minConfidence) {
		result.alternatives.emplace_back(result.type, result.confidence);
		result.type = PieceType::Unknown;
	}

	std::stable_sort(result.alternatives.begin(), result.alternatives.end(), confidenceGreater);
	return result;
}

RecognitionResult PieceClassifier::classifySquare(const cv::Mat& square, const std::optional<PieceColor> colorHint) const {
	const auto features = extractFeatures(square, m_config.features);
	if (!features) {
		return {PieceType::Unknown, 0.0f, {}};
	}
	return classify(*features, colorHint);
}

Grid<RecognitionResult> PieceClassifier::classifyBoard(const SquareGrid& squares) const {
	const bool verbose = debugLoggingEnabled();

	Grid<RecognitionResult> results{};
	for (int row = 0; row < BOARD_DIM; ++row) {
		for (int col = 0; col < BOARD_DIM; ++col) {
			const auto r = static_cast<std::size_t>(row);
			const auto c = static_cast<std::size_t>(col);
			results[r][c] = classifySquare(squares[r][c]);
			if (verbose) {
				std::cout << "[vision-debug] square=" << squareName(row, col, Orientation::White) << " piece=" << pieceName(results[r][c].type)
				          << " confidence=" << results[r][c].confidence << '\n';
			}
		}
	}
	return results;
}

} // namespace kibitz::vision::core
