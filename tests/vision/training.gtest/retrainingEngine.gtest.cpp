#include "vision/core/pieceClassifier.hpp"
#include "vision/training/retrainingEngine.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>

namespace kibitz::vision::training {
namespace gtest {

using core::PieceType;

//! Square with a filled disk of the given gray level.
static cv::Mat makePiece(double background, double piece, int radius = 30) {
	cv::Mat square(100, 100, CV_8UC3, cv::Scalar::all(background));
	cv::circle(square, cv::Point(50, 50), radius, cv::Scalar::all(piece), cv::FILLED);
	return square;
}

TEST(RetrainingEngine, Empty_Dataset_Fails) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const RetrainReport report = engine.retrain({});
	EXPECT_EQ(report.status, RetrainStatus::Failed);
	EXPECT_EQ(report.reason, RetrainFailure::EmptyDataset);
	EXPECT_EQ(report.samplesProcessed, 0u);
	EXPECT_TRUE(models.empty());
	EXPECT_EQ(retrainFailureName(report.reason), "no_data");
}

TEST(RetrainingEngine, Only_Unusable_Samples_Fails) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const RetrainReport report = engine.retrain({{cv::Mat{}, PieceType::BlackRook}, {cv::Mat{}, PieceType::Empty}});
	EXPECT_EQ(report.status, RetrainStatus::Failed);
	EXPECT_EQ(report.reason, RetrainFailure::EmptyDataset);
	EXPECT_TRUE(models.empty());
}

TEST(RetrainingEngine, Unknown_Label_Skipped) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const RetrainReport onlyUnknown = engine.retrain({{makePiece(210, 20), PieceType::Unknown}});
	EXPECT_EQ(onlyUnknown.status, RetrainStatus::Failed);
	EXPECT_EQ(onlyUnknown.reason, RetrainFailure::EmptyDataset);
	EXPECT_TRUE(models.empty());

	const RetrainReport report = engine.retrain({{makePiece(210, 20), PieceType::Unknown}, {makePiece(120, 20), PieceType::BlackRook}});
	EXPECT_EQ(report.status, RetrainStatus::Success);
	EXPECT_EQ(report.samplesProcessed, 1u);
	EXPECT_FALSE(models.contains(PieceType::Unknown));
	EXPECT_EQ(models.learnedTypes(), std::vector<PieceType>{PieceType::BlackRook});
}

TEST(RetrainingEngine, Groups_By_Label) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const std::vector<TrainingSample> samples = {
	        {makePiece(210, 20), PieceType::BlackKnight},
	        {makePiece(120, 20), PieceType::BlackKnight},
	        {makePiece(120, 240), PieceType::WhiteBishop},
	};
	const RetrainReport report = engine.retrain(samples);

	EXPECT_EQ(report.status, RetrainStatus::Success);
	EXPECT_EQ(report.reason, RetrainFailure::None);
	EXPECT_EQ(report.samplesProcessed, 3u);
	EXPECT_EQ(report.distinctLabels, 2u);
	EXPECT_EQ(report.perLabelCount.at(PieceType::BlackKnight), 2u);
	EXPECT_EQ(report.perLabelCount.at(PieceType::WhiteBishop), 1u);

	ASSERT_NE(models.find(PieceType::BlackKnight), nullptr);
	EXPECT_EQ(models.find(PieceType::BlackKnight)->sampleCount, 2u);
	EXPECT_EQ(models.learnedTypes(core::PieceColor::White), std::vector<PieceType>{PieceType::WhiteBishop});
}

TEST(RetrainingEngine, Prototype_Is_Mean_And_Spread) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const cv::Mat image = makePiece(210, 20);
	engine.retrain({{image, PieceType::BlackPawn}, {image.clone(), PieceType::BlackPawn}});

	const auto features = core::extractFeatures(image);
	ASSERT_TRUE(features.has_value());
	const core::ClassPrototype* prototype = models.find(PieceType::BlackPawn);
	ASSERT_NE(prototype, nullptr);

	const core::Descriptor expected = core::toDescriptor(*features);
	for (std::size_t i = 0u; i < core::FEATURE_COUNT; ++i) {
		EXPECT_NEAR(prototype->mean[i], expected[i], 1e-12);
		EXPECT_NEAR(prototype->spread[i], 0.0, 1e-12);
	}
}

TEST(RetrainingEngine, Replace_Policy_Keeps_Other_Labels) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	engine.retrain({{makePiece(210, 20), PieceType::BlackRook}, {makePiece(210, 20), PieceType::BlackRook}, {makePiece(120, 240), PieceType::WhiteQueen}});
	engine.retrain({{makePiece(120, 20), PieceType::BlackRook}});

	ASSERT_NE(models.find(PieceType::BlackRook), nullptr);
	EXPECT_EQ(models.find(PieceType::BlackRook)->sampleCount, 1u);
	ASSERT_NE(models.find(PieceType::WhiteQueen), nullptr);
	EXPECT_EQ(models.find(PieceType::WhiteQueen)->sampleCount, 1u);

	const core::ModelStatistics stats = models.statistics();
	EXPECT_TRUE(stats.trained);
	EXPECT_EQ(stats.pieceTypes.size(), 2u);
	EXPECT_EQ(stats.totalSamples, 2u);

	models.clear();
	EXPECT_FALSE(models.statistics().trained);
}

TEST(RetrainingEngine, Learned_Prototype_Overrides_Heuristic) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);
	const core::PieceClassifier classifier({}, &models);

	const cv::Mat knight = makePiece(210, 20);
	EXPECT_EQ(classifier.classifySquare(knight).type, PieceType::BlackPawn);

	engine.retrain({{knight, PieceType::BlackKnight}});

	const core::RecognitionResult result = classifier.classifySquare(knight);
	EXPECT_EQ(result.type, PieceType::BlackKnight);
	EXPECT_FLOAT_EQ(result.confidence, 0.85f);

	// Nothing learned for white pieces yet: the heuristic still decides.
	core::FeatureVector white = *core::extractFeatures(knight);
	white.centerBrightness    = 220.0;
	EXPECT_EQ(classifier.classify(white).type, PieceType::WhitePawn);
}

TEST(RetrainingEngine, Nearest_Prototype_Wins) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);

	const cv::Mat small = makePiece(210, 20, 22);
	const cv::Mat large = makePiece(210, 20, 40);
	engine.retrain({{small, PieceType::BlackPawn}, {large, PieceType::BlackQueen}});

	const core::PieceClassifier classifier({}, &models);
	EXPECT_EQ(classifier.classifySquare(makePiece(210, 20, 24)).type, PieceType::BlackPawn);
	EXPECT_EQ(classifier.classifySquare(makePiece(210, 20, 38)).type, PieceType::BlackQueen);

	const core::RecognitionResult result = classifier.classifySquare(large);
	const bool pawnRanked = std::any_of(result.alternatives.begin(), result.alternatives.end(), [](const auto& alt) { return alt.first == PieceType::BlackPawn; });
	EXPECT_TRUE(pawnRanked);
}

TEST(ClassModelStore, Save_And_Load) {
	const std::filesystem::path path = std::filesystem::temp_directory_path() / "kibitz_model_store_test.yml";

	core::ClassModelStore models;
	RetrainingEngine engine(models);
	engine.retrain({{makePiece(210, 20), PieceType::BlackKnight}, {makePiece(120, 240), PieceType::WhiteKing}, {makePiece(120, 240), PieceType::WhiteKing}});
	ASSERT_TRUE(models.save(path));

	core::ClassModelStore restored;
	ASSERT_TRUE(restored.load(path));
	EXPECT_EQ(restored.learnedTypes(), models.learnedTypes());
	EXPECT_EQ(restored.statistics().totalSamples, 3u);
	for (const PieceType type: models.learnedTypes()) {
		for (std::size_t i = 0u; i < core::FEATURE_COUNT; ++i) {
			EXPECT_NEAR(restored.find(type)->mean[i], models.find(type)->mean[i], 1e-9);
			EXPECT_NEAR(restored.find(type)->spread[i], models.find(type)->spread[i], 1e-9);
		}
	}

	std::filesystem::remove(path);
}

TEST(ClassModelStore, Load_Missing_File_Keeps_Store) {
	core::ClassModelStore models;
	RetrainingEngine engine(models);
	engine.retrain({{makePiece(210, 20), PieceType::BlackKnight}});

	EXPECT_FALSE(models.load(std::filesystem::temp_directory_path() / "kibitz_missing_model.yml"));
	EXPECT_TRUE(models.contains(PieceType::BlackKnight));
}

} // namespace gtest
} // namespace kibitz::vision::training
