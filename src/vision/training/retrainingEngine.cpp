#include "vision/training/retrainingEngine.hpp"

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/statistics.hpp"

#include <iostream>

namespace kibitz::vision::training {

namespace {

//! Mean and per-feature standard deviation of a set of descriptors.
static core::ClassPrototype aggregate(const std::vector<core::Descriptor>& descriptors) {
	core::ClassPrototype prototype{};
	prototype.sampleCount = descriptors.size();

	std::vector<double> column(descriptors.size());
	for (std::size_t f = 0u; f < core::FEATURE_COUNT; ++f) {
		for (std::size_t i = 0u; i < descriptors.size(); ++i) {
			column[i] = descriptors[i][f];
		}
		prototype.mean[f]   = core::mean(column);
		prototype.spread[f] = core::stddev(column);
	}
	return prototype;
}

} // namespace

std::string_view retrainStatusName(const RetrainStatus status) {
	return status == RetrainStatus::Success ? "success" : "failed";
}

std::string_view retrainFailureName(const RetrainFailure reason) {
	return reason == RetrainFailure::EmptyDataset ? "no_data" : "none";
}

RetrainingEngine::RetrainingEngine(core::ClassModelStore& models, core::FeatureConfig features) : m_models(models), m_features(features) {
}

RetrainReport RetrainingEngine::retrain(const std::vector<TrainingSample>& samples) {
	RetrainReport report{};

	std::map<core::PieceType, std::vector<core::Descriptor>> grouped;
	for (std::size_t i = 0u; i < samples.size(); ++i) {
		const TrainingSample& sample = samples[i];
		if (sample.label == core::PieceType::Unknown) {
			std::cerr << "[Warning] Skipping training sample " << i << ": UNKNOWN is not a trainable label\n";
			continue;
		}
		const auto features = core::extractFeatures(sample.image, m_features);
		if (!features) {
			std::cerr << "[Warning] Skipping training sample " << i << " (" << core::pieceName(sample.label) << "): empty or unsupported image\n";
			continue;
		}
		grouped[sample.label].push_back(core::toDescriptor(*features));
	}

	if (grouped.empty()) {
		std::cerr << "[Warning] Retraining skipped: no training data\n";
		report.status = RetrainStatus::Failed;
		report.reason = RetrainFailure::EmptyDataset;
		return report;
	}

	const bool verbose = core::debugLoggingEnabled();
	for (const auto& [label, descriptors]: grouped) {
		m_models.replace(label, aggregate(descriptors));
		report.perLabelCount[label] = descriptors.size();
		report.samplesProcessed += descriptors.size();
		if (verbose) {
			std::cout << "[vision-debug] prototype " << core::pieceName(label) << " samples=" << descriptors.size() << '\n';
		}
	}

	report.status         = RetrainStatus::Success;
	report.reason         = RetrainFailure::None;
	report.distinctLabels = grouped.size();

	std::cout << "Retrained " << report.distinctLabels << " piece types from " << report.samplesProcessed << " samples\n";
	return report;
}

} // namespace kibitz::vision::training
