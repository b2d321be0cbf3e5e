#pragma once

#include "vision/core/classModelStore.hpp"
#include "vision/core/featureExtractor.hpp"
#include "vision/core/pieceType.hpp"
#include "vision/training/trainingSample.hpp"

#include <map>
#include <string_view>
#include <vector>

namespace kibitz::vision::training {

enum class RetrainStatus { Success, Failed };
enum class RetrainFailure { None, EmptyDataset };

std::string_view retrainStatusName(RetrainStatus status);   //!< "success" or "failed".
std::string_view retrainFailureName(RetrainFailure reason); //!< "none" or "no_data".

struct RetrainReport {
	RetrainStatus status{RetrainStatus::Failed};
	RetrainFailure reason{RetrainFailure::None};
	std::size_t samplesProcessed{0};                     //!< Samples that contributed to a prototype.
	std::size_t distinctLabels{0};
	std::map<core::PieceType, std::size_t> perLabelCount{};
};

/*! Builds class prototypes from labelled square images.
 *  Every label present in a batch gets its prototype replaced by the aggregate of that batch.
 *  Labels absent from the batch keep what they learned earlier.
 */
class RetrainingEngine {
public:
	//! \param [in] models Store that receives the prototypes. Must outlive the engine.
	explicit RetrainingEngine(core::ClassModelStore& models, core::FeatureConfig features = {});

	//! Group the samples by label and replace the prototype of every label seen.
	//! Samples with an empty image or the UNKNOWN label are skipped.
	//! \returns Failed with EmptyDataset if no usable sample was given. The store is untouched in that case.
	RetrainReport retrain(const std::vector<TrainingSample>& samples);

private:
	core::ClassModelStore& m_models;
	core::FeatureConfig m_features;
};

} // namespace kibitz::vision::training
