#pragma once

#include "vision/core/featureExtractor.hpp"
#include "vision/core/pieceType.hpp"

#include <filesystem>
#include <map>
#include <vector>

namespace kibitz::vision::training {
class RetrainingEngine;
}

namespace kibitz::vision::core {

//! Learned aggregate descriptor of one piece type.
struct ClassPrototype {
	Descriptor mean{};          //!< Mean scaled descriptor of all contributing samples.
	Descriptor spread{};        //!< Per-feature standard deviation of the contributing samples.
	std::size_t sampleCount{0}; //!< Number of samples the prototype was built from.
};

//! Summary of what the model has learned so far.
struct ModelStatistics {
	bool trained{false};                  //!< At least one prototype is present.
	std::vector<PieceType> pieceTypes{};  //!< Labels with a prototype.
	std::size_t totalSamples{0};          //!< Sum of sample counts over all prototypes.
};

/*! Holds one learned prototype per piece type.
 *  Prototypes are only written by the RetrainingEngine or restored from a model file with load().
 *  The PieceClassifier reads them to override its heuristic type estimate.
 */
class ClassModelStore {
public:
	const ClassPrototype* find(PieceType type) const; //!< Null if nothing was learned for this type.
	bool contains(PieceType type) const;
	bool empty() const;
	std::size_t size() const;

	//! Learned labels, optionally restricted to pieces of one color.
	std::vector<PieceType> learnedTypes() const;
	std::vector<PieceType> learnedTypes(PieceColor color) const;

	ModelStatistics statistics() const;

	void clear(); //!< Forget every prototype.

	//! Persist prototypes with cv::FileStorage. Format follows the file extension (.yml, .json, .xml).
	bool save(const std::filesystem::path& path) const;
	//! Replace the current prototypes with the ones stored in a model file.
	//! \returns False if the file cannot be read. The store is left unchanged in that case.
	bool load(const std::filesystem::path& path);

private:
	friend class training::RetrainingEngine;
	void replace(PieceType type, ClassPrototype prototype);

private:
	std::map<PieceType, ClassPrototype> m_prototypes{};
};

} // namespace kibitz::vision::core
