#include "vision/core/classModelStore.hpp"

#include <opencv2/core/persistence.hpp>

#include <algorithm>
#include <iostream>
#include <string>

namespace kibitz::vision::core {

namespace {

static bool readDescriptor(const cv::FileNode& node, Descriptor& outDescriptor) {
	std::vector<double> values;
	node >> values;
	if (values.size() != FEATURE_COUNT) {
		return false;
	}
	std::copy(values.begin(), values.end(), outDescriptor.begin());
	return true;
}

} // namespace

const ClassPrototype* ClassModelStore::find(const PieceType type) const {
	const auto it = m_prototypes.find(type);
	return it == m_prototypes.end() ? nullptr : &it->second;
}

bool ClassModelStore::contains(const PieceType type) const {
	return m_prototypes.count(type) != 0u;
}

bool ClassModelStore::empty() const {
	return m_prototypes.empty();
}

std::size_t ClassModelStore::size() const {
	return m_prototypes.size();
}

std::vector<PieceType> ClassModelStore::learnedTypes() const {
	std::vector<PieceType> types;
	types.reserve(m_prototypes.size());
	for (const auto& [type, prototype]: m_prototypes) {
		types.push_back(type);
	}
	return types;
}

std::vector<PieceType> ClassModelStore::learnedTypes(const PieceColor color) const {
	std::vector<PieceType> types;
	for (const auto& [type, prototype]: m_prototypes) {
		if (pieceColor(type) == color) {
			types.push_back(type);
		}
	}
	return types;
}

ModelStatistics ClassModelStore::statistics() const {
	ModelStatistics stats{};
	stats.trained    = !m_prototypes.empty();
	stats.pieceTypes = learnedTypes();
	for (const auto& [type, prototype]: m_prototypes) {
		stats.totalSamples += prototype.sampleCount;
	}
	return stats;
}

void ClassModelStore::clear() {
	m_prototypes.clear();
}

void ClassModelStore::replace(const PieceType type, ClassPrototype prototype) {
	m_prototypes[type] = std::move(prototype);
}

bool ClassModelStore::save(const std::filesystem::path& path) const {
	try {
		cv::FileStorage storage(path.string(), cv::FileStorage::WRITE);
		if (!storage.isOpened()) {
			std::cerr << "[Error] Could not open model file for writing: " << path << '\n';
			return false;
		}

		storage << "prototypes" << "[";
		for (const auto& [type, prototype]: m_prototypes) {
			const std::vector<double> meanValues(prototype.mean.begin(), prototype.mean.end());
			const std::vector<double> spreadValues(prototype.spread.begin(), prototype.spread.end());
			storage << "{";
			storage << "label" << std::string(pieceName(type));
			storage << "samples" << static_cast<int>(prototype.sampleCount);
			storage << "mean" << meanValues;
			storage << "spread" << spreadValues;
			storage << "}";
		}
		storage << "]";
		storage.release();
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not write model file " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

bool ClassModelStore::load(const std::filesystem::path& path) {
	std::map<PieceType, ClassPrototype> loaded;
	try {
		cv::FileStorage storage(path.string(), cv::FileStorage::READ);
		if (!storage.isOpened()) {
			std::cerr << "[Error] Could not open model file: " << path << '\n';
			return false;
		}

		const cv::FileNode prototypes = storage["prototypes"];
		if (!prototypes.isSeq()) {
			std::cerr << "[Error] Model file has no prototype list: " << path << '\n';
			return false;
		}

		for (const auto& node: prototypes) {
			const std::string label = node["label"].isString() ? static_cast<std::string>(node["label"]) : std::string{};
			const auto type         = pieceFromName(label);
			ClassPrototype prototype{};
			if (!type || !readDescriptor(node["mean"], prototype.mean) || !readDescriptor(node["spread"], prototype.spread)) {
				std::cerr << "[Warning] Skipping malformed prototype '" << label << "' in " << path << '\n';
				continue;
			}
			prototype.sampleCount = static_cast<std::size_t>(std::max(0, static_cast<int>(node["samples"])));
			loaded[*type]         = prototype;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not parse model file " << path << ": " << e.what() << '\n';
		return false;
	}

	m_prototypes = std::move(loaded);
	return true;
}

} // namespace kibitz::vision::core
