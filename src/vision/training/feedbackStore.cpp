#include "vision/training/feedbackStore.hpp"

#include "vision/core/debugVisualizer.hpp"
#include "vision/training/imageHash.hpp"

#include <opencv2/core/persistence.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>

namespace kibitz::vision::training {

namespace fs = std::filesystem;

namespace {

static constexpr const char* IMAGE_DIRECTORY = "training_images";

static std::tm localTime(const std::chrono::system_clock::time_point now) {
	const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
	std::tm local{};
	localtime_r(&seconds, &local);
	return local;
}

static long long microsecondsOf(const std::chrono::system_clock::time_point now) {
	const auto sinceEpoch = now.time_since_epoch();
	return std::chrono::duration_cast<std::chrono::microseconds>(sinceEpoch).count() % 1000000;
}

//! "2026-03-14T09:26:53.589793"
static std::string isoTimestamp() {
	const auto now = std::chrono::system_clock::now();
	const std::tm local = localTime(now);

	std::ostringstream out;
	out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << microsecondsOf(now);
	return out.str();
}

//! "20260314_092653_589793", used in file names.
static std::string fileStamp() {
	const auto now = std::chrono::system_clock::now();
	const std::tm local = localTime(now);

	std::ostringstream out;
	out << std::put_time(&local, "%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0') << microsecondsOf(now);
	return out.str();
}

static bool isLabel(const core::PieceType type) {
	return type != core::PieceType::Unknown;
}

//! Confidence values in the log are within [0, 1]. NaN counts as 0.
static float clampConfidence(const float confidence, const std::string& squareName) {
	if (confidence >= 0.0f && confidence <= 1.0f) {
		return confidence;
	}
	const float clamped = confidence > 1.0f ? 1.0f : 0.0f;
	std::cerr << "[Warning] Confidence " << confidence << " for " << squareName << " clamped to " << clamped << '\n';
	return clamped;
}

//! Original predictions may be Unknown, corrections may not.
static std::optional<core::PieceType> predictionFromName(const std::string& name) {
	if (name == core::pieceName(core::PieceType::Unknown)) {
		return core::PieceType::Unknown;
	}
	return core::pieceFromName(name);
}

static std::optional<std::string> readString(const cv::FileNode& record, const char* key) {
	const cv::FileNode node = record[key];
	if (node.empty() || !node.isString()) {
		return std::nullopt;
	}
	return static_cast<std::string>(node);
}

//! Parse one stored correction. Keys added in later versions of the log may be missing.
static std::optional<CorrectionRecord> parseRecord(const cv::FileNode& node) {
	if (!node.isMap()) {
		return std::nullopt;
	}

	CorrectionRecord record{};

	const auto square     = readString(node, "square_name");
	const auto correction = readString(node, "user_correction");
	if (!square || !core::squarePosition(*square, core::Orientation::White) || !correction) {
		return std::nullopt;
	}
	const auto label = core::pieceFromName(*correction);
	if (!label) {
		return std::nullopt;
	}
	record.squareName     = *square;
	record.userCorrection = *label;

	const cv::FileNode confidence = node["original_confidence"];
	if (!confidence.isReal() && !confidence.isInt()) {
		return std::nullopt;
	}
	record.originalConfidence = static_cast<float>(static_cast<double>(confidence));

	if (const auto prediction = readString(node, "original_prediction")) {
		record.originalPrediction = predictionFromName(*prediction);
		if (!record.originalPrediction) {
			return std::nullopt;
		}
	}
	if (const auto orientation = readString(node, "board_orientation")) {
		record.orientation = core::orientationFromName(*orientation);
	}
	if (const auto path = readString(node, "square_image_path")) {
		record.imagePath = fs::path(*path);
	}

	record.timestamp = readString(node, "timestamp").value_or(std::string{});
	record.sessionId = readString(node, "session_id").value_or(std::string{});
	record.imageHash = readString(node, "image_hash").value_or(std::string{});
	record.uniqueKey = readString(node, "unique_key").value_or(makeUniqueKey(record.imageHash, record.squareName));

	const cv::FileNode active = node["is_active"];
	record.isActive           = active.isInt() ? static_cast<int>(active) != 0 : true;
	return record;
}

static void writeRecord(cv::FileStorage& storage, const CorrectionRecord& record) {
	storage << "{";
	storage << "square_name" << record.squareName;
	if (record.originalPrediction) {
		storage << "original_prediction" << std::string(core::pieceName(*record.originalPrediction));
	}
	storage << "original_confidence" << static_cast<double>(record.originalConfidence);
	storage << "user_correction" << std::string(core::pieceName(record.userCorrection));
	storage << "timestamp" << record.timestamp;
	if (record.imagePath) {
		storage << "square_image_path" << record.imagePath->generic_string();
	}
	if (record.orientation) {
		storage << "board_orientation" << std::string(core::orientationName(*record.orientation));
	}
	storage << "session_id" << record.sessionId;
	storage << "unique_key" << record.uniqueKey;
	storage << "image_hash" << record.imageHash;
	storage << "is_active" << (record.isActive ? 1 : 0);
	storage << "}";
}

} // namespace

std::string makeUniqueKey(const std::string& imageHash, const std::string& squareName) {
	return imageHash + "_" + squareName;
}

std::string generateSessionId() {
	std::random_device device;
	std::mt19937 generator(device());
	std::uniform_int_distribution<std::uint32_t> distribution;

	const std::tm local = localTime(std::chrono::system_clock::now());

	std::ostringstream out;
	out << "session_" << std::put_time(&local, "%Y%m%d_%H%M%S") << '_' << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
	return out.str();
}

FeedbackStore::FeedbackStore(fs::path logFile, std::optional<std::string> sessionId)
    : m_logFile(std::move(logFile)), m_sessionId(sessionId ? std::move(*sessionId) : generateSessionId()) {
	load();
}

fs::path FeedbackStore::imageDirectory() const {
	return m_logFile.parent_path() / IMAGE_DIRECTORY;
}

bool FeedbackStore::setCurrentImage(const cv::Mat& boardImage) {
	std::string hash = contentHash(boardImage);
	if (hash.empty()) {
		std::cerr << "[Warning] Cannot hash an empty board image\n";
		return false;
	}
	m_currentImageHash = std::move(hash);
	return true;
}

bool FeedbackStore::addCorrection(const std::string& squareName, std::optional<core::PieceType> originalPrediction, const float originalConfidence,
                                  const core::PieceType userCorrection, const cv::Mat& squareImage, std::optional<core::Orientation> orientation) {
	if (!core::squarePosition(squareName, core::Orientation::White)) {
		std::cerr << "[Error] Invalid square name '" << squareName << "'\n";
		return false;
	}
	if (!isLabel(userCorrection)) {
		std::cerr << "[Error] Correction for " << squareName << " must name a piece or EMPTY\n";
		return false;
	}

	CorrectionRecord record{};
	record.squareName         = squareName;
	record.originalPrediction = originalPrediction;
	record.originalConfidence = clampConfidence(originalConfidence, squareName);
	record.userCorrection     = userCorrection;
	record.timestamp          = isoTimestamp();
	record.orientation        = orientation;
	record.sessionId          = m_sessionId;
	record.imageHash          = m_currentImageHash;
	record.uniqueKey          = makeUniqueKey(m_currentImageHash, squareName);
	record.isActive           = true;
	if (!squareImage.empty()) {
		record.imagePath = storeImage(squareName, squareImage);
	}

	appendRecord(std::move(record));

	if (core::debugLoggingEnabled()) {
		const auto prediction = originalPrediction ? core::pieceName(*originalPrediction) : std::string_view("none");
		std::cout << "[vision-debug] correction " << squareName << ": " << prediction << " -> " << core::pieceName(userCorrection) << '\n';
	}
	return save();
}

void FeedbackStore::appendRecord(CorrectionRecord record) {
	if (record.isActive) {
		const auto it = m_activeIndex.find(record.uniqueKey);
		if (it != m_activeIndex.end()) {
			m_records[it->second].isActive = false;
		}
		m_activeIndex[record.uniqueKey] = m_records.size();
	}
	m_records.push_back(std::move(record));
}

std::optional<fs::path> FeedbackStore::storeImage(const std::string& squareName, const cv::Mat& squareImage) const {
	const fs::path directory = imageDirectory();

	std::error_code ec;
	fs::create_directories(directory, ec);
	if (ec) {
		std::cerr << "[Warning] Could not create image directory " << directory << ": " << ec.message() << '\n';
		return std::nullopt;
	}

	// Two corrections in the same microsecond get a numeric suffix.
	const std::string stem = squareName + "_" + fileStamp();
	fs::path fileName      = stem + ".png";
	for (int suffix = 1; fs::exists(directory / fileName, ec); ++suffix) {
		fileName = stem + "_" + std::to_string(suffix) + ".png";
	}

	try {
		if (!cv::imwrite((directory / fileName).string(), squareImage)) {
			std::cerr << "[Warning] Could not write square image " << (directory / fileName) << '\n';
			return std::nullopt;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[Warning] Could not write square image " << (directory / fileName) << ": " << e.what() << '\n';
		return std::nullopt;
	}

	return fs::path(IMAGE_DIRECTORY) / fileName;
}

void FeedbackStore::load() {
	std::error_code ec;
	if (!fs::exists(m_logFile, ec)) {
		return;
	}
	if (fs::file_size(m_logFile, ec) == 0u || ec) {
		std::cerr << "[Warning] Feedback log " << m_logFile << " is empty, starting a new log\n";
		return;
	}

	try {
		cv::FileStorage storage(m_logFile.string(), cv::FileStorage::READ);
		if (!storage.isOpened()) {
			std::cerr << "[Warning] Could not open feedback log " << m_logFile << ", starting a new log\n";
			return;
		}

		const cv::FileNode corrections = storage["corrections"];
		if (!corrections.isSeq()) {
			std::cerr << "[Warning] Feedback log " << m_logFile << " has no correction list, starting a new log\n";
			return;
		}

		int index = 0;
		for (const auto& node: corrections) {
			if (auto record = parseRecord(node)) {
				appendRecord(std::move(*record));
			} else {
				std::cerr << "[Warning] Skipping malformed correction " << index << " in " << m_logFile << '\n';
			}
			++index;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[Warning] Could not parse feedback log " << m_logFile << ": " << e.what() << '\n';
		m_records.clear();
		m_activeIndex.clear();
		return;
	}

	std::cout << "Loaded " << m_records.size() << " corrections from " << m_logFile << '\n';
}

bool FeedbackStore::writeLog(const fs::path& path) const {
	try {
		cv::FileStorage storage(path.string(), cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
		if (!storage.isOpened()) {
			std::cerr << "[Error] Could not open " << path << " for writing\n";
			return false;
		}
		storage << "corrections" << "[";
		for (const auto& record: m_records) {
			writeRecord(storage, record);
		}
		storage << "]";
		storage.release();
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not write " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

bool FeedbackStore::save() const {
	std::error_code ec;
	if (m_logFile.has_parent_path()) {
		fs::create_directories(m_logFile.parent_path(), ec);
		if (ec) {
			std::cerr << "[Error] Could not create log directory " << m_logFile.parent_path() << ": " << ec.message() << '\n';
			return false;
		}
	}

	fs::path temporary = m_logFile;
	temporary += ".tmp";
	if (!writeLog(temporary)) {
		return false;
	}

	fs::rename(temporary, m_logFile, ec);
	if (ec) {
		std::cerr << "[Error] Could not replace feedback log " << m_logFile << ": " << ec.message() << '\n';
		fs::remove(temporary, ec);
		return false;
	}
	return true;
}

bool FeedbackStore::exportTo(const fs::path& path) const {
	if (!writeLog(path)) {
		return false;
	}
	std::cout << "Exported " << m_records.size() << " corrections to " << path << '\n';
	return true;
}

bool FeedbackStore::clear() {
	m_records.clear();
	m_activeIndex.clear();

	bool ok = true;
	std::error_code ec;
	fs::remove(m_logFile, ec);
	if (ec) {
		std::cerr << "[Error] Could not delete feedback log " << m_logFile << ": " << ec.message() << '\n';
		ok = false;
	}
	fs::remove_all(imageDirectory(), ec);
	if (ec) {
		std::cerr << "[Error] Could not delete stored images in " << imageDirectory() << ": " << ec.message() << '\n';
		ok = false;
	}
	return ok;
}

FeedbackStatistics FeedbackStore::statistics() const {
	FeedbackStatistics stats{};
	stats.total = m_records.size();

	double confidenceSum = 0.0;
	for (const auto& record: m_records) {
		if (!record.isActive) {
			continue;
		}
		++stats.active;
		++stats.byPieceType[record.userCorrection];
		++stats.bySession[record.sessionId];
		confidenceSum += record.originalConfidence;
	}

	stats.superseded             = stats.total - stats.active;
	stats.meanOriginalConfidence = stats.active > 0u ? confidenceSum / static_cast<double>(stats.active) : 0.0;
	return stats;
}

std::vector<TrainingSample> FeedbackStore::trainingData(const bool activeOnly) const {
	const fs::path logDirectory = m_logFile.parent_path();

	std::vector<TrainingSample> samples;
	for (const auto& record: m_records) {
		if ((activeOnly && !record.isActive) || !record.imagePath) {
			continue;
		}

		const fs::path imagePath = logDirectory / *record.imagePath;
		cv::Mat image            = cv::imread(imagePath.string(), cv::IMREAD_COLOR);
		if (image.empty()) {
			std::cerr << "[Warning] Training image not found: " << imagePath << '\n';
			continue;
		}
		samples.push_back(TrainingSample{std::move(image), record.userCorrection});
	}
	return samples;
}

std::vector<SessionSummary> FeedbackStore::sessionSummaries() const {
	std::vector<SessionSummary> summaries;
	std::unordered_map<std::string, std::size_t> position;

	for (const auto& record: m_records) {
		auto [it, inserted] = position.try_emplace(record.sessionId, summaries.size());
		if (inserted) {
			summaries.push_back(SessionSummary{record.sessionId, record.timestamp, record.timestamp, 0u, 0u});
		}

		SessionSummary& summary = summaries[it->second];
		summary.firstTimestamp  = std::min(summary.firstTimestamp, record.timestamp);
		summary.lastTimestamp   = std::max(summary.lastTimestamp, record.timestamp);
		++summary.totalCount;
		if (record.isActive) {
			++summary.activeCount;
		}
	}
	return summaries;
}

std::vector<CorrectionRecord> FeedbackStore::recordsForSession(const std::string& sessionId) const {
	std::vector<CorrectionRecord> result;
	std::copy_if(m_records.begin(), m_records.end(), std::back_inserter(result), [&sessionId](const CorrectionRecord& record) { return record.sessionId == sessionId; });
	return result;
}

} // namespace kibitz::vision::training
