#pragma once

#include "vision/core/board.hpp"
#include "vision/core/pieceType.hpp"
#include "vision/training/trainingSample.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kibitz::vision::training {

//! One human correction of a square recognition.
struct CorrectionRecord {
	std::string squareName;                                //!< "e4".
	std::optional<core::PieceType> originalPrediction{};   //!< What the recognizer said. Null if nothing was predicted.
	float originalConfidence{0.0f};
	core::PieceType userCorrection{core::PieceType::Empty}; //!< What the human said.
	std::string timestamp;                                 //!< ISO-8601 local time with microseconds.
	std::optional<std::filesystem::path> imagePath{};      //!< Stored square image, relative to the log directory.
	std::optional<core::Orientation> orientation{};        //!< Board orientation the square name was derived with.
	std::string sessionId;
	std::string imageHash;                                 //!< Content hash of the board image the square was cut from.
	std::string uniqueKey;                                 //!< "<imageHash>_<squareName>". At most one active record per key.
	bool isActive{true};                                   //!< False once a later record with the same key exists.
};

struct FeedbackStatistics {
	std::size_t total{0};
	std::size_t active{0};
	std::size_t superseded{0};                            //!< total - active.
	std::map<core::PieceType, std::size_t> byPieceType{}; //!< Active records per corrected label.
	std::map<std::string, std::size_t> bySession{};       //!< Active records per session.
	double meanOriginalConfidence{0.0};                   //!< Over active records. 0 without active records.
};

struct SessionSummary {
	std::string sessionId;
	std::string firstTimestamp;
	std::string lastTimestamp;
	std::size_t totalCount{0};
	std::size_t activeCount{0};
};

//! uniqueKey of a correction.
std::string makeUniqueKey(const std::string& imageHash, const std::string& squareName);

//! "session_YYYYMMDD_HHMMSS_<8 hex digits>".
std::string generateSessionId();

/*! Persistent log of square corrections.
 *
 *  The log is append only. A correction for a square of a board image that was already corrected deactivates the earlier
 *  record instead of removing it, so only the latest correction per (board image, square) feeds the training data.
 *
 *  Every addCorrection() rewrites the whole log file (cv::FileStorage JSON) through a temporary file and a rename.
 *  Square images are stored as PNG in a "training_images" directory next to the log.
 *  One writing process per log file is assumed.
 */
class FeedbackStore {
public:
	//! Load an existing log. A missing file starts an empty log, an unreadable one is reported and treated as empty.
	//! \param [in] sessionId Session of the corrections added through this store. Generated if not given.
	explicit FeedbackStore(std::filesystem::path logFile, std::optional<std::string> sessionId = std::nullopt);

	//! Hash the board image the next corrections refer to.
	//! \returns False for an empty image. The previous hash is kept in that case.
	bool setCurrentImage(const cv::Mat& boardImage);

	//! Record a correction for a square of the current board image and persist the log.
	//! \param [in] squareImage Stored for retraining when not empty.
	//! \param [in] originalConfidence Clamped to [0, 1].
	//! \returns False for an invalid square name or label (nothing recorded), or if the log could not be written (record is
	//!          kept in memory).
	bool addCorrection(const std::string& squareName, std::optional<core::PieceType> originalPrediction, float originalConfidence,
	                   core::PieceType userCorrection, const cv::Mat& squareImage = {}, std::optional<core::Orientation> orientation = std::nullopt);

	const std::vector<CorrectionRecord>& records() const {
		return m_records;
	}
	std::size_t size() const {
		return m_records.size();
	}

	FeedbackStatistics statistics() const;

	//! Stored square images with their corrected labels. Records whose image cannot be read are skipped with a warning.
	std::vector<TrainingSample> trainingData(bool activeOnly = true) const;

	std::vector<SessionSummary> sessionSummaries() const; //!< In order of first appearance.
	std::vector<CorrectionRecord> recordsForSession(const std::string& sessionId) const;

	//! Write the log to another file. Image paths stay relative to this log's directory.
	bool exportTo(const std::filesystem::path& path) const;

	//! Forget every record, delete the log file and the stored images.
	bool clear();

	const std::string& sessionId() const {
		return m_sessionId;
	}
	const std::string& currentImageHash() const {
		return m_currentImageHash;
	}
	const std::filesystem::path& logFile() const {
		return m_logFile;
	}
	std::filesystem::path imageDirectory() const;

private:
	void load();
	bool save() const;
	bool writeLog(const std::filesystem::path& path) const;
	std::optional<std::filesystem::path> storeImage(const std::string& squareName, const cv::Mat& squareImage) const;
	void appendRecord(CorrectionRecord record);

private:
	std::filesystem::path m_logFile;
	std::string m_sessionId;
	std::string m_currentImageHash{};
	std::vector<CorrectionRecord> m_records{};
	std::unordered_map<std::string, std::size_t> m_activeIndex{}; //!< uniqueKey -> index of the active record.
};

} // namespace kibitz::vision::training
