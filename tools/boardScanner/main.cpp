#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "vision/core/debugVisualizer.hpp"
#include "vision/recognizer.hpp"
#include "vision/training/feedbackStore.hpp"

namespace kibitz::vision {

namespace {

//! Options of the scan command.
struct ScanOptions {
	std::filesystem::path image;
	core::OrientationMode mode{core::OrientationMode::Auto};
	std::optional<cv::Rect> region{};
	std::optional<std::filesystem::path> model{};
	std::optional<std::filesystem::path> debugMosaic{};
};

static void printUsage() {
	std::cerr << "Usage:\n"
	          << "  boardScanner scan <image> [--orientation white|black|auto] [--region x,y,w,h] [--model <file>] [--debug <mosaic.png>]\n"
	          << "  boardScanner retrain <feedback-log> <model-out>\n"
	          << "  boardScanner stats <feedback-log>\n";
}

//! "x,y,w,h" -> rectangle.
static std::optional<cv::Rect> parseRegion(std::string_view text) {
	std::vector<int> values;
	while (!text.empty()) {
		const auto comma = text.find(',');
		const auto part  = text.substr(0, comma);

		int value = 0;
		const auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
		if (ec != std::errc() || end != part.data() + part.size()) {
			return std::nullopt;
		}
		values.push_back(value);

		if (comma == std::string_view::npos) {
			break;
		}
		text.remove_prefix(comma + 1);
	}

	if (values.size() != 4u || values[2] <= 0 || values[3] <= 0) {
		return std::nullopt;
	}
	return cv::Rect(values[0], values[1], values[2], values[3]);
}

static std::optional<ScanOptions> parseScanOptions(const std::vector<std::string_view>& args) {
	if (args.empty()) {
		return std::nullopt;
	}

	ScanOptions options{};
	options.image = std::string(args[0]);
	for (std::size_t i = 1; i < args.size(); ++i) {
		if (i + 1 >= args.size()) {
			std::cerr << "[Error] Missing value for " << args[i] << '\n';
			return std::nullopt;
		}
		const std::string_view flag  = args[i];
		const std::string_view value = args[++i];

		if (flag == "--orientation") {
			const auto mode = core::orientationModeFromName(value);
			if (!mode) {
				std::cerr << "[Error] Orientation must be white, black or auto\n";
				return std::nullopt;
			}
			options.mode = *mode;
		} else if (flag == "--region") {
			options.region = parseRegion(value);
			if (!options.region) {
				std::cerr << "[Error] Region must be x,y,w,h with positive width and height\n";
				return std::nullopt;
			}
		} else if (flag == "--model") {
			options.model = std::filesystem::path(std::string(value));
		} else if (flag == "--debug") {
			options.debugMosaic = std::filesystem::path(std::string(value));
		} else {
			std::cerr << "[Error] Unknown option " << flag << '\n';
			return std::nullopt;
		}
	}
	return options;
}

static void printReading(const BoardReading& reading) {
	std::cout << "Placement:   " << reading.placement << '\n';
	std::cout << "Orientation: " << core::orientationName(reading.orientation.orientation) << " at bottom ("
	          << core::orientationSourceName(reading.orientation.source) << ")\n";
	std::cout << "Region:      " << reading.region << '\n';

	for (int row = 0; row < core::BOARD_DIM; ++row) {
		for (int col = 0; col < core::BOARD_DIM; ++col) {
			const auto& result = reading.results[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)];
			if (result.type == core::PieceType::Empty) {
				continue;
			}
			std::cout << "  " << core::squareName(row, col, core::Orientation::White) << ' ' << std::setw(12) << std::left
			          << core::pieceName(result.type) << std::right << ' ' << std::fixed << std::setprecision(2) << result.confidence << '\n';
		}
	}
}

static int scan(const ScanOptions& options) {
	const cv::Mat image = cv::imread(options.image.string());
	if (image.empty()) {
		std::cerr << "[Error] Failed to load image: " << options.image << '\n';
		return 1;
	}

	BoardRecognizer recognizer;
	if (options.model && !recognizer.models().load(*options.model)) {
		return 1;
	}

	core::DebugVisualizer debug;
	const BoardReading reading = recognizer.recognize(image, options.mode, options.region, options.debugMosaic ? &debug : nullptr);
	if (options.debugMosaic) {
		debug.saveMosaic(*options.debugMosaic);
	}
	if (!reading.success) {
		return 1;
	}

	printReading(reading);
	return 0;
}

static int retrain(const std::filesystem::path& logFile, const std::filesystem::path& modelFile) {
	const training::FeedbackStore feedback(logFile);
	BoardRecognizer recognizer;

	const training::RetrainReport report = recognizer.retrain(feedback);
	std::cout << "Status: " << training::retrainStatusName(report.status);
	if (report.status != training::RetrainStatus::Success) {
		std::cout << " (" << training::retrainFailureName(report.reason) << ")\n";
		return 1;
	}
	std::cout << '\n';

	for (const auto& [label, count]: report.perLabelCount) {
		std::cout << "  " << std::setw(12) << std::left << core::pieceName(label) << std::right << ' ' << count << '\n';
	}
	return recognizer.models().save(modelFile) ? 0 : 1;
}

static int stats(const std::filesystem::path& logFile) {
	const training::FeedbackStore feedback(logFile);
	const training::FeedbackStatistics statistics = feedback.statistics();

	std::cout << "Corrections: " << statistics.total << " (" << statistics.active << " active, " << statistics.superseded << " superseded)\n";
	std::cout << "Mean original confidence: " << std::fixed << std::setprecision(3) << statistics.meanOriginalConfidence << '\n';
	for (const auto& [label, count]: statistics.byPieceType) {
		std::cout << "  " << std::setw(12) << std::left << core::pieceName(label) << std::right << ' ' << count << '\n';
	}

	std::cout << "Sessions:\n";
	for (const auto& session: feedback.sessionSummaries()) {
		std::cout << "  " << session.sessionId << "  " << session.firstTimestamp << " .. " << session.lastTimestamp << "  " << session.activeCount << '/'
		          << session.totalCount << " active\n";
	}
	return 0;
}

} // namespace

} // namespace kibitz::vision

int main(int argc, char** argv) {
	using namespace kibitz::vision;

	const std::vector<std::string_view> args(argv + 1, argv + argc);
	if (args.empty()) {
		printUsage();
		return 1;
	}

	const std::string_view command = args[0];
	const std::vector<std::string_view> rest(args.begin() + 1, args.end());

	if (command == "scan") {
		const auto options = parseScanOptions(rest);
		if (!options) {
			printUsage();
			return 1;
		}
		return scan(*options);
	}
	if (command == "retrain" && rest.size() == 2u) {
		return retrain(std::string(rest[0]), std::string(rest[1]));
	}
	if (command == "stats" && rest.size() == 1u) {
		return stats(std::string(rest[0]));
	}

	printUsage();
	return 1;
}
