#include "vision/core/imageConversion.hpp"

#include <opencv2/imgproc.hpp>

namespace kibitz::vision::core {

bool convertToGray(const cv::Mat& image, cv::Mat& outGray) {
	if (image.empty()) {
		return false;
	}
	if (image.channels() == 1) {
		outGray = image.clone();
		return true;
	}
	if (image.channels() == 3) {
		cv::cvtColor(image, outGray, cv::COLOR_BGR2GRAY);
		return true;
	}
	if (image.channels() == 4) {
		cv::cvtColor(image, outGray, cv::COLOR_BGRA2GRAY);
		return true;
	}
	return false;
}

bool convertToBgr(const cv::Mat& image, cv::Mat& outBgr) {
	if (image.empty()) {
		return false;
	}
	if (image.channels() == 3) {
		outBgr = image.clone();
		return true;
	}
	if (image.channels() == 1) {
		cv::cvtColor(image, outBgr, cv::COLOR_GRAY2BGR);
		return true;
	}
	if (image.channels() == 4) {
		cv::cvtColor(image, outBgr, cv::COLOR_BGRA2BGR);
		return true;
	}
	return false;
}

} // namespace kibitz::vision::core
