#include "vision/training/imageHash.hpp"

#include "vision/core/imageConversion.hpp"

#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>

#include <array>
#include <iostream>
#include <memory>

namespace kibitz::vision::training {

namespace {

struct DigestContextDeleter {
	void operator()(EVP_MD_CTX* context) const {
		EVP_MD_CTX_free(context);
	}
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

static std::string toHex(const unsigned char* bytes, const unsigned int length) {
	static constexpr char DIGITS[] = "0123456789abcdef";

	std::string hex;
	hex.reserve(2u * length);
	for (unsigned int i = 0; i < length; ++i) {
		hex += DIGITS[bytes[i] >> 4];
		hex += DIGITS[bytes[i] & 0x0F];
	}
	return hex;
}

//! Map 16 bit and floating point images (range [0, 1]) onto the 8 bit range.
static bool toEightBit(cv::Mat& image) {
	switch (image.depth()) {
	case CV_8U: return true;
	case CV_16U: image.convertTo(image, CV_8U, 255.0 / 65535.0); return true;
	case CV_32F:
	case CV_64F: image.convertTo(image, CV_8U, 255.0); return true;
	default:
		std::cerr << "[Warning] Cannot hash image of depth " << image.depth() << '\n';
		return false;
	}
}

} // namespace

std::string contentHash(const cv::Mat& image, const int canonicalSize) {
	if (image.empty() || canonicalSize <= 0) {
		return {};
	}

	cv::Mat resized;
	cv::resize(image, resized, cv::Size(canonicalSize, canonicalSize), 0.0, 0.0, cv::INTER_AREA);

	cv::Mat bgr;
	if (!core::convertToBgr(resized, bgr)) {
		return {};
	}
	if (!toEightBit(bgr)) {
		return {};
	}
	if (!bgr.isContinuous()) {
		bgr = bgr.clone();
	}

	DigestContext context(EVP_MD_CTX_new());
	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digestLength = 0;

	if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
	    EVP_DigestUpdate(context.get(), bgr.data, bgr.total() * bgr.elemSize()) != 1 ||
	    EVP_DigestFinal_ex(context.get(), digest.data(), &digestLength) != 1) {
		std::cerr << "[Error] SHA-256 digest failed\n";
		return {};
	}

	return toHex(digest.data(), digestLength);
}

} // namespace kibitz::vision::training
