#pragma once

#include <opencv2/core/mat.hpp>

#include <string>

namespace kibitz::vision::training {

static constexpr int HASH_CANONICAL_SIZE = 64; //!< Side length of the canonical copy that is hashed.

//! SHA-256 of a canonical copy of the image (resized with area interpolation, 3 channel 8 bit BGR).
//! 16 bit input is scaled by 255/65535, floating point input is expected in [0, 1] and scaled by 255.
//! Identical pixels give identical hashes; the same photo at a different resolution usually does as well.
//! \returns 64 lowercase hex characters. Empty string for an empty or unsupported image.
std::string contentHash(const cv::Mat& image, int canonicalSize = HASH_CANONICAL_SIZE);

} // namespace kibitz::vision::training
