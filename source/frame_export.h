// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>

#include "opencv2/core.hpp"
#include "motion_dataset.h"

namespace mvis { namespace scene {

// A stable, distinct BGR color per track index.
cv::Scalar trackColor(const int track_index);

// The input frame with every track's thresholded skeleton drawn on it.
cv::Mat drawSkeletonOverlay(const cv::Mat& image, const MotionDataset& dataset, const int frame_id);

// Writes <output_dir>/frames/<frame_id, zero padded to 6>.png for every frame, with skeleton
// overlays when draw_keypoints is set. Returns the number of frames written.
int exportFrames(const MotionDataset& dataset, const std::string& output_dir, const bool draw_keypoints);

}}  // namespace mvis::scene
