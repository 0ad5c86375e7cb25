// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "frame_export.h"

#include <algorithm>
#include <cmath>

#include "opencv2/imgcodecs.hpp"
#include "opencv2/imgproc.hpp"
#include "logger.h"
#include "skeleton_2d.h"
#include "util_file.h"
#include "util_string.h"
#include "vis_errors.h"

namespace mvis { namespace scene {

cv::Scalar trackColor(const int track_index)
{
  const size_t x = track_index + 1;
  return cv::Scalar(
      255.0 * (0.5 + 0.5 * cosf(x * 5123 + 34)),
      255.0 * (0.5 + 0.5 * cosf(x * 1234 + 12)),
      255.0 * (0.5 + 0.5 * cosf(x * 6734 + 66)));
}

cv::Mat drawSkeletonOverlay(const cv::Mat& image, const MotionDataset& dataset, const int frame_id)
{
  cv::Mat overlay = image.clone();
  const int thickness = std::max(1, std::max(image.cols, image.rows) / 400);
  for (int i = 0; i < dataset.numTracks(); ++i) {
    const cv::Scalar color = trackColor(i);
    for (const LineSegment2D& s :
         extractSkeletonSegments(dataset.joints2d[i][frame_id], openPoseBody25AsCoco17())) {
      cv::line(
          overlay, cv::Point2f(s.a.x(), s.a.y()), cv::Point2f(s.b.x(), s.b.y()), color, thickness,
          cv::LINE_AA);
    }
  }
  return overlay;
}

int exportFrames(const MotionDataset& dataset, const std::string& output_dir, const bool draw_keypoints)
{
  const std::string frames_dir = output_dir + "/frames";
  file::createDirectoryIfNotExists(frames_dir);
  for (int frame_id = 0; frame_id < dataset.seq_len; ++frame_id) {
    cv::Mat image = cv::imread(dataset.image_paths[frame_id]);
    if (image.empty()) throw DatasetError("failed to load image file " + dataset.image_paths[frame_id]);
    if (draw_keypoints) image = drawSkeletonOverlay(image, dataset, frame_id);
    const std::string path = frames_dir + "/" + string::intToZeroPad(frame_id, 6) + ".png";
    XCHECK(cv::imwrite(path, image)) << "failed to write " << path;
  }
  XPLINFO << "Wrote " << dataset.seq_len << " frames to " << frames_dir;
  return dataset.seq_len;
}

}}  // namespace mvis::scene
