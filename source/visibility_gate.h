// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

namespace mvis { namespace scene {

// Per (track, frame) visibility codes produced by the tracker.
enum VisibilityCode : int {
  kOutOfFrame = -1,
  kOccluded = 0,
  kVisible = 1,
};

enum class RenderDecision { kRender, kClear };

// Occluded tracks are rendered exactly like visible ones; only tracks that left the frame are
// cleared.
inline RenderDecision decideRender(const int visibility_code)
{
  return visibility_code >= kOccluded ? RenderDecision::kRender : RenderDecision::kClear;
}

}}  // namespace mvis::scene
