// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <memory>
#include <string>

#include "torch/torch.h"
#include "body_model.h"
#include "motion_dataset.h"
#include "phase_resolver.h"
#include "scene_recorder.h"

namespace mvis { namespace scene {

// Shape coefficient count passed to the body model when a phase carries none.
constexpr int kDefaultNumBetas = 10;

// Area independent vertex normals: the sum of the unit normals of every incident face,
// normalized. Vertices without a non-degenerate face get a zero normal.
MeshVertices computeVertexNormals(const MeshVertices& vertices, const MeshFaces& faces);

// Every track's body mesh at every frame of one phase.
struct PosedMeshes {
  torch::Tensor vertices;  // [B, T, V, 3] float, CPU, contiguous
  std::shared_ptr<const MeshFaces> faces;

  int numTracks() const { return vertices.size(0); }
  int numFrames() const { return vertices.size(1); }
  int numVertices() const { return vertices.size(2); }
  MeshVertices trackFrameVertices(const int track_index, const int frame_id) const;
};

// Flattens the phase to B * T rows and evaluates it in a single call.
BodyPoseBatch makeBodyPoseBatch(const PhaseResult& result);
PosedMeshes evaluatePosedMeshes(BodyModelEvaluator& evaluator, const PhaseResult& result);

// Logs the meshes of all tracks at one frame. A track whose visibility code says it is out of
// frame gets an explicit clear so its previous mesh disappears.
void logPosedMeshesAtFrame(
    SceneRecorder& recorder,
    const std::string& phase,
    const PosedMeshes& meshes,
    const VisibilityMask& vis_mask,
    const int frame_id);

}}  // namespace mvis::scene
