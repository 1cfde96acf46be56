#ifndef ROLLCALL_DETECTORS_RETINAFACE_H
#define ROLLCALL_DETECTORS_RETINAFACE_H

#include "../image.h"
#include <ncnn/net.h>
#include <string>
#include <vector>

namespace rollcall {

// Candidate box before non-maximum suppression
struct FaceProposal {
    Rect rect;
    float prob = 0.0f;
};

// Intersection-over-union of two boxes, 0 when either is empty
float intersectionOverUnion(const Rect& a, const Rect& b);

// Sort by probability (descending) and keep boxes that overlap every
// already kept box by at most nms_threshold IoU. Returns kept indices.
std::vector<size_t> nonMaximumSuppression(std::vector<FaceProposal>& proposals, float nms_threshold);

/**
 * RetinaFace (mnet.25-opt) decoder.
 *
 * Input: "data" blob, RGB, any size. Outputs per stride 32/16/8:
 *   face_rpn_cls_prob_reshape_stride{N}, face_rpn_bbox_pred_stride{N},
 *   face_rpn_landmark_pred_stride{N} (optional; enables 5-point alignment)
 *
 * Scored boxes and landmarks are returned in input coordinates, clipped to the image.
 */
std::vector<FaceProposal> detectWithRetinaFace(const ncnn::Net& net, const ncnn::Mat& in, int img_w, int img_h,
                                               float confidence_threshold = 0.8f, float nms_threshold = 0.4f);

// True if the .param file declares RetinaFace output blobs
bool isRetinaFaceParam(const std::string& param_path);

} // namespace rollcall

#endif // ROLLCALL_DETECTORS_RETINAFACE_H
