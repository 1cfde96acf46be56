// RetinaFace face detector
// Model: RetinaFace (mnet.25-opt), anchors at strides 32/16/8 with two scales each
// Reference: https://github.com/deepinsight/insightface/tree/master/detection/retinaface

#include "retinaface.h"
#include "../logger.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <numeric>
#include <string>

namespace rollcall {

namespace {

struct StrideSpec {
    int stride;
    float scales[2];
};

constexpr StrideSpec STRIDES[] = {
    {32, {32.f, 16.f}},
    {16, {8.f, 4.f}},
    {8, {2.f, 1.f}},
};

constexpr int ANCHOR_BASE_SIZE = 16;

// Square anchors (ratio 1) centred on the base cell, one row per scale
std::vector<std::array<float, 4>> makeAnchors(const float (&scales)[2]) {
    std::vector<std::array<float, 4>> anchors;
    const float center = ANCHOR_BASE_SIZE * 0.5f;
    for (float scale : scales) {
        float half = ANCHOR_BASE_SIZE * scale * 0.5f;
        anchors.push_back({center - half, center - half, center + half, center + half});
    }
    return anchors;
}

void decodeStride(const StrideSpec& level, const ncnn::Mat& score_blob, const ncnn::Mat& bbox_blob,
                  const ncnn::Mat& landmark_blob, float prob_threshold,
                  std::vector<FaceProposal>& proposals) {
    const auto anchors = makeAnchors(level.scales);
    const int num_anchors = static_cast<int>(anchors.size());
    const int w = score_blob.w;
    const int h = score_blob.h;
    const bool has_landmarks = !landmark_blob.empty();

    for (int q = 0; q < num_anchors; q++) {
        // First num_anchors channels are background scores
        const ncnn::Mat score = score_blob.channel(q + num_anchors);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);
        ncnn::Mat landmark;
        if (has_landmarks) {
            landmark = landmark_blob.channel_range(q * 10, 10);
        }

        const float anchor_w = anchors[q][2] - anchors[q][0];
        const float anchor_h = anchors[q][3] - anchors[q][1];

        for (int i = 0; i < h; i++) {
            for (int j = 0; j < w; j++) {
                const int index = i * w + j;
                const float prob = score[index];
                if (prob < prob_threshold) {
                    continue;
                }

                const float cx = anchors[q][0] + j * level.stride + anchor_w * 0.5f;
                const float cy = anchors[q][1] + i * level.stride + anchor_h * 0.5f;

                const float pb_cx = cx + anchor_w * bbox.channel(0)[index];
                const float pb_cy = cy + anchor_h * bbox.channel(1)[index];
                const float pb_w = anchor_w * std::exp(bbox.channel(2)[index]);
                const float pb_h = anchor_h * std::exp(bbox.channel(3)[index]);

                FaceProposal p;
                p.prob = prob;
                p.rect.x = static_cast<int>(pb_cx - pb_w * 0.5f);
                p.rect.y = static_cast<int>(pb_cy - pb_h * 0.5f);
                p.rect.width = static_cast<int>(pb_w + 1);
                p.rect.height = static_cast<int>(pb_h + 1);

                if (has_landmarks) {
                    for (int k = 0; k < 5; k++) {
                        p.rect.landmarks.emplace_back(cx + anchor_w * landmark.channel(k * 2)[index],
                                                      cy + anchor_h * landmark.channel(k * 2 + 1)[index]);
                    }
                }
                proposals.push_back(std::move(p));
            }
        }
    }
}

} // namespace

float intersectionOverUnion(const Rect& a, const Rect& b) {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }
    int x1 = std::max(a.x, b.x);
    int y1 = std::max(a.y, b.y);
    int x2 = std::min(a.x + a.width, b.x + b.width);
    int y2 = std::min(a.y + a.height, b.y + b.height);
    if (x2 <= x1 || y2 <= y1) {
        return 0.0f;
    }
    float inter = static_cast<float>(x2 - x1) * static_cast<float>(y2 - y1);
    float uni = static_cast<float>(a.area() + b.area()) - inter;
    return uni > 0.0f ? inter / uni : 0.0f;
}

std::vector<size_t> nonMaximumSuppression(std::vector<FaceProposal>& proposals, float nms_threshold) {
    std::stable_sort(proposals.begin(), proposals.end(),
                     [](const FaceProposal& a, const FaceProposal& b) { return a.prob > b.prob; });

    std::vector<size_t> kept;
    for (size_t i = 0; i < proposals.size(); i++) {
        bool keep = true;
        for (size_t k : kept) {
            if (intersectionOverUnion(proposals[i].rect, proposals[k].rect) > nms_threshold) {
                keep = false;
                break;
            }
        }
        if (keep) {
            kept.push_back(i);
        }
    }
    return kept;
}

std::vector<FaceProposal> detectWithRetinaFace(const ncnn::Net& net, const ncnn::Mat& in, int img_w, int img_h,
                                       float confidence_threshold, float nms_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    std::vector<FaceProposal> proposals;
    for (const auto& level : STRIDES) {
        const std::string suffix = "_stride" + std::to_string(level.stride);
        ncnn::Mat score_blob, bbox_blob, landmark_blob;
        if (ex.extract(("face_rpn_cls_prob_reshape" + suffix).c_str(), score_blob) != 0 ||
            ex.extract(("face_rpn_bbox_pred" + suffix).c_str(), bbox_blob) != 0) {
            Logger::getInstance().warning("RetinaFace: missing output blobs for stride " +
                                          std::to_string(level.stride));
            continue;
        }
        if (ex.extract(("face_rpn_landmark_pred" + suffix).c_str(), landmark_blob) != 0) {
            landmark_blob = ncnn::Mat();
        }
        decodeStride(level, score_blob, bbox_blob, landmark_blob, confidence_threshold, proposals);
    }

    std::vector<size_t> kept = nonMaximumSuppression(proposals, nms_threshold);

    std::vector<FaceProposal> faces;
    for (size_t idx : kept) {
        FaceProposal face;
        face.rect = proposals[idx].rect.clipped(img_w, img_h);
        face.prob = proposals[idx].prob;
        if (!face.rect.empty()) {
            faces.push_back(std::move(face));
        }
    }
    return faces;
}

bool isRetinaFaceParam(const std::string& param_path) {
    std::ifstream file(param_path);
    if (!file.is_open()) {
        return false;
    }
    std::string line;
    bool has_data_input = false;
    bool has_face_rpn = false;
    while (std::getline(file, line)) {
        if (line.find("Input") != std::string::npos && line.find(" data ") != std::string::npos) {
            has_data_input = true;
        }
        if (line.find("face_rpn") != std::string::npos) {
            has_face_rpn = true;
        }
    }
    return has_data_input && has_face_rpn;
}

} // namespace rollcall
