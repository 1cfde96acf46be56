#ifndef ROLLCALL_FACE_DETECTOR_H
#define ROLLCALL_FACE_DETECTOR_H

#include "detectors/retinaface.h"
#include "embedding_source.h"
#include "image.h"
#include <string>
#include <utility>
#include <vector>
#include <ncnn/net.h>             // NCNN for face recognition and detection

namespace rollcall {

struct FaceDetectorOptions {
    std::string models_dir;        // where recognition/detection models are looked up
    float confidence = 0.8f;       // minimum RetinaFace score
    int num_threads = 4;           // NCNN threads per network
    int max_side = 1280;           // larger photos are downscaled for detection only
};

/**
 * NCNN-backed embedding source: RetinaFace detection, 5-point alignment to
 * 112x112, recognition network with input "in0" and output "out0".
 *
 * Model lookup (recognition): explicit path, then <models_dir>/recognition,
 * then the first *.param with a matching .bin whose output is 64D..2048D,
 * then <models_dir>/sface.
 * Model lookup (detection): explicit path, then <models_dir>/detection,
 * then <models_dir>/mnet.25-opt. Only RetinaFace detection graphs are accepted.
 *
 * detect() may be called concurrently once loadModels() has returned true.
 */
class FaceDetector : public EmbeddingSource {
public:
    explicit FaceDetector(FaceDetectorOptions options);

    // Base paths are given without extension; .param/.bin (or .ncnn.param/.ncnn.bin) are appended
    bool loadModels(const std::string& recognition_base = "", const std::string& detection_base = "");

    std::vector<DetectedFace> detect(const EncodedImage& image,
                                     const std::atomic<bool>& cancel) override;

    size_t dimension() const override { return encoding_dim_; }

    const std::string& modelName() const { return model_name_; }
    const std::string& detectionModelName() const { return detection_model_name_; }

    // Output size of the "out0" InnerProduct layer, 0 if it cannot be read
    static size_t parseModelOutputDim(const std::string& param_path);

private:
    FaceDetectorOptions options_;

    ncnn::Net recognition_net_;
    ncnn::Net detection_net_;
    bool models_loaded_ = false;

    size_t encoding_dim_ = 0;
    std::string model_name_;
    std::string detection_model_name_;

    std::pair<std::string, size_t> findAvailableModel(const std::string& models_dir) const;
    bool loadNet(ncnn::Net& net, const std::string& base_path, std::string& param_path);

    std::vector<FaceProposal> detectFaces(const Image& frame) const;
    Image alignFace(const ImageView& frame, const Rect& face_rect) const;
    bool encodeFace(const Image& aligned, FaceEncoding& out) const;
};

} // namespace rollcall

#endif // ROLLCALL_FACE_DETECTOR_H
