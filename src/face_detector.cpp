#include "face_detector.h"
#include "detectors/retinaface.h"
#include "errors.h"
#include "fs_util.h"
#include "image_io.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <regex>

namespace rollcall {

namespace {

constexpr int ALIGNED_SIZE = 112;

// Reference 5-point layout for a 112x112 aligned face
// (left eye, right eye, nose tip, left mouth corner, right mouth corner)
const Point REFERENCE_LANDMARKS[5] = {
    Point(38.2946f, 51.6963f),
    Point(73.5318f, 51.5014f),
    Point(56.0252f, 71.7366f),
    Point(41.5493f, 92.3655f),
    Point(70.7299f, 92.2041f)
};

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Resolve <base>.param/.bin, falling back to <base>.ncnn.param/.ncnn.bin
bool resolveModelFiles(const std::string& base, std::string& param_path, std::string& bin_path) {
    param_path = base + ".param";
    bin_path = base + ".bin";
    if (fileExists(param_path) && fileExists(bin_path)) {
        return true;
    }
    param_path = base + ".ncnn.param";
    bin_path = base + ".ncnn.bin";
    return fileExists(param_path) && fileExists(bin_path);
}

// Similarity transform from detected landmarks onto the reference layout,
// sampled bilinearly. False if the landmarks are degenerate.
bool warpByLandmarks(const ImageView& frame, const std::vector<Point>& src, Image& aligned) {
    float src_cx = 0.0f, src_cy = 0.0f;
    float dst_cx = 0.0f, dst_cy = 0.0f;
    for (int i = 0; i < 5; i++) {
        src_cx += src[i].x;
        src_cy += src[i].y;
        dst_cx += REFERENCE_LANDMARKS[i].x;
        dst_cy += REFERENCE_LANDMARKS[i].y;
    }
    src_cx /= 5.0f; src_cy /= 5.0f;
    dst_cx /= 5.0f; dst_cy /= 5.0f;

    // Scale and rotation from the eye line
    float src_eye_dx = src[1].x - src[0].x;
    float src_eye_dy = src[1].y - src[0].y;
    float dst_eye_dx = REFERENCE_LANDMARKS[1].x - REFERENCE_LANDMARKS[0].x;
    float dst_eye_dy = REFERENCE_LANDMARKS[1].y - REFERENCE_LANDMARKS[0].y;

    float src_eye_dist = std::sqrt(src_eye_dx * src_eye_dx + src_eye_dy * src_eye_dy);
    float dst_eye_dist = std::sqrt(dst_eye_dx * dst_eye_dx + dst_eye_dy * dst_eye_dy);
    if (src_eye_dist < 1.0f) {
        return false;
    }

    float scale = dst_eye_dist / src_eye_dist;
    float angle = std::atan2(dst_eye_dy, dst_eye_dx) - std::atan2(src_eye_dy, src_eye_dx);

    // [a b tx; c d ty]
    float a = scale * std::cos(angle);
    float b = -scale * std::sin(angle);
    float c = scale * std::sin(angle);
    float d = scale * std::cos(angle);
    float tx = dst_cx - (a * src_cx + b * src_cy);
    float ty = dst_cy - (c * src_cx + d * src_cy);

    float det = a * d - b * c;
    if (std::abs(det) < 1e-6f) {
        return false;
    }

    // Backward mapping
    float inv_a = d / det;
    float inv_b = -b / det;
    float inv_c = -c / det;
    float inv_d = a / det;
    float inv_tx = -(inv_a * tx + inv_b * ty);
    float inv_ty = -(inv_c * tx + inv_d * ty);

    aligned = Image(ALIGNED_SIZE, ALIGNED_SIZE, 3);
    uint8_t* dst = aligned.data();
    const uint8_t* src_data = frame.data();
    const int src_stride = frame.stride();

    for (int y = 0; y < ALIGNED_SIZE; y++) {
        for (int x = 0; x < ALIGNED_SIZE; x++) {
            float sx = inv_a * x + inv_b * y + inv_tx;
            float sy = inv_c * x + inv_d * y + inv_ty;

            int x0 = static_cast<int>(std::floor(sx));
            int y0 = static_cast<int>(std::floor(sy));
            int x1 = x0 + 1;
            int y1 = y0 + 1;

            uint8_t* px = dst + (y * ALIGNED_SIZE + x) * 3;
            if (x0 < 0 || y0 < 0 || x1 >= frame.width() || y1 >= frame.height()) {
                px[0] = px[1] = px[2] = 0;  // outside the photo: black
                continue;
            }

            float fx = sx - x0;
            float fy = sy - y0;
            for (int ch = 0; ch < 3; ch++) {
                float p00 = src_data[y0 * src_stride + x0 * 3 + ch];
                float p10 = src_data[y0 * src_stride + x1 * 3 + ch];
                float p01 = src_data[y1 * src_stride + x0 * 3 + ch];
                float p11 = src_data[y1 * src_stride + x1 * 3 + ch];
                float val = p00 * (1 - fx) * (1 - fy) + p10 * fx * (1 - fy) +
                            p01 * (1 - fx) * fy + p11 * fx * fy;
                px[ch] = static_cast<uint8_t>(std::min(255.0f, std::max(0.0f, val)));
            }
        }
    }
    return true;
}

} // namespace

FaceDetector::FaceDetector(FaceDetectorOptions options) : options_(std::move(options)) {}

size_t FaceDetector::parseModelOutputDim(const std::string& param_path) {
    std::ifstream file(param_path);
    std::string actual_path = param_path;

    // foo.param may ship as foo.ncnn.param
    if (!file.is_open() && endsWith(param_path, ".param") && !endsWith(param_path, ".ncnn.param")) {
        actual_path = param_path.substr(0, param_path.size() - 6) + ".ncnn.param";
        file.open(actual_path);
    }

    if (!file.is_open()) {
        Logger::getInstance().debug("Failed to open param file: " + param_path);
        return 0;
    }

    // InnerProduct <name> <in> <out> <bottom> out0 0=<dimension>
    static const std::regex output_pattern("InnerProduct\\s+\\S+\\s+\\d+\\s+\\d+\\s+\\S+\\s+out0\\s+0=(\\d+)");

    std::string line;
    while (std::getline(file, line)) {
        std::smatch match;
        if (std::regex_search(line, match, output_pattern)) {
            size_t dim = std::stoull(match[1].str());
            Logger::getInstance().debug("Detected output dimension: " + std::to_string(dim) + "D from " + actual_path);
            return dim;
        }
    }

    Logger::getInstance().debug("Could not detect output dimension from " + actual_path);
    return 0;
}

std::pair<std::string, size_t> FaceDetector::findAvailableModel(const std::string& models_dir) const {
    auto& logger = Logger::getInstance();
    logger.debug("Scanning for recognition models in: " + models_dir);

    for (const auto& filename : listDirectory(models_dir)) {
        if (!endsWith(filename, ".param") || endsWith(filename, ".ncnn.param")) {
            continue;
        }
        std::string base_path = joinPath(models_dir, filename.substr(0, filename.size() - 6));
        if (!fileExists(base_path + ".bin")) {
            logger.debug("  " + filename + ": missing .bin, skipping");
            continue;
        }

        size_t output_dim = parseModelOutputDim(base_path + ".param");
        // Below 64D is a classifier (expression, age, gender), not an embedding network
        if (output_dim < 64 || output_dim > 2048) {
            logger.debug("  " + filename + ": output " + std::to_string(output_dim) + "D, skipping");
            continue;
        }

        logger.debug("  Using recognition model " + base_path + " (" + std::to_string(output_dim) + "D)");
        return {base_path, output_dim};
    }

    logger.debug("No valid recognition models found in " + models_dir);
    return {"", 0};
}

bool FaceDetector::loadNet(ncnn::Net& net, const std::string& base_path, std::string& param_path) {
    std::string bin_path;
    if (!resolveModelFiles(base_path, param_path, bin_path)) {
        Logger::getInstance().error("Model files not found: " + base_path + ".{param,bin}");
        return false;
    }

    net.opt.use_vulkan_compute = false;
    net.opt.num_threads = options_.num_threads;
    net.opt.use_fp16_packed = false;
    net.opt.use_fp16_storage = false;

    int ret = net.load_param(param_path.c_str());
    if (ret != 0) {
        Logger::getInstance().error("Failed to load " + param_path + " (ret=" + std::to_string(ret) + ")");
        return false;
    }
    ret = net.load_model(bin_path.c_str());
    if (ret != 0) {
        Logger::getInstance().error("Failed to load " + bin_path + " (ret=" + std::to_string(ret) + ")");
        return false;
    }
    return true;
}

bool FaceDetector::loadModels(const std::string& recognition_base, const std::string& detection_base) {
    auto& logger = Logger::getInstance();
    models_loaded_ = false;

    // Recognition model
    std::string base_path;
    size_t output_dim = 0;

    if (!recognition_base.empty()) {
        base_path = recognition_base;
        output_dim = parseModelOutputDim(base_path + ".param");
    } else {
        std::string standard = joinPath(options_.models_dir, "recognition");
        std::string param_path, bin_path;
        if (resolveModelFiles(standard, param_path, bin_path)) {
            base_path = standard;
            output_dim = parseModelOutputDim(param_path);
        } else {
            auto found = findAvailableModel(options_.models_dir);
            base_path = found.first;
            output_dim = found.second;
            if (base_path.empty()) {
                base_path = joinPath(options_.models_dir, "sface");
            }
        }
    }

    if (output_dim == 0) {
        logger.warning("Could not read output dimension of " + base_path + ", assuming " +
                       std::to_string(FACE_ENCODING_DIM) + "D");
        output_dim = FACE_ENCODING_DIM;
    }

    std::string recognition_param;
    if (!loadNet(recognition_net_, base_path, recognition_param)) {
        return false;
    }
    encoding_dim_ = output_dim;
    model_name_ = baseName(base_path);

    // Detection model
    std::string det_base = detection_base;
    if (det_base.empty()) {
        std::string param_path, bin_path;
        det_base = joinPath(options_.models_dir, "detection");
        if (!resolveModelFiles(det_base, param_path, bin_path)) {
            det_base = joinPath(options_.models_dir, "mnet.25-opt");
        }
    }

    std::string detection_param;
    if (!loadNet(detection_net_, det_base, detection_param)) {
        return false;
    }
    if (!isRetinaFaceParam(detection_param)) {
        logger.error("Detection model " + detection_param + " is not a RetinaFace graph");
        return false;
    }
    detection_model_name_ = baseName(det_base);

    models_loaded_ = true;
    logger.info("Models loaded: recognition " + model_name_ + " (" + std::to_string(encoding_dim_) +
                "D), detection " + detection_model_name_);
    return true;
}

std::vector<FaceProposal> FaceDetector::detectFaces(const Image& frame) const {
    const int img_w = frame.width();
    const int img_h = frame.height();
    const int longest = std::max(img_w, img_h);

    if (options_.max_side <= 0 || longest <= options_.max_side) {
        ncnn::Mat in = ncnn::Mat::from_pixels(frame.data(), ncnn::Mat::PIXEL_BGR2RGB, img_w, img_h);
        return detectWithRetinaFace(detection_net_, in, img_w, img_h, options_.confidence);
    }

    // Detect on a downscaled copy, then map boxes back to full resolution
    const float scale = static_cast<float>(options_.max_side) / static_cast<float>(longest);
    const int small_w = std::max(1, static_cast<int>(img_w * scale));
    const int small_h = std::max(1, static_cast<int>(img_h * scale));
    Image small = resizeImage(frame.view(), small_w, small_h);
    if (small.empty()) {
        throw ExtractionError("failed to downscale photo for detection");
    }

    ncnn::Mat in = ncnn::Mat::from_pixels(small.data(), ncnn::Mat::PIXEL_BGR2RGB, small_w, small_h);
    std::vector<FaceProposal> faces = detectWithRetinaFace(detection_net_, in, small_w, small_h, options_.confidence);

    const float sx = static_cast<float>(img_w) / small_w;
    const float sy = static_cast<float>(img_h) / small_h;
    for (auto& face : faces) {
        const Rect& r = face.rect;
        Rect scaled(static_cast<int>(r.x * sx), static_cast<int>(r.y * sy),
                    static_cast<int>(r.width * sx), static_cast<int>(r.height * sy));
        for (const auto& p : r.landmarks) {
            scaled.landmarks.emplace_back(p.x * sx, p.y * sy);
        }
        face.rect = scaled.clipped(img_w, img_h);
    }
    return faces;
}

Image FaceDetector::alignFace(const ImageView& frame, const Rect& face_rect) const {
    if (face_rect.hasLandmarks()) {
        Image aligned;
        if (warpByLandmarks(frame, face_rect.landmarks, aligned)) {
            return aligned;
        }
        Logger::getInstance().debug("Degenerate landmarks, falling back to bbox alignment");
    }

    Rect r = face_rect.clipped(frame.width(), frame.height());
    if (r.empty()) {
        return Image();
    }
    return resizeImage(frame.roi(r), ALIGNED_SIZE, ALIGNED_SIZE);
}

bool FaceDetector::encodeFace(const Image& aligned, FaceEncoding& out) const {
    // No manual normalization: the network carries its own preprocessing
    ncnn::Mat in = ncnn::Mat::from_pixels(aligned.data(), ncnn::Mat::PIXEL_BGR,
                                          aligned.width(), aligned.height());

    ncnn::Extractor ex = recognition_net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat feat;
    int ret = ex.extract("out0", feat);
    if (ret != 0) {
        Logger::getInstance().debug("NCNN inference failed with ret=" + std::to_string(ret));
        return false;
    }

    if (feat.w != static_cast<int>(encoding_dim_) || feat.h != 1 || feat.c != 1) {
        Logger::getInstance().debug("Unexpected output shape: w=" + std::to_string(feat.w) +
                                    " h=" + std::to_string(feat.h) + " c=" + std::to_string(feat.c));
        return false;
    }

    out.assign(static_cast<const float*>(feat.data), static_cast<const float*>(feat.data) + feat.w);
    l2Normalize(out);
    return true;
}

std::vector<DetectedFace> FaceDetector::detect(const EncodedImage& image, const std::atomic<bool>& cancel) {
    if (!models_loaded_) {
        throw ExtractionError("models not loaded");
    }

    Image frame;
    std::string decode_error;
    if (!decodeImage(image.bytes, frame, decode_error)) {
        throw ExtractionError("cannot decode " + image.name + ": " + decode_error);
    }

    std::vector<FaceProposal> regions = detectFaces(frame);
    Logger::getInstance().debug(std::to_string(regions.size()) + " face(s) detected in " + image.name);

    std::vector<DetectedFace> faces;
    faces.reserve(regions.size());
    for (const auto& region : regions) {
        if (cancel.load()) {
            throw CancelledError("extraction cancelled for " + image.name);
        }

        Image aligned = alignFace(frame.view(), region.rect);
        if (aligned.empty()) {
            continue;
        }

        DetectedFace face;
        face.region = region.rect;
        face.score = region.prob;
        if (!encodeFace(aligned, face.embedding)) {
            throw ExtractionError("recognition network failed on " + image.name);
        }
        faces.push_back(std::move(face));
    }
    return faces;
}

} // namespace rollcall
