#undef NDEBUG
#include "face_detector.h"
#include "detectors/retinaface.h"
#include "test_util.h"
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>

using namespace rollcall;
using namespace rollcall::test;

namespace {

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

FaceProposal proposal(int x, int y, int size, float prob) {
    FaceProposal p;
    p.rect = Rect(x, y, size, size);
    p.prob = prob;
    return p;
}

} // namespace

void testParseModelOutputDim() {
    std::cout << "Testing recognition output dimension parsing..." << std::endl;

    TempDir dir("rollcall_detector");

    writeFile(dir.file("arcface.param"),
        "7767517\n"
        "3 3\n"
        "Input            in0              0 1 in0\n"
        "Convolution      conv_0           1 1 in0 1 0=64 1=3\n"
        "InnerProduct     fc_1             1 1 1 out0 0=512 1=1 2=262144\n");
    assert(FaceDetector::parseModelOutputDim(dir.file("arcface.param")) == 512);

    // foo.param falls back to foo.ncnn.param
    writeFile(dir.file("sface.ncnn.param"),
        "7767517\n"
        "InnerProduct     fc               1 1 feat out0 0=128 1=1\n");
    assert(FaceDetector::parseModelOutputDim(dir.file("sface.param")) == 128);

    // Graph without an embedding head
    writeFile(dir.file("classifier.param"),
        "7767517\n"
        "InnerProduct     fc               1 1 feat prob 0=7\n");
    assert(FaceDetector::parseModelOutputDim(dir.file("classifier.param")) == 0);

    assert(FaceDetector::parseModelOutputDim(dir.file("missing.param")) == 0);

    std::cout << "  PASSED" << std::endl;
}

void testIntersectionOverUnion() {
    std::cout << "Testing intersection over union..." << std::endl;

    Rect a(0, 0, 10, 10);
    assert(std::fabs(intersectionOverUnion(a, a) - 1.0f) < 1e-6f);
    assert(intersectionOverUnion(a, Rect(20, 20, 10, 10)) == 0.0f);
    assert(intersectionOverUnion(a, Rect(10, 0, 10, 10)) == 0.0f);  // touching edges
    assert(intersectionOverUnion(a, Rect()) == 0.0f);

    // 50 overlap / 150 union
    assert(std::fabs(intersectionOverUnion(a, Rect(5, 0, 10, 10)) - 1.0f / 3.0f) < 1e-6f);

    std::cout << "  PASSED" << std::endl;
}

void testNonMaximumSuppression() {
    std::cout << "Testing non-maximum suppression..." << std::endl;

    std::vector<FaceProposal> proposals = {
        proposal(0, 0, 10, 0.85f),
        proposal(1, 1, 10, 0.95f),   // overlaps the first heavily
        proposal(50, 50, 10, 0.90f),
        proposal(5, 0, 10, 0.80f),   // IoU 1/3 with the first, lower with the kept one
    };

    std::vector<size_t> kept = nonMaximumSuppression(proposals, 0.4f);

    // Sorted by probability; the 0.85 box is suppressed by the 0.95 one
    assert(proposals[0].prob == 0.95f);
    assert(kept.size() == 3);
    assert(proposals[kept[0]].prob == 0.95f);
    assert(proposals[kept[1]].prob == 0.90f);
    assert(proposals[kept[2]].prob == 0.80f);

    std::vector<FaceProposal> none;
    assert(nonMaximumSuppression(none, 0.4f).empty());

    std::cout << "  PASSED" << std::endl;
}

void testRetinaFaceParamCheck() {
    std::cout << "Testing detection graph recognition..." << std::endl;

    TempDir dir("rollcall_detector");
    writeFile(dir.file("mnet.param"),
        "7767517\n"
        "Input            data             0 1 data 0=640 1=640 2=3\n"
        "Softmax          face_rpn_cls_prob_stride32 1 1 x face_rpn_cls_prob_stride32\n");
    writeFile(dir.file("scrfd.param"),
        "7767517\n"
        "Input            input.1          0 1 input.1\n"
        "Sigmoid          score_8          1 1 x score_8\n");

    assert(isRetinaFaceParam(dir.file("mnet.param")));
    assert(!isRetinaFaceParam(dir.file("scrfd.param")));
    assert(!isRetinaFaceParam(dir.file("missing.param")));

    std::cout << "  PASSED" << std::endl;
}

void testDetectWithoutModels() {
    std::cout << "Testing detector without models..." << std::endl;

    TempDir dir("rollcall_detector");
    FaceDetectorOptions options;
    options.models_dir = dir.path();

    FaceDetector detector(options);
    assert(!detector.loadModels());

    std::atomic<bool> cancel{false};
    bool threw = false;
    try {
        detector.detect({"photo.jpg", {0xFF, 0xD8}}, cancel);
    } catch (const ExtractionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Detector Tests ===" << std::endl;

    testParseModelOutputDim();
    testIntersectionOverUnion();
    testNonMaximumSuppression();
    testRetinaFaceParamCheck();
    testDetectWithoutModels();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
