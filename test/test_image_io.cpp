#undef NDEBUG
#include "image_io.h"
#include "fs_util.h"
#include "test_util.h"
#include <cassert>
#include <iostream>
#include <limits>

using namespace rollcall;
using namespace rollcall::test;

void testDecodeKeepsChannelOrder() {
    std::cout << "Testing decode returns BGR pixels..." << std::endl;

    Image src(4, 3, 3);
    uint8_t* px = src.data() + 1 * src.stride() + 2 * 3;
    px[0] = 200;  // B
    px[1] = 100;  // G
    px[2] = 10;   // R

    std::vector<uint8_t> png = encodePng(src);
    assert(!png.empty());

    Image decoded;
    std::string error;
    assert(decodeImage(png, decoded, error));
    assert(decoded.width() == 4 && decoded.height() == 3 && decoded.channels() == 3);

    const uint8_t* out = decoded.data() + 1 * decoded.stride() + 2 * 3;
    assert(out[0] == 200 && out[1] == 100 && out[2] == 10);

    std::cout << "  PASSED" << std::endl;
}

void testDecodeRejectsBadInput() {
    std::cout << "Testing decode failures..." << std::endl;

    Image out;
    std::string error;

    assert(!decodeImage(std::vector<uint8_t>(), out, error));
    assert(error == "empty image data");

    error.clear();
    assert(!decodeImage(std::vector<uint8_t>{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'}, out, error));
    assert(!error.empty());

    // Length beyond what the decoder can address is refused before any byte is read
    uint8_t byte = 0;
    size_t oversized = static_cast<size_t>(std::numeric_limits<int>::max()) + 1;
    error.clear();
    assert(!decodeImage(&byte, oversized, out, error));
    assert(error.find("too large") != std::string::npos);
    assert(out.empty());

    std::cout << "  PASSED" << std::endl;
}

void testResizeAndCrop() {
    std::cout << "Testing resize and crop..." << std::endl;

    Image src(64, 48, 3);
    Image small = resizeImage(src.view(), 16, 12);
    assert(small.width() == 16 && small.height() == 12 && small.channels() == 3);

    Image crop = src.crop(Rect(60, 40, 10, 10));  // clipped to 4x8
    assert(crop.width() == 4 && crop.height() == 8);
    assert(src.crop(Rect(100, 100, 5, 5)).empty());

    std::cout << "  PASSED" << std::endl;
}

void testWriteJpeg() {
    std::cout << "Testing JPEG crop writing..." << std::endl;

    TempDir dir("rollcall_image");
    Image img(20, 20, 3);
    std::string path = dir.file("21045001_aman meena_20240318_091502_123.jpg");
    assert(writeJpeg(path, img));
    assert(fileExists(path));

    std::vector<uint8_t> bytes;
    assert(readFileBytes(path, bytes));
    Image back;
    std::string error;
    assert(decodeImage(bytes, back, error));
    assert(back.width() == 20 && back.height() == 20);

    assert(!writeJpeg(dir.file("missing/dir/x.jpg"), img));
    assert(!writeJpeg(dir.file("empty.jpg"), Image()));

    std::cout << "  PASSED" << std::endl;
}

void testSupportedExtensions() {
    std::cout << "Testing supported image extensions..." << std::endl;

    assert(isSupportedImageFile("a.jpg"));
    assert(isSupportedImageFile("B.JPEG"));
    assert(isSupportedImageFile("c.Png"));
    assert(!isSupportedImageFile("notes.txt"));
    assert(!isSupportedImageFile("jpg"));

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Image I/O Tests ===" << std::endl;

    testDecodeKeepsChannelOrder();
    testDecodeRejectsBadInput();
    testResizeAndCrop();
    testWriteJpeg();
    testSupportedExtensions();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
