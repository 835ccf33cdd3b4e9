#include "image.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

TEST(ImageTest, BlackImageSerializesToPlainPixmap) {
  const Image image(IntDimension2(2, 2));
  EXPECT_EQ(image.toPPM(), "P3\n2 2\n255\n0 0 0\n0 0 0\n0 0 0\n0 0 0\n");
}

TEST(ImageTest, PixelsAreWrittenRowMajorFromTheTop) {
  Image image(IntDimension2(2, 2));
  image.setPixel(0, 0, Pixel(1, 2, 3));
  image.setPixel(1, 0, Pixel(4, 5, 6));
  image.setPixel(0, 1, Pixel(7, 8, 9));
  image.setPixel(1, 1, Pixel(255, 128, 0));

  EXPECT_EQ(image.getPixel(1, 1), Pixel(255, 128, 0));
  EXPECT_EQ(image.toPPM(), "P3\n2 2\n255\n1 2 3\n4 5 6\n7 8 9\n255 128 0\n");
}

TEST(ImageTest, PixelOffsetsDoNotWrapAround) {
  const Image image(IntDimension2(65536, 1));
  EXPECT_EQ(image.pixels.size(), 3u * 65536u);
  // beyond 32 bit: 3 * 70000 * 65536
  EXPECT_EQ(image.index(0, 70000), size_t(3) * 70000 * 65536);
  EXPECT_EQ(image.index(65535, 0), size_t(3) * 65535);
}

TEST(ImageTest, NonSquareHeader) {
  const Image image(IntDimension2(3, 1));
  std::ostringstream out;
  image.writePPM(out);
  EXPECT_EQ(out.str(), "P3\n3 1\n255\n0 0 0\n0 0 0\n0 0 0\n");
}

TEST(ImageTest, SaveWritesPixmapFile) {
  Image image(IntDimension2(1, 2));
  image.setPixel(0, 1, Pixel(10, 20, 30));

  const std::string path = testing::TempDir() + "spray_image_test.ppm";
  ASSERT_TRUE(image.save(path));

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), "P3\n1 2\n255\n0 0 0\n10 20 30\n");
  std::remove(path.c_str());
}

TEST(ImageTest, SaveBitmapByExtension) {
  Image image(IntDimension2(4, 4));
  image.setPixel(2, 2, Pixel(200, 100, 50));

  const std::string path = testing::TempDir() + "spray_image_test.bmp";
  ASSERT_TRUE(image.save(path));

  std::ifstream in(path, std::ios::binary);
  char magic[2] = {0, 0};
  in.read(magic, 2);
  EXPECT_EQ(magic[0], 'B');
  EXPECT_EQ(magic[1], 'M');
  std::remove(path.c_str());
}

TEST(ImageTest, SaveFailsForUnwritablePath) {
  const Image image(IntDimension2(1, 1));
  EXPECT_FALSE(image.save(testing::TempDir() + "does/not/exist/out.ppm"));
  EXPECT_FALSE(image.save(testing::TempDir() + "does/not/exist/out.png"));
}
