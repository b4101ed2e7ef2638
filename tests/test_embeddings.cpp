#include "embedding.hpp"
#include "face_vision.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <limits>
#include <string>

using json = nlohmann::json;
using namespace presenceguard;

TEST(EmbeddingTest, FromNumericArray) {
  auto e = Embedding::fromJson(json::array({0.1, -0.2, 0.3}));

  ASSERT_TRUE(e.ok());
  EXPECT_EQ(e.value().dimension(), 3u);
  EXPECT_FLOAT_EQ(e.value().values()[1], -0.2f);
  EXPECT_EQ(e.value().asMat().cols, 3);
  EXPECT_EQ(e.value().asMat().type(), CV_32F);
}

TEST(EmbeddingTest, FromJsonEncodedString) {
  auto e = Embedding::fromJson("[0.5, 0.25, 1e-3]");

  ASSERT_TRUE(e.ok());
  EXPECT_EQ(e.value().dimension(), 3u);
  EXPECT_FLOAT_EQ(e.value().values()[2], 0.001f);
}

TEST(EmbeddingTest, RejectsMalformedInput) {
  EXPECT_EQ(Embedding::fromJson("not json").error(), ErrorCode::MalformedInput);
  EXPECT_FALSE(Embedding::fromJson("{\"a\": 1}").ok());
  EXPECT_FALSE(Embedding::fromJson(json::array()).ok());
  EXPECT_FALSE(Embedding::fromJson(json::array({0.1, "x"})).ok());
  EXPECT_FALSE(Embedding::fromJson(json::object()).ok());
  EXPECT_FALSE(Embedding::fromJson(42).ok());
}

TEST(EmbeddingTest, RejectsNonFiniteValues) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();

  auto with_nan = Embedding::fromValues({0.1f, nan});
  EXPECT_FALSE(with_nan.ok());
  EXPECT_NE(with_nan.detail().find("index 1"), std::string::npos);
  EXPECT_FALSE(Embedding::fromValues({-inf, 0.1f}).ok());
}

TEST(EmbeddingTest, EnforcesExpectedDimension) {
  EXPECT_TRUE(Embedding::fromValues({1, 2, 3}, 3).ok());
  EXPECT_FALSE(Embedding::fromValues({1, 2, 3}, 128).ok());
  EXPECT_TRUE(Embedding::fromValues({1, 2, 3}, 0).ok());
}

TEST(EmbeddingTest, ToJsonKeepsValues) {
  auto e = Embedding::fromValues({0.5f, 0.25f});
  ASSERT_TRUE(e.ok());

  auto back = Embedding::fromJson(e.value().toJson());
  ASSERT_TRUE(back.ok());
  EXPECT_EQ(back.value().values(), e.value().values());
}

TEST(IdentityTest, AcceptsPlainNames) {
  EXPECT_TRUE(isValidIdentity("alice"));
  EXPECT_TRUE(isValidIdentity("user.name"));
  EXPECT_TRUE(isValidIdentity("user-name"));
  EXPECT_TRUE(isValidIdentity("student_123"));
}

TEST(IdentityTest, RejectsPathTraversal) {
  EXPECT_FALSE(isValidIdentity("../../etc/passwd"));
  EXPECT_FALSE(isValidIdentity("user/name"));
  EXPECT_FALSE(isValidIdentity("user\\name"));
  EXPECT_FALSE(isValidIdentity(".."));
  EXPECT_FALSE(isValidIdentity("."));
}

TEST(IdentityTest, RejectsShellAndControlCharacters) {
  EXPECT_FALSE(isValidIdentity(""));
  EXPECT_FALSE(isValidIdentity("user name"));
  EXPECT_FALSE(isValidIdentity("user@domain"));
  EXPECT_FALSE(isValidIdentity("user;rm -rf /"));
  EXPECT_FALSE(isValidIdentity("user$(whoami)"));
  EXPECT_FALSE(isValidIdentity("user\nVERIFY"));
  EXPECT_FALSE(isValidIdentity(std::string(65, 'a')));
  EXPECT_TRUE(isValidIdentity(std::string(64, 'a')));
}

TEST(ModelVersionTest, StandardSFaceModel) {
  EXPECT_EQ(modelVersionFromPath(
                "/etc/presenceguard/models/face_recognition_sface_2021dec.onnx"),
            "sface_2021dec");
}

TEST(ModelVersionTest, CustomModelWithoutPrefix) {
  EXPECT_EQ(modelVersionFromPath("/models/custom_recognizer_v2.onnx"),
            "custom_recognizer_v2");
}

TEST(ModelVersionTest, RelativeAndBarePaths) {
  EXPECT_EQ(modelVersionFromPath("models/face_recognition_arcface.onnx"),
            "arcface");
  EXPECT_EQ(modelVersionFromPath("face_recognition_vggface.onnx"), "vggface");
  EXPECT_EQ(modelVersionFromPath("/path/face_recognition_test"), "test");
}

TEST(FaceModelsTest, MissingModelFilesFailToLoad) {
  ModelConfig config;
  config.models_dir = "/nonexistent/presenceguard/models";
  FaceModels models{config};

  EXPECT_FALSE(models.load());
  EXPECT_FALSE(models.loaded());
  EXPECT_EQ(models.modelVersion(), "sface_2021dec");
}

TEST(ImageQualityTest, FlatGrayScoresOnBrightnessAndFace) {
  cv::Mat flat(64, 64, CV_8UC3, cv::Scalar::all(128));

  ImageQuality without_face = assessImageQuality(flat, false);
  EXPECT_NEAR(without_face.sharpness, 0.0, 1e-9);
  EXPECT_NEAR(without_face.contrast, 0.0, 1e-9);
  EXPECT_NEAR(without_face.brightness, 1.0, 1e-9);
  EXPECT_NEAR(without_face.score, 0.2, 1e-9);
  EXPECT_LT(without_face.score, ModelConfig{}.min_image_quality);

  EXPECT_NEAR(assessImageQuality(flat, true).score, 0.5, 1e-9);
}

TEST(ImageQualityTest, BlackFrameScoresZero) {
  cv::Mat black(64, 64, CV_8UC1, cv::Scalar::all(0));

  ImageQuality q = assessImageQuality(black, false);

  EXPECT_NEAR(q.score, 0.0, 1e-9);
  EXPECT_EQ(assessImageQuality(cv::Mat(), true).score, 0.0);
}

TEST(ImageQualityTest, SharpHighContrastPasses) {
  cv::Mat board(64, 64, CV_8UC3, cv::Scalar::all(0));
  for (int y = 0; y < board.rows; y++)
    for (int x = 0; x < board.cols; x++)
      if (((x / 8) + (y / 8)) % 2 == 0)
        board.at<cv::Vec3b>(y, x) = cv::Vec3b(255, 255, 255);

  ImageQuality q = assessImageQuality(board, false);

  EXPECT_DOUBLE_EQ(q.sharpness, 1.0);
  EXPECT_GT(q.contrast, 0.9);
  EXPECT_GT(q.score, 0.6);
  EXPECT_GE(q.score, ModelConfig{}.min_image_quality);
}
