#include <railtriage/media/feature_extractor.hpp>
#include <railtriage/media/mock_ocr_engine.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>

namespace rm = railtriage::media;
namespace nl = railtriage::nlp;
namespace rc = railtriage::core;

namespace {

rc::ComplaintInput text_input(const char* text, const char* location = nullptr) {
  rc::ComplaintInput in;
  in.text = text;
  if (location) in.reporter_location = location;
  in.submitted_at = rc::Timestamp{} + std::chrono::hours(100);
  return in;
}

std::vector<std::byte> fake_image(std::size_t n = 16) {
  return std::vector<std::byte>(n, std::byte{0x42});
}

bool has_token(const rc::FeatureBundle& b, const char* t) {
  return std::find(b.tokens.begin(), b.tokens.end(), t) != b.tokens.end();
}

}  // namespace

TEST(FeatureExtractor, TextOnlyComplaint) {
  rm::FeatureExtractor fx(nullptr, nl::TextVectorizer(64));
  const auto in = text_input("Seat broken, smells bad", "Coach-B12");
  const auto b = fx.extract(in);
  EXPECT_EQ(b.normalized_text, "seat broken smells bad");
  EXPECT_EQ(b.location_token, "coach-b12");
  EXPECT_FALSE(b.has_media);
  EXPECT_FALSE(b.ocr_text.has_value());
  EXPECT_FALSE(b.degraded());
  EXPECT_EQ(b.tokens.size(), 4u);
  EXPECT_EQ(b.embedding.size(), 64u);
  EXPECT_EQ(b.sentiment, rc::Sentiment::Negative);
  EXPECT_EQ(b.submitted_at, in.submitted_at);
}

TEST(FeatureExtractor, EmptyComplaintIsContentFree) {
  rm::FeatureExtractor fx(nullptr, nl::TextVectorizer(32));
  const auto b = fx.extract(text_input(""));
  EXPECT_TRUE(b.content_free());
  EXPECT_EQ(b.location_token, "unknown");
  EXPECT_TRUE(b.tokens.empty());
  // Repeated empty reports still carry a comparable, non-zero embedding.
  EXPECT_TRUE(std::any_of(b.embedding.begin(), b.embedding.end(),
                          [](float x) { return x != 0.f; }));
  EXPECT_EQ(fx.extract(text_input("")).embedding, b.embedding);
}

TEST(FeatureExtractor, MediaOnlyComplaintEmbedsAttachmentHash) {
  rm::FeatureExtractor fx(nullptr, nl::TextVectorizer(64));
  auto in = text_input("", "Coach-B12");
  in.image_bytes = fake_image(2);
  const auto first = fx.extract(in);
  const auto again = fx.extract(in);
  EXPECT_TRUE(first.tokens.empty());
  EXPECT_FALSE(first.content_free());
  EXPECT_TRUE(std::any_of(first.embedding.begin(), first.embedding.end(),
                          [](float x) { return x != 0.f; }));
  EXPECT_EQ(again.embedding, first.embedding);

  auto other = in;
  other.image_bytes = fake_image(3);
  EXPECT_NE(rm::content_fingerprint(other), rm::content_fingerprint(in));
  EXPECT_NE(rm::content_fingerprint(in), rm::content_fingerprint(text_input("")));

  auto video = text_input("");
  video.video_ref = "cam-7/clip-0042";
  const auto fp = rm::content_fingerprint(video);
  ASSERT_EQ(fp.size(), 1u);
  EXPECT_EQ(fp.front().rfind("video:", 0), 0u);
}

TEST(FeatureExtractor, OcrTextIsNormalizedAndTokenized) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  ocr->set_text("NO SMOKING!  Fire-Exit");
  rm::FeatureExtractor fx(ocr, nl::TextVectorizer(64));
  auto in = text_input("see attached");
  in.image_bytes = fake_image();
  const auto b = fx.extract(in);
  EXPECT_TRUE(b.has_media);
  ASSERT_TRUE(b.ocr_text.has_value());
  EXPECT_EQ(*b.ocr_text, "no smoking fire-exit");
  EXPECT_TRUE(has_token(b, "attached"));
  EXPECT_TRUE(has_token(b, "smoking"));
  EXPECT_FALSE(b.degraded());
  EXPECT_EQ(ocr->call_count(), 1u);
}

TEST(FeatureExtractor, OcrFailureDegradesButContinues) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  ocr->set_error(rc::TriageError::Timeout);
  rm::FeatureExtractor fx(ocr, nl::TextVectorizer(64));
  auto in = text_input("fan broken");
  in.image_bytes = fake_image();
  const auto b = fx.extract(in);
  EXPECT_TRUE(b.ocr_degraded);
  EXPECT_FALSE(b.media_degraded);
  ASSERT_TRUE(b.ocr_text.has_value());
  EXPECT_TRUE(b.ocr_text->empty());
  EXPECT_FALSE(b.notes.empty());
  EXPECT_EQ(b.normalized_text, "fan broken");
}

TEST(FeatureExtractor, UndecodableImageIsMediaDegraded) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  ocr->set_error(rc::TriageError::MediaDecodeFailed);
  rm::FeatureExtractor fx(ocr, nl::TextVectorizer(64));
  auto in = text_input("");
  in.image_bytes = fake_image();
  const auto b = fx.extract(in);
  EXPECT_TRUE(b.media_degraded);
  EXPECT_TRUE(b.has_media);
  EXPECT_FALSE(b.content_free());
}

TEST(FeatureExtractor, OversizedImageIsNotDecoded) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  ocr->set_text("fire");
  rm::FeatureExtractorOptions opts;
  opts.max_media_bytes = 8;
  rm::FeatureExtractor fx(ocr, nl::TextVectorizer(64), opts);
  auto in = text_input("photo");
  in.image_bytes = fake_image(9);
  const auto b = fx.extract(in);
  EXPECT_TRUE(b.media_degraded);
  EXPECT_EQ(ocr->call_count(), 0u);
}

TEST(FeatureExtractor, UnreadableVideoIsMediaDegraded) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  rm::FeatureExtractor fx(ocr, nl::TextVectorizer(64));
  auto in = text_input("video attached");
  in.video_ref = "/nonexistent/railtriage_video_12345.mp4";
  const auto b = fx.extract(in);
  EXPECT_TRUE(b.has_media);
  EXPECT_TRUE(b.media_degraded);
  EXPECT_EQ(ocr->call_count(), 0u);
}

TEST(FeatureExtractor, AppliesLocationAliases) {
  rm::FeatureExtractorOptions opts;
  opts.location_aliases = nl::make_alias_map({{"B12", "coach-b12"}});
  rm::FeatureExtractor fx(nullptr, nl::TextVectorizer(64), opts);
  EXPECT_EQ(fx.extract(text_input("x", "b12")).location_token, "coach-b12");
}
