// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for upload URL derivation and content type detection
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "content_type.hpp"
#include "upload_url_builder.hpp"

using namespace dirpush::uploader;

namespace {

const char* const kBucketBase = "https://objectstorage.example.com/p/TOKEN/n/ns/b/bucket";

}  // namespace

// =============================================================================
// Key encoding
// =============================================================================

TEST(EncodeObjectKeyTest, UnreservedAndSlashAreKept) {
  EXPECT_EQ(encodeObjectKey("data/a-b_c.d~e/F9.txt"), "data/a-b_c.d~e/F9.txt");
}

TEST(EncodeObjectKeyTest, ReservedCharactersAreEscaped) {
  EXPECT_EQ(encodeObjectKey("my file.txt"), "my%20file.txt");
  EXPECT_EQ(encodeObjectKey("a+b?c#d%e"), "a%2Bb%3Fc%23d%25e");
}

TEST(EncodeObjectKeyTest, Utf8BytesAreEscaped) {
  EXPECT_EQ(encodeObjectKey("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(DecodePercentEscapesTest, ReversesKeyEncoding) {
  const std::string key = "dir/my file+v2 caf\xC3\xA9.txt";
  EXPECT_EQ(decodePercentEscapes(encodeObjectKey(key)), key);
}

TEST(DecodePercentEscapesTest, PlusAndMalformedEscapesAreKept) {
  EXPECT_EQ(decodePercentEscapes("/p/a+b/o/x%2By"), "/p/a+b/o/x+y");
  EXPECT_EQ(decodePercentEscapes("/p/100%/o/%zz%4"), "/p/100%/o/%zz%4");
  EXPECT_EQ(decodePercentEscapes("/p/%7e"), "/p/~");
}

// =============================================================================
// Object marker style
// =============================================================================

TEST(ObjectMarkerUrlBuilderTest, AppendsMarkerWhenMissing) {
  ObjectMarkerUrlBuilder builder(kBucketBase);
  EXPECT_FALSE(builder.baseEndsWithMarker());
  EXPECT_EQ(builder.objectUrl("data/a.txt"), std::string(kBucketBase) + "/o/data/a.txt");
}

TEST(ObjectMarkerUrlBuilderTest, TrailingSlashWithoutMarker) {
  ObjectMarkerUrlBuilder builder(std::string(kBucketBase) + "/");
  EXPECT_EQ(builder.objectUrl("a.txt"), std::string(kBucketBase) + "/o/a.txt");
}

TEST(ObjectMarkerUrlBuilderTest, BaseAlreadyEndingWithMarker) {
  ObjectMarkerUrlBuilder builder(std::string(kBucketBase) + "/o/");
  EXPECT_TRUE(builder.baseEndsWithMarker());
  EXPECT_EQ(builder.objectUrl("data/a.txt"), std::string(kBucketBase) + "/o/data/a.txt");
}

TEST(ObjectMarkerUrlBuilderTest, CustomMarker) {
  ObjectMarkerUrlBuilder builder("https://host/bucket", "objects");
  EXPECT_EQ(builder.objectUrl("k"), "https://host/bucket/objects/k");
}

TEST(ObjectMarkerUrlBuilderTest, KeyIsPercentEncoded) {
  ObjectMarkerUrlBuilder builder("https://host/b");
  EXPECT_EQ(builder.objectUrl("docs/my file.txt"), "https://host/b/o/docs/my%20file.txt");
}

TEST(ObjectMarkerUrlBuilderTest, QueryIsPreservedAfterKey) {
  ObjectMarkerUrlBuilder builder("https://host/b/o/?sig=abc&exp=1");
  EXPECT_EQ(builder.objectUrl("a.txt"), "https://host/b/o/a.txt?sig=abc&exp=1");
}

TEST(ObjectMarkerUrlBuilderTest, InvalidArgumentsAreRejected) {
  EXPECT_THROW(ObjectMarkerUrlBuilder(""), std::invalid_argument);
  EXPECT_THROW(ObjectMarkerUrlBuilder("ftp://host/b"), std::invalid_argument);
  EXPECT_THROW(ObjectMarkerUrlBuilder("https://host/b", ""), std::invalid_argument);
  EXPECT_THROW(ObjectMarkerUrlBuilder("https://host/b", "a/b"), std::invalid_argument);
}

// =============================================================================
// Plain prefix style and part URLs
// =============================================================================

TEST(PlainPrefixUrlBuilderTest, JoinsBaseAndKey) {
  PlainPrefixUrlBuilder builder("http://localhost:9000/upload/");
  EXPECT_EQ(builder.objectUrl("x/y.bin"), "http://localhost:9000/upload/x/y.bin");
}

TEST(PartUrlTest, AddsPartNumberAsQuery) {
  ObjectMarkerUrlBuilder builder("https://host/b");
  std::string object_url = builder.objectUrl("big.bin");
  EXPECT_EQ(builder.partUrl(object_url, 1), "https://host/b/o/big.bin?partNum=1");
  EXPECT_EQ(builder.partUrl(object_url, 12), "https://host/b/o/big.bin?partNum=12");
}

TEST(PartUrlTest, ExtendsExistingQuery) {
  PlainPrefixUrlBuilder builder("https://host/b?sig=1");
  std::string object_url = builder.objectUrl("big.bin");
  EXPECT_EQ(builder.partUrl(object_url, 3), "https://host/b/big.bin?sig=1&partNum=3");
}

TEST(CreateUrlBuilderTest, SelectsStyle) {
  EXPECT_EQ(createUrlBuilder("", "https://host/b")->objectUrl("k"), "https://host/b/o/k");
  EXPECT_EQ(createUrlBuilder("marker", "https://host/b")->objectUrl("k"), "https://host/b/o/k");
  EXPECT_EQ(createUrlBuilder("plain", "https://host/b")->objectUrl("k"), "https://host/b/k");
  EXPECT_THROW(createUrlBuilder("virtual", "https://host/b"), std::invalid_argument);
}

// =============================================================================
// Content type
// =============================================================================

TEST(ContentTypeTest, KnownExtensions) {
  EXPECT_EQ(guessContentType("notes.txt"), "text/plain");
  EXPECT_EQ(guessContentType("data.json"), "application/json");
  EXPECT_EQ(guessContentType("photo.jpg"), "image/jpeg");
  EXPECT_EQ(guessContentType("archive.gz"), "application/gzip");
}

TEST(ContentTypeTest, ExtensionMatchIsCaseInsensitive) {
  EXPECT_EQ(guessContentType("PHOTO.JPG"), "image/jpeg");
}

TEST(ContentTypeTest, UnknownOrMissingExtensionFallsBack) {
  EXPECT_EQ(guessContentType("blob.xyz123"), kDefaultContentType);
  EXPECT_EQ(guessContentType("Makefile"), kDefaultContentType);
  EXPECT_EQ(guessContentType(""), kDefaultContentType);
}
