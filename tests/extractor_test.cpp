#include "Extractors/Extractor.hpp"

#include <gtest/gtest.h>

#include "Extractors/DirectLinkExtractor.hpp"
#include "Extractors/ExtractorRegistry.hpp"
#include "fake_transport.hpp"
#include "utils/errors.hpp"

using haul::DirectLinkExtractor;
using haul::ExtractorRegistry;
using haul::parseSizeString;
using haul::parseUrl;
using haul::validateUrlScheme;
using haul::testing::FakeResource;
using haul::testing::FakeTransport;

namespace {

class NamedExtractor : public haul::Extractor {
 public:
  NamedExtractor(std::string name, std::string host)
      : name_(std::move(name)), host_(std::move(host)) {}
  std::string name() const override { return name_; }
  bool canHandle(const std::string& url) const override {
    return parseUrl(url).host == host_;
  }
  std::vector<haul::FileInfo> extract(
      const std::string&, const std::optional<std::string>&) override {
    return {};
  }

 private:
  std::string name_;
  std::string host_;
};

}  // namespace

TEST(UrlTest, ParsesParts) {
  auto parts = parseUrl("HTTPS://User:pw@Files.Example.COM:8443/a/b.zip?x=1#f");
  EXPECT_EQ(parts.scheme, "https");
  EXPECT_EQ(parts.host, "files.example.com");
  EXPECT_EQ(parts.path, "/a/b.zip");

  parts = parseUrl("http://[::1]:8080/x");
  EXPECT_EQ(parts.host, "[::1]");
  EXPECT_EQ(parts.path, "/x");

  parts = parseUrl("https://example.com?q=1");
  EXPECT_EQ(parts.host, "example.com");
  EXPECT_EQ(parts.path, "");

  EXPECT_EQ(parseUrl("not a url").scheme, "");
}

TEST(UrlTest, ValidatesScheme) {
  EXPECT_NO_THROW(validateUrlScheme("https://example.com/file"));
  try {
    validateUrlScheme("ftp://example.com/file");
    FAIL() << "expected InvalidUrlError";
  } catch (const haul::InvalidUrlError& e) {
    EXPECT_STREQ(e.what(), "Invalid URL scheme: 'ftp'. Only http/https allowed.");
  }
  try {
    validateUrlScheme("https:///path");
    FAIL() << "expected InvalidUrlError";
  } catch (const haul::InvalidUrlError& e) {
    EXPECT_STREQ(e.what(), "Invalid URL: missing host");
  }
}

TEST(SizeStringTest, ParsesUnits) {
  EXPECT_EQ(parseSizeString("512"), 512u);
  EXPECT_EQ(parseSizeString("12K"), 12u * 1024);
  EXPECT_EQ(parseSizeString("1.5 GB"), 1610612736u);
  EXPECT_EQ(parseSizeString("700 Mo"), 700u * 1024 * 1024);
  EXPECT_EQ(parseSizeString("Size: 2 To"), 2ull << 40);
  EXPECT_EQ(parseSizeString("3 kb"), 3072u);
  EXPECT_EQ(parseSizeString("unknown"), 0u);
}

TEST(ExtractorRegistryTest, RejectsDuplicatesAndNull) {
  ExtractorRegistry registry;
  registry.add(std::make_unique<NamedExtractor>("one", "one.example"));
  EXPECT_THROW(
      registry.add(std::make_unique<NamedExtractor>("one", "other.example")),
      haul::RegistrationError);
  EXPECT_THROW(registry.add(nullptr), haul::RegistrationError);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(ExtractorRegistryTest, LooksUpByNameAndUrl) {
  FakeTransport transport;
  ExtractorRegistry registry;
  registry.add(std::make_unique<NamedExtractor>("one", "one.example"));
  registry.add(std::make_unique<DirectLinkExtractor>(transport));

  EXPECT_EQ(registry.get("one")->name(), "one");
  EXPECT_EQ(registry.get("missing"), nullptr);
  EXPECT_EQ(registry.forUrl("https://one.example/x")->name(), "one");
  EXPECT_EQ(registry.forUrl("https://elsewhere.example/x")->name(), "direct");
  EXPECT_EQ(registry.forUrl("magnet:?xt=abc"), nullptr);
  EXPECT_EQ(registry.names(), (std::vector<std::string>{"one", "direct"}));
}

TEST(ExtractorTest, FolderSupportIsOptional) {
  NamedExtractor extractor("one", "one.example");
  EXPECT_FALSE(extractor.extractFolder("https://one.example/f").has_value());
}

TEST(DirectLinkExtractorTest, NamesFileFromUrl) {
  FakeTransport transport;
  FakeResource res;
  res.body = std::string(2048, 'x');
  transport.add("https://h.example/dir/My%20File.iso?token=1", res);

  DirectLinkExtractor extractor(transport);
  auto files = extractor.extract("https://h.example/dir/My%20File.iso?token=1");
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].filename, "My File.iso");
  EXPECT_EQ(files[0].size, 2048u);
  EXPECT_EQ(files[0].extractorName, "direct");
  EXPECT_EQ(files[0].downloadUrl(),
            "https://h.example/dir/My%20File.iso?token=1");
}

TEST(DirectLinkExtractorTest, PrefersContentDisposition) {
  FakeTransport transport;
  FakeResource res;
  res.body = "data";
  res.contentDisposition = "attachment; filename=\"real-name.tar.gz\"";
  transport.add("https://h.example/download?id=7", res);

  DirectLinkExtractor extractor(transport);
  auto files = extractor.extract("https://h.example/download?id=7");
  EXPECT_EQ(files[0].filename, "real-name.tar.gz");
}

TEST(DirectLinkExtractorTest, FallsBackWhenHeadIsRefused) {
  FakeTransport transport;
  FakeResource res;
  res.body = "data";
  res.headAllowed = false;
  transport.add("https://h.example/", res);

  DirectLinkExtractor extractor(transport);
  auto files = extractor.extract("https://h.example/");
  EXPECT_EQ(files[0].filename, "download");
  EXPECT_EQ(files[0].size, 0u);
}

TEST(DirectLinkExtractorTest, MapsMissingToNotFound) {
  FakeTransport transport;
  DirectLinkExtractor extractor(transport);
  EXPECT_THROW(extractor.extract("https://h.example/gone"),
               haul::NotFoundError);
  EXPECT_THROW(extractor.extract("file:///etc/passwd"), haul::InvalidUrlError);
  EXPECT_FALSE(extractor.canHandle("file:///etc/passwd"));
  EXPECT_TRUE(extractor.canHandle("HTTP://h.example/a"));

  FakeResource forbidden;
  forbidden.status = 403;
  transport.add("https://h.example/private", forbidden);
  EXPECT_THROW(extractor.extract("https://h.example/private"),
               haul::HttpStatusError);
}
