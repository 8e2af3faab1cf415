#include <gtest/gtest.h>
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include "request_corpus.hpp"
#include <cstdio>
#include <fstream>
#include <random>
#include <set>
#include <vector>

namespace httpload {

class RequestCorpusTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::ERROR;
        config.consoleOutput = false;
        Logger::getInstance().configure(config);
        path_ = ::testing::TempDir() + "httpload_corpus_test.json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    std::string path_;
    std::mt19937_64 rng_{42};
};

TEST_F(RequestCorpusTest, EmptyCorpusUsesDefaultUrl) {
    RequestCorpus corpus;
    auto spec = corpus.sample("http://default", rng_);
    EXPECT_EQ(spec, (RequestSpec{"http://default", ""}));
    EXPECT_TRUE(corpus.empty());
}

TEST_F(RequestCorpusTest, EntryWithoutUrlGetsDefault) {
    auto bodyOnly = RequestCorpus::fromJson(nlohmann::json::parse(R"(["X"])"));
    EXPECT_EQ(bodyOnly.sample("D", rng_), (RequestSpec{"D", "X"}));

    RequestCorpus emptyUrl(std::vector<CorpusEntry>{{"", "Y"}});
    EXPECT_EQ(emptyUrl.sample("D", rng_), (RequestSpec{"D", "Y"}));

    RequestCorpus full(std::vector<CorpusEntry>{{"U", "Z"}});
    EXPECT_EQ(full.sample("D", rng_), (RequestSpec{"U", "Z"}));
}

TEST_F(RequestCorpusTest, SamplingCoversEveryEntry) {
    RequestCorpus corpus(std::vector<CorpusEntry>{{"", "a"}, {"", "b"}, {"", "c"}});
    std::set<std::string> seen;
    for (int i = 0; i < 300; ++i) {
        seen.insert(corpus.sample("D", rng_).body);
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(RequestCorpusTest, SamplingIsReproducibleForSeed) {
    RequestCorpus corpus(std::vector<CorpusEntry>{{"", "a"}, {"", "b"}, {"", "c"}, {"", "d"}});
    std::mt19937_64 first(7);
    std::mt19937_64 second(7);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(corpus.sample("D", first), corpus.sample("D", second));
    }
}

TEST_F(RequestCorpusTest, ParsesBodyOnlyArray) {
    auto corpus = RequestCorpus::fromJson(nlohmann::json::parse(R"(["{\"a\":1}", "{}"])"));
    ASSERT_EQ(corpus.size(), 2u);
    EXPECT_EQ(corpus.entries()[0].url, "");
    EXPECT_EQ(corpus.entries()[0].body, "{\"a\":1}");
}

TEST_F(RequestCorpusTest, ParsesUrlBodyPairs) {
    auto corpus = RequestCorpus::fromJson(nlohmann::json::parse(
        R"([["http://a/x", "one"], ["", "two"], ["only-body"], ["http://b", "three", "extra"]])"));
    ASSERT_EQ(corpus.size(), 4u);
    EXPECT_EQ(corpus.entries()[0].url, "http://a/x");
    EXPECT_EQ(corpus.entries()[0].body, "one");
    EXPECT_EQ(corpus.entries()[1].url, "");
    EXPECT_EQ(corpus.entries()[2].url, "");
    EXPECT_EQ(corpus.entries()[2].body, "only-body");
    EXPECT_EQ(corpus.entries()[3].body, "three");
}

TEST_F(RequestCorpusTest, RejectsUnsupportedShapes) {
    EXPECT_THROW(RequestCorpus::fromJson(nlohmann::json::parse(R"({"a": 1})")),
                 ValidationException);
    EXPECT_THROW(RequestCorpus::fromJson(nlohmann::json::parse(R"(["a", ["b", "c"]])")),
                 ValidationException);
    EXPECT_THROW(RequestCorpus::fromJson(nlohmann::json::parse(R"([[]])")),
                 ValidationException);
    EXPECT_THROW(RequestCorpus::fromJson(nlohmann::json::parse(R"([1, 2])")),
                 ValidationException);
}

TEST_F(RequestCorpusTest, EmptyArrayYieldsEmptyCorpus) {
    auto corpus = RequestCorpus::fromJson(nlohmann::json::array());
    EXPECT_TRUE(corpus.empty());
}

TEST_F(RequestCorpusTest, LoadFromFile) {
    writeFile(R"([["http://host/path", "{\"id\":1}"]])");
    auto corpus = RequestCorpus::loadFromFile(path_);
    ASSERT_EQ(corpus.size(), 1u);
    EXPECT_EQ(corpus.sample("D", rng_), (RequestSpec{"http://host/path", "{\"id\":1}"}));
}

TEST_F(RequestCorpusTest, MissingFileYieldsEmptyCorpus) {
    auto corpus = RequestCorpus::loadFromFile(path_ + ".does-not-exist");
    EXPECT_TRUE(corpus.empty());
}

TEST_F(RequestCorpusTest, MalformedFileYieldsEmptyCorpus) {
    writeFile("[\"unterminated");
    EXPECT_TRUE(RequestCorpus::loadFromFile(path_).empty());

    writeFile(R"({"not": "an array"})");
    EXPECT_TRUE(RequestCorpus::loadFromFile(path_).empty());
}

} // namespace httpload
