#include <doctest/doctest.h>

#include "../src/detect/sampler.h"
#include "../src/io/memory_source.h"

#include <transcode/error.h>

#include <string>
#include <utility>

using namespace transcode;
using namespace transcode::detail;

namespace {

// A memory source that reports itself as a pipe.
class PipeSource : public Source {
public:
    explicit PipeSource(std::string data) : inner_(std::move(data)) {}

    std::size_t read(char* buf, std::size_t max) override { return inner_.read(buf, max); }
    bool at_end() const override { return inner_.at_end(); }
    SourceInfo info() const override { return {"pipe", 0, false}; }
    void seek(std::uint64_t) override { throw IoError("cannot seek pipe"); }

private:
    MemorySource inner_;
};

std::string numbered_bytes(std::size_t n) {
    std::string data(n, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        data[i] = static_cast<char>('a' + (i / 4) % 26);
    }
    return data;
}

} // namespace

TEST_CASE("Sampler: budget") {
    SamplePolicy policy;
    policy.max_sample_size = 5000;
    CHECK(sample_budget(1'000'000, policy) == 5000);

    policy.percentage = 0.1;
    policy.min_sample_size = 100;
    CHECK(sample_budget(10'000, policy) == 1000);
    CHECK(sample_budget(500, policy) == 100);
    CHECK(sample_budget(1'000'000, policy) == 5000);
}

TEST_CASE("Sampler: head-only sample") {
    MemorySource source("hello world");
    CHECK(sample(source, 5) == "hello");
    CHECK(sample(source, 100) == " world");
}

TEST_CASE("Sampler: small source is read whole and rewound") {
    MemorySource source("hello");
    SamplePolicy policy;
    policy.max_sample_size = 1024;

    Sample s = take_sample(source, policy);
    CHECK(s.bytes == "hello");
    CHECK(s.covers_source);
    CHECK(s.source_size == 5);
    REQUIRE(s.segments().size() == 1);

    char c = 0;
    CHECK(source.read(&c, 1) == 1);
    CHECK(c == 'h');
}

TEST_CASE("Sampler: empty source") {
    MemorySource source("");
    Sample s = take_sample(source, SamplePolicy{});
    CHECK(s.bytes.empty());
    CHECK(s.covers_source);
    CHECK(s.segments().empty());
}

TEST_CASE("Sampler: large seekable source is sampled head, middle and tail") {
    const std::string data = numbered_bytes(100'000);
    MemorySource source(data);
    SamplePolicy policy;
    policy.max_sample_size = 10'000;

    Sample s = take_sample(source, policy);
    CHECK_FALSE(s.covers_source);
    CHECK(s.bytes.size() == 10'000);

    auto segments = s.segments();
    REQUIRE(segments.size() == 12);
    CHECK(segments.front() == std::string_view(data).substr(0, 3500));
    CHECK(segments.back() == std::string_view(data).substr(98'500));
    for (auto segment : segments) {
        std::size_t offset = data.find(segment);
        REQUIRE(offset != std::string::npos);
        CHECK(offset % 4 == 0);
    }
}

TEST_CASE("Sampler: short reads still fill the sample") {
    const std::string data = numbered_bytes(4096);
    MemorySource source(data, 7);
    SamplePolicy policy;
    policy.max_sample_size = 1000;
    policy.strategic = false;

    Sample s = take_sample(source, policy);
    CHECK(s.bytes == data.substr(0, 1000));
    CHECK_FALSE(s.covers_source);
}

TEST_CASE("Sampler: non-seekable source gets a head sample") {
    const std::string data = numbered_bytes(1000);
    PipeSource source(data);
    SamplePolicy policy;
    policy.max_sample_size = 100;

    Sample s = take_sample(source, policy);
    CHECK(s.bytes == data.substr(0, 100));
    CHECK_FALSE(s.covers_source);
    CHECK(s.segments().size() == 1);
}

TEST_CASE("Sampler: missing file is an IoError") {
    CHECK_THROWS_AS(take_sample("/nonexistent/transcode/sample.txt", SamplePolicy{}), IoError);
}
