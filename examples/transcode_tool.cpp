#include <transcode/error.h>
#include <transcode/transcoder.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Standard input as a non-seekable source.
class StdinSource : public transcode::Source {
public:
    std::size_t read(char* buf, std::size_t max) override {
        if (eof_ || max == 0) return 0;
        std::size_t n = std::fread(buf, 1, max, stdin);
        if (n < max) {
            if (std::ferror(stdin)) {
                throw transcode::IoError(std::string("read failed: <stdin> (") +
                                         std::strerror(errno) + ")");
            }
            eof_ = true;
        }
        return n;
    }

    bool at_end() const override { return eof_; }

    transcode::SourceInfo info() const override { return {"<stdin>", 0, false}; }

    void seek(std::uint64_t) override {
        throw transcode::IoError("cannot seek <stdin>");
    }

private:
    bool eof_ = false;
};

class StdoutSink : public transcode::Sink {
public:
    void write(std::string_view bytes) override {
        if (std::fwrite(bytes.data(), 1, bytes.size(), stdout) != bytes.size()) {
            throw transcode::IoError(std::string("write failed: <stdout> (") +
                                     std::strerror(errno) + ")");
        }
    }

    void commit() override {
        if (std::fflush(stdout) != 0) {
            throw transcode::IoError(std::string("flush failed: <stdout> (") +
                                     std::strerror(errno) + ")");
        }
    }
};

void usage() {
    std::fprintf(stderr,
                 "usage: transcode_tool [-v] detect FILE\n"
                 "       transcode_tool [-v] analyse FILE\n"
                 "       transcode_tool [-v] convert FILE|- TO [FROM]\n"
                 "       transcode_tool [-v] normalize FILE ENCODING LF|CRLF|CR\n");
}

int run(const std::vector<std::string>& args) {
    const std::string& command = args[0];
    transcode::Transcoder transcoder;

    if (command == "detect" && args.size() == 2) {
        transcode::DetectionResult r = transcoder.detect(args[1]);
        std::printf("%s %.2f%s\n", r.encoding.c_str(), r.confidence,
                    r.bom_present ? " bom" : "");
        return 0;
    }

    if (command == "analyse" && args.size() == 2) {
        transcode::AnalysisResult r = transcoder.analyse(args[1]);
        std::string_view newlines = transcode::to_string(r.newlines);
        std::printf("%s %.2f%s %.*s%s\n", r.detection.encoding.c_str(), r.detection.confidence,
                    r.detection.bom_present ? " bom" : "", static_cast<int>(newlines.size()),
                    newlines.data(), r.mixed_newlines ? " mixed" : "");
        return 0;
    }

    if (command == "convert" && (args.size() == 3 || args.size() == 4)) {
        transcode::StreamOptions options;
        options.target_encoding = args[2];
        if (args.size() == 4) options.source_encoding = args[3];

        StdoutSink sink;
        if (args[1] == "-") {
            StdinSource source;
            transcoder.transcode(source, sink, options);
        } else {
            std::string text = transcoder.convert(args[1], options.target_encoding,
                                                  options.source_encoding);
            sink.write(text);
            sink.commit();
        }
        return 0;
    }

    if (command == "normalize" && args.size() == 4) {
        transcode::NewlineStyle newlines = transcode::parse_newline_style(args[3]);
        transcode::ConversionStats stats = transcoder.normalize(args[1], args[2], newlines);
        if (stats.skipped) {
            std::fprintf(stderr, "transcode: %s already normalized\n", args[1].c_str());
        } else {
            std::fprintf(stderr, "transcode: %s: %s -> %s, %llu bytes written\n",
                         args[1].c_str(), stats.source.encoding.c_str(), args[2].c_str(),
                         static_cast<unsigned long long>(stats.bytes_written));
        }
        return 0;
    }

    usage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // stdout carries converted text.
    spdlog::set_default_logger(spdlog::stderr_color_mt("transcode"));
    if (!args.empty() && args[0] == "-v") {
        spdlog::set_level(spdlog::level::debug);
        args.erase(args.begin());
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    if (args.empty()) {
        usage();
        return 2;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "transcode: %s\n", e.what());
    }
    return 1;
}
