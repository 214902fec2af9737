/**
 * @file stream_info.cpp
 * @brief Print the properties of a video or image sequence and read it through
 *
 * Usage:
 *   reel_info <file> [--cache N] [--config file.json] [--dump N out.ppm] [--verbose]
 *   reel_info --list [directory]
 *   reel_info --formats
 */

#include <reel/core/config.hpp>
#include <reel/core/logger.hpp>
#include <reel/media/image_directory.hpp>
#include <reel/media/media_formats.hpp>
#include <reel/media/media_stream.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace reel;
using namespace reel::media;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " <file> [--cache N] [--config file.json] [--dump N out.ppm] [--verbose]\n"
              << "       " << program << " --list [directory]\n"
              << "       " << program << " --formats\n";
}

/// Write an 8 bit RGB or grey frame as binary PPM
bool writePpm(const Frame& frame, const std::string& path) {
    if (frame.sampleType() != SampleType::UInt8 || (frame.channels() != 1 && frame.channels() != 3)) {
        std::cerr << "Only 8 bit grey or RGB frames can be written as PPM ("
                  << videoFormatName(frame) << ")\n";
        return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Cannot write " << path << "\n";
        return false;
    }

    out << "P6\n" << frame.width() << " " << frame.height() << "\n255\n";
    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            for (int c = 0; c < 3; ++c) {
                out.put(static_cast<char>(frame.sample<uint8_t>(x, y, frame.channels() == 3 ? c : 0)));
            }
        }
    }
    return static_cast<bool>(out);
}

int listDirectory(const std::string& directory) {
    auto images = listImages(directory);
    if (!images) {
        std::cerr << images.error().what() << "\n";
        return 1;
    }
    for (const auto& name : images.value()) {
        std::cout << name << "\n";
    }
    return 0;
}

int listFormats() {
    for (const auto& format : supportedFileFormats()) {
        std::cout << "  ." << format.extension << "  " << format.description << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    initLogging("reel_info", spdlog::level::warn);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string first = argv[1];
    if (first == "--formats") {
        return listFormats();
    }
    if (first == "--list") {
        return listDirectory(argc > 2 ? argv[2] : ".");
    }
    if (first == "--help" || first == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    Config& config = Config::getInstance();
    config.loadDefaults();

    std::string file = first;
    int64_t dumpFrame = 0;
    std::string dumpPath;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--cache" && i + 1 < argc) {
            config.set("stream.cacheCapacity", std::atoi(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            try {
                config.loadFromFile(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                return 1;
            }
        } else if (arg == "--dump" && i + 2 < argc) {
            dumpFrame = std::atoll(argv[++i]);
            dumpPath = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            config.set("logging.level", std::string("debug"));
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    setLogLevel(spdlog::level::from_str(
        config.get<std::string>("logging.level", DefaultConfig::kLogLevel)));

    auto options = StreamOptions::fromConfig(config);
    if (!options) {
        std::cerr << options.error().what() << "\n";
        return 1;
    }

    auto opened = MediaStream::open(file, options.value());
    if (!opened) {
        std::cerr << "Cannot open " << file << ": " << opened.error().what() << "\n";
        return 1;
    }
    MediaStream stream = std::move(opened).value();

    auto info = stream.info();
    if (!info) {
        std::cerr << info.error().what() << "\n";
        return 1;
    }
    const SourceInfo& props = info.value();
    std::cout << "Name:        " << props.name << "\n"
              << "Type:        " << props.type << "\n"
              << "Format:      " << props.videoFormat << "\n"
              << "Size:        " << props.width << "x" << props.height << "\n"
              << "Bits/pixel:  " << props.bitsPerPixel << "\n"
              << "Frame rate:  " << props.frameRate.num << "/" << props.frameRate.den << "\n"
              << "Duration:    " << static_cast<double>(props.duration) / kTimeBaseUs << " s\n"
              << "Frames:      " << stream.numFrames() << "\n";

    auto start = std::chrono::steady_clock::now();
    int64_t frames = 0;
    while (stream.hasFrameRemaining()) {
        auto frame = stream.readNextFrame();
        if (!frame) {
            std::cerr << "Frame " << stream.currentFrame() + 1 << ": " << frame.error().what() << "\n";
            return 1;
        }
        ++frames;
    }
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (dumpFrame != 0) {
        auto frame = stream.read(dumpFrame);
        if (!frame) {
            std::cerr << "Frame " << dumpFrame << ": " << frame.error().what() << "\n";
            return 1;
        }
        if (!writePpm(frame.value(), dumpPath)) {
            return 1;
        }
        std::cout << "Wrote frame " << dumpFrame << " to " << dumpPath << "\n";
    }

    StreamStats stats = stream.stats();
    std::cout << "Read " << frames << " frames in " << seconds << " s"
              << " (" << (seconds > 0 ? frames / seconds : 0.0) << " fps)\n"
              << "Cache hits/misses: " << stats.cacheHits << "/" << stats.cacheMisses
              << ", repositions: " << stats.repositions
              << ", decodes: " << stats.framesDecoded << "\n";

    stream.close();
    return 0;
}
