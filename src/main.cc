#include "gPen.h"
#include "Config.h"
#include "LandmarkReplay.h"
#include "Log.h"
#include <cstdio>
#include <memory>
#include <string>

static void printUsage(const char* exe) {
    printf("Usage: %s [--config <file.yaml>] [--replay <landmarks.yaml>] [--verbose]\n", exe);
    printf("  p / e      pen / eraser\n");
    printf("  [ / ]      brush size\n");
    printf("  1-9        colour\n");
    printf("  c          clear canvas\n");
    printf("  g          start / stop gesture input\n");
    printf("  escape     finish the current stroke\n");
}

int main(int argc, char** argv) {
    std::string configPath, replayPath;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--replay" && i + 1 < argc) {
            replayPath = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            printUsage(argv[0]);
            return 2;
        }
    }

    Config config;
    if (!configPath.empty() && !config.loadFromFile(configPath)) return 1;
    if (verbose) config.verbose = true;
    if (!replayPath.empty()) config.replayFile = replayPath;
    Log::setVerbose(config.verbose);

    std::unique_ptr<LandmarkReplay> replay;
    if (!config.replayFile.empty()) {
        replay = std::make_unique<LandmarkReplay>();
        replay->setLoop(config.replayLoop);
        if (!replay->loadFromFile(config.replayFile)) return 1;
    }

    gPen app(config);
    if (!app.init()) return 1;
    if (replay) app.setLandmarkProvider(std::move(replay));
    app.run();
    return 0;
}
