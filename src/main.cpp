/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using spdlog::debug;
using spdlog::error;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::unique_ptr<groundtrack::ElementSource> makeSource(groundtrack::Config &config) {
    if (config.hasTLEFile()) {
        return std::make_unique<groundtrack::TLEFileSource>(expandTilde(config.getTLEFile()));
    }
    return std::make_unique<celestrak::CelestrakSource>();
}

/** Build the track for the configured satellite and write it out */
int run(groundtrack::Config &config) {
    try {
        auto source = makeSource(config);
        groundtrack::SGP4Propagator propagator;

        auto track = groundtrack::buildTrack(*source, propagator, config.getCatalogId(), config.toTrackRequest());

        if (config.getInfo()) {
            track.elements.printInfo(std::cout);
            std::cout << std::endl;
        }

        auto segments = groundtrack::splitAtAntimeridian(track.points);
        debug("Track has {} samples in {} segments", track.size(), segments.size());

        auto markers = groundtrack::selectMarkers(track.points, config.getMarkerStride());

        groundtrack::writeTrack(expandTilde(config.getOutPath()), track, segments, markers, config.getTitle());
    } catch (const std::exception &err) {
        error("{}", err.what());
        return 1;
    }
    return 0;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    groundtrack::Config config;

    auto configFile = expandTilde("~/.groundtrack.toml");

    CLI::App app{"GroundTrack: plot the ground track of a satellite"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<int>("id",
        [&config](const int id) { config.setCatalogId(id); },
        "Norad catalog ID of the satellite (ie. 25544)")->required();
    app.add_option_function<std::string>("-d,--date",
        [&config](const std::string &timeStr) { config.setStartTime(groundtrack::parseTime(timeStr)); },
        "UTC start time (format: YYYYMMDDTHHMMSS or YYYY-MM-DD HH:MM:SS, default: now)");
    app.add_option_function<std::string>("-o,--out-path",
        [&config](const std::string &path) { config.setOutPath(path); },
        std::string("Output file, .html for a map page, otherwise GeoJSON (default: ") + groundtrack::DEFAULT_OUT_PATH + ")");
    app.add_option_function<std::string>("-t,--title",
        [&config](const std::string &title) { config.setTitle(title); },
        "Plot title");
    app.add_option_function<double>("-f,--forecast-hours",
        [&config](const double hours) { config.setForecastHours(hours); },
        "Hours of track to compute (default: 1.5)");
    app.add_option_function<double>("-i,--interval",
        [&config](const double seconds) { config.setInterval(seconds); },
        "Seconds between samples (default: 30)");
    app.add_option_function<size_t>("-s,--marker-stride",
        [&config](const size_t stride) { config.setMarkerStride(stride); },
        "Label every Nth sample (default: 20)");
    app.add_option_function<int>("-j,--threads",
        [&config](const int threads) { config.setThreads(threads); },
        "Number of threads used for propagation (default: 1)");
    app.add_option_function<std::string>("--tle-file",
        [&config](const std::string &path) { config.setTLEFile(path); },
        "Read element sets from this TLE file instead of Celestrak");
    app.add_flag_function("--info",
        [&config](const int64_t v) { config.setInfo(v > 0); },
        "Display the satellite's element set before computing the track");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    } catch (const groundtrack::InvalidInputException &e) {
        error("{}", e.what());
        return 1;
    }

    spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);

    return run(config);
}
