/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_CONFIG_HPP
#define __GROUNDTRACK_CONFIG_HPP

#include <groundtrack/track.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace groundtrack {

constexpr const char *DEFAULT_OUT_PATH = "satellite_track.html";
constexpr unsigned MAX_THREADS = 64;

/**
 * Parse a UTC time given as "YYYYMMDDTHHMMSS" or "YYYY-MM-DD HH:MM:SS".
 * @throws InvalidInputException if neither format matches
 */
time_point parseTime(const std::string &timeStr);

class Config {
public:
    Config() = default;
    ~Config() = default;

    int getCatalogId();
    void setCatalogId(const int id);

    bool hasStartTime();
    void clearStartTime();
    std::optional<time_point> getStartTime();
    void setStartTime(const time_point tp);

    double getForecastHours();
    void setForecastHours(const double hours);

    double getInterval();
    void setInterval(const double seconds);

    size_t getMarkerStride();
    void setMarkerStride(const size_t stride);

    unsigned getThreads();
    void setThreads(const int threads);

    std::string getOutPath();
    void setOutPath(const std::string &path);

    std::string getTitle();
    void setTitle(const std::string &title);

    bool hasTLEFile();
    std::string getTLEFile();
    void setTLEFile(const std::string &path);

    bool getVerbose();
    void setVerbose(bool);

    bool getInfo();
    void setInfo(bool);

    /** The builder request for the current settings */
    TrackRequest toTrackRequest();

private:
    int catalogId = 0;
    std::optional<time_point> startTime;
    double forecastHours = DEFAULT_FORECAST_HOURS;
    double interval = DEFAULT_SAMPLE_INTERVAL_SECONDS;
    size_t markerStride = DEFAULT_MARKER_STRIDE;
    unsigned threads = 1;
    std::string outPath = DEFAULT_OUT_PATH;
    std::string title;
    std::optional<std::string> tleFile;
    bool verbose = false;
    bool info = false;
};

}

#endif
