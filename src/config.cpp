/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/config.hpp>

#include <date/date.h>

#include <sstream>

namespace groundtrack {

time_point parseTime(const std::string &timeStr) {
    for (const char *format : {"%Y%m%dT%H%M%S", "%Y-%m-%d %H:%M:%S"}) {
        std::istringstream in(timeStr);
        std::chrono::sys_seconds tp;
        in >> date::parse(format, tp);
        if (!in.fail() && (in >> std::ws).eof()) {
            return tp;
        }
    }
    throw InvalidInputException(
        "Invalid time format (expected YYYYMMDDTHHMMSS or YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
}

int Config::getCatalogId() {
    return catalogId;
}

void Config::setCatalogId(const int id) {
    catalogId = id;
}

bool Config::hasStartTime() {
    return startTime.has_value();
}

void Config::clearStartTime() {
    startTime.reset();
}

std::optional<time_point> Config::getStartTime() {
    return startTime;
}

void Config::setStartTime(const time_point tp) {
    startTime = tp;
}

double Config::getForecastHours() {
    return forecastHours;
}

void Config::setForecastHours(const double hours) {
    forecastHours = hours;
}

double Config::getInterval() {
    return interval;
}

void Config::setInterval(const double seconds) {
    interval = seconds;
}

size_t Config::getMarkerStride() {
    return markerStride;
}

void Config::setMarkerStride(const size_t stride) {
    markerStride = stride;
}

unsigned Config::getThreads() {
    return threads;
}

void Config::setThreads(const int t) {
    if (t > 0 && t <= static_cast<int>(MAX_THREADS)) {
        threads = static_cast<unsigned>(t);
    } else if (t > static_cast<int>(MAX_THREADS)) {
        threads = MAX_THREADS;
    } else {
        threads = 1;
    }
}

std::string Config::getOutPath() {
    return outPath;
}

void Config::setOutPath(const std::string &path) {
    outPath = path;
}

std::string Config::getTitle() {
    return title;
}

void Config::setTitle(const std::string &t) {
    title = t;
}

bool Config::hasTLEFile() {
    return tleFile.has_value();
}

std::string Config::getTLEFile() {
    return tleFile.value_or("");
}

void Config::setTLEFile(const std::string &path) {
    tleFile = path;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

bool Config::getInfo() {
    return info;
}

void Config::setInfo(bool i) {
    info = i;
}

TrackRequest Config::toTrackRequest() {
    return TrackRequest {
        .start = startTime,
        .forecastHours = forecastHours,
        .sampleIntervalSeconds = interval,
        .threads = threads,
    };
}

}
