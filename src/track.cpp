/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/track.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <format>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace groundtrack {

namespace {

void validateInstants(const std::vector<TimeInstant> &instants) {
    if (instants.empty()) {
        throw InvalidInputException("At least one sample instant is required");
    }
    for (size_t i = 1; i < instants.size(); i++) {
        if (instants[i] <= instants[i - 1]) {
            throw InvalidInputException(std::format(
                "Sample instants must be strictly increasing (index {} is not after index {})", i, i - 1));
        }
    }
}

}

std::vector<TimeInstant> Track::times() const {
    std::vector<TimeInstant> result;
    result.reserve(points.size());
    for (const auto &p : points) {
        result.push_back(p.time);
    }
    return result;
}

std::vector<double> Track::latitudes() const {
    std::vector<double> result;
    result.reserve(points.size());
    for (const auto &p : points) {
        result.push_back(p.point.latitude);
    }
    return result;
}

std::vector<double> Track::longitudes() const {
    std::vector<double> result;
    result.reserve(points.size());
    for (const auto &p : points) {
        result.push_back(p.point.longitude);
    }
    return result;
}

std::vector<GroundPoint> sample(const PropagateFunction &propagate,
                                const ElementSet &elements,
                                const std::vector<TimeInstant> &instants) {
    validateInstants(instants);

    std::vector<GroundPoint> points;
    points.reserve(instants.size());
    for (const auto &instant : instants) {
        points.push_back(propagate(elements, instant));
    }
    return points;
}

std::vector<GroundPoint> sampleParallel(const PropagateFunction &propagate,
                                        const ElementSet &elements,
                                        const std::vector<TimeInstant> &instants,
                                        unsigned threads) {
    return sampleParallel(propagate, elements, instants, threads, [](std::function<void()> job) {
        return std::thread(std::move(job));
    });
}

std::vector<GroundPoint> sampleParallel(const PropagateFunction &propagate,
                                        const ElementSet &elements,
                                        const std::vector<TimeInstant> &instants,
                                        unsigned threads,
                                        const WorkerLauncher &launch) {
    validateInstants(instants);

    size_t workers = std::min<size_t>({threads, MAX_SAMPLER_THREADS, instants.size()});
    if (workers <= 1) {
        return sample(propagate, elements, instants);
    }

    // Every worker gets a non-empty chunk
    size_t chunkSize = (instants.size() + workers - 1) / workers;
    workers = (instants.size() + chunkSize - 1) / chunkSize;

    std::vector<GroundPoint> points(instants.size());
    std::vector<std::exception_ptr> errors(workers);
    std::atomic<bool> failed{false};

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (size_t w = 0; w < workers; w++) {
            size_t begin = w * chunkSize;
            size_t end = std::min(instants.size(), begin + chunkSize);
            pool.push_back(launch([&, w, begin, end] {
                try {
                    for (size_t i = begin; i < end && !failed.load(); i++) {
                        points[i] = propagate(elements, instants[i]);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                    failed = true;
                }
            }));
        }
    } catch (...) {
        failed = true;
        for (auto &worker : pool) {
            worker.join();
        }
        try {
            throw;
        } catch (const std::system_error &e) {
            warn("Started {} of {} sampler threads ({}), sampling on the calling thread",
                 pool.size(), workers, e.what());
        }
        return sample(propagate, elements, instants);
    }

    for (auto &worker : pool) {
        worker.join();
    }

    for (const auto &error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return points;
}

size_t sampleCount(double forecastHours, double sampleIntervalSeconds) {
    if (!std::isfinite(forecastHours) || forecastHours <= 0.0) {
        throw InvalidInputException(std::format("Forecast hours must be positive: {}", forecastHours));
    }
    if (!std::isfinite(sampleIntervalSeconds) || sampleIntervalSeconds <= 0.0) {
        throw InvalidInputException(std::format("Sample interval must be positive: {}", sampleIntervalSeconds));
    }

    double quotient = forecastHours * 3600.0 / sampleIntervalSeconds;
    double nearest = std::round(quotient);
    double count = std::abs(quotient - nearest) <= 1e-9 * std::max(1.0, nearest) ? nearest : std::floor(quotient);
    if (count < 1.0) {
        throw InvalidInputException(std::format(
            "A {} hour forecast holds no {} second samples", forecastHours, sampleIntervalSeconds));
    }
    if (count > static_cast<double>(MAX_SAMPLE_COUNT)) {
        throw InvalidInputException(std::format(
            "A {} hour forecast at {} second intervals needs more than {} samples",
            forecastHours, sampleIntervalSeconds, MAX_SAMPLE_COUNT));
    }
    return static_cast<size_t>(count);
}

std::vector<TimeInstant> makeInstants(TimeInstant start, double forecastHours, double sampleIntervalSeconds) {
    using namespace std::chrono;

    size_t count = sampleCount(forecastHours, sampleIntervalSeconds);

    std::vector<TimeInstant> instants;
    instants.reserve(count);
    for (size_t i = 0; i < count; i++) {
        auto offset = duration<double>(static_cast<double>(i) * sampleIntervalSeconds);
        instants.push_back(start + round<system_clock::duration>(offset));
    }
    return instants;
}

Track buildTrack(ElementSource &source, const PropagateFunction &propagate,
                 int catalogId, const TrackRequest &request) {
    TimeInstant start = request.start.value_or(std::chrono::system_clock::now());
    auto instants = makeInstants(start, request.forecastHours, request.sampleIntervalSeconds);
    debug("Sampling {} instants for catalog id {}", instants.size(), catalogId);

    Track track;
    track.elements = source.fetch(catalogId);

    auto points = request.threads > 1
        ? sampleParallel(propagate, track.elements, instants, request.threads)
        : sample(propagate, track.elements, instants);

    track.points.reserve(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        track.points.push_back({instants[i], points[i]});
    }
    return track;
}

std::vector<TrackPoint> selectMarkers(const std::vector<TrackPoint> &points, size_t stride) {
    if (stride == 0) {
        throw InvalidInputException("Marker stride must be at least 1");
    }

    std::vector<TrackPoint> markers;
    markers.reserve(points.size() / stride + 1);
    for (size_t i = 0; i < points.size(); i += stride) {
        markers.push_back(points[i]);
    }
    return markers;
}

}
