/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_TRACK_HPP
#define __GROUNDTRACK_TRACK_HPP

#include <groundtrack/elements.hpp>
#include <groundtrack/propagator.hpp>
#include <groundtrack/source.hpp>

#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace groundtrack {

constexpr double DEFAULT_FORECAST_HOURS = 1.5;
constexpr double DEFAULT_SAMPLE_INTERVAL_SECONDS = 30.0;
constexpr size_t DEFAULT_MARKER_STRIDE = 20;            // Every 10 minutes at the default interval
constexpr size_t MAX_SAMPLE_COUNT = 1000000;
constexpr unsigned MAX_SAMPLER_THREADS = 64;

// Longitude jumps strictly larger than this are treated as antimeridian crossings
constexpr double ANTIMERIDIAN_JUMP_DEGREES = 180.0;

/**
 * A ground point and the instant it was computed for.
 */
struct TrackPoint {
    TimeInstant time;
    GroundPoint point;

    bool operator==(const TrackPoint&) const = default;
};

/**
 * The ground track of one object over a forecast window.
 */
struct Track {
    ElementSet elements;                ///< Element set the track was propagated from
    std::vector<TrackPoint> points;     ///< Samples in strictly increasing time order

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }

    std::vector<TimeInstant> times() const;
    std::vector<double> latitudes() const;
    std::vector<double> longitudes() const;
};

/**
 * A run of consecutive points that can be drawn as one unbroken line.
 */
template <typename Point>
using Segment = std::vector<Point>;

/**
 * Parameters for building a track. An unset start means "now", read when the
 * track is built.
 */
struct TrackRequest {
    std::optional<TimeInstant> start;
    double forecastHours = DEFAULT_FORECAST_HOURS;
    double sampleIntervalSeconds = DEFAULT_SAMPLE_INTERVAL_SECONDS;
    unsigned threads = 1;
};

// ============================================================================
// Sampling
// ============================================================================

/**
 * Evaluate the propagator once per instant, in order.
 *
 * @param instants Non-empty and strictly increasing
 * @return One ground point per instant, in the same order
 * @throws InvalidInputException if instants is empty or not strictly increasing
 * Exceptions thrown by propagate are passed through unchanged.
 */
std::vector<GroundPoint> sample(const PropagateFunction &propagate,
                                const ElementSet &elements,
                                const std::vector<TimeInstant> &instants);

/**
 * Starts one worker thread running the given job.
 */
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

/**
 * Same contract as sample(), but splits the instants into contiguous chunks
 * evaluated on separate threads. The propagator must be safe to call
 * concurrently. If any sample fails, all workers are joined and the failure
 * from the earliest failing chunk is rethrown.
 *
 * At most MAX_SAMPLER_THREADS workers are started. If a worker thread cannot
 * be started, the workers already running are stopped and joined and the
 * instants are sampled on the calling thread instead.
 */
std::vector<GroundPoint> sampleParallel(const PropagateFunction &propagate,
                                        const ElementSet &elements,
                                        const std::vector<TimeInstant> &instants,
                                        unsigned threads);

/**
 * sampleParallel() with a caller-supplied way of starting worker threads.
 */
std::vector<GroundPoint> sampleParallel(const PropagateFunction &propagate,
                                        const ElementSet &elements,
                                        const std::vector<TimeInstant> &instants,
                                        unsigned threads,
                                        const WorkerLauncher &launch);

// ============================================================================
// Track Construction
// ============================================================================

/**
 * floor(forecastHours * 3600 / sampleIntervalSeconds). A quotient within
 * rounding error of a whole number counts as that whole number, so 2.05 hours
 * at 30 seconds is 246 samples.
 * @throws InvalidInputException if either argument is not positive and finite,
 *         or the window holds no samples or more than MAX_SAMPLE_COUNT
 */
size_t sampleCount(double forecastHours, double sampleIntervalSeconds);

/**
 * start, start + interval, start + 2 * interval, ... for sampleCount() instants.
 */
std::vector<TimeInstant> makeInstants(TimeInstant start, double forecastHours, double sampleIntervalSeconds);

/**
 * Fetch the element set for a catalog id and sample its ground track.
 *
 * The window is validated before the element set is fetched. Failures from
 * the source or the propagator abort the build and are rethrown unchanged.
 */
Track buildTrack(ElementSource &source, const PropagateFunction &propagate,
                 int catalogId, const TrackRequest &request = {});

// ============================================================================
// Segmentation and Markers
// ============================================================================

inline double longitudeOf(const GroundPoint &p) { return p.longitude; }
inline double longitudeOf(const TrackPoint &p) { return p.point.longitude; }

/**
 * Split a point sequence wherever consecutive longitudes differ by more than
 * 180 degrees, so each segment can be drawn on a flat map without a line
 * across the whole map. A jump of exactly 180 degrees does not split.
 *
 * Concatenating the returned segments gives back the input exactly.
 */
template <typename Point>
std::vector<Segment<Point>> splitAtAntimeridian(const std::vector<Point> &points) {
    std::vector<Segment<Point>> segments;
    Segment<Point> current;

    for (const auto &point : points) {
        if (!current.empty() &&
            std::abs(longitudeOf(point) - longitudeOf(current.back())) > ANTIMERIDIAN_JUMP_DEGREES) {
            segments.push_back(std::move(current));
            current = Segment<Point>();
        }
        current.push_back(point);
    }

    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

/**
 * Every stride-th point starting with the first (index % stride == 0).
 * @throws InvalidInputException if stride is zero
 */
std::vector<TrackPoint> selectMarkers(const std::vector<TrackPoint> &points,
                                      size_t stride = DEFAULT_MARKER_STRIDE);

}

#endif
