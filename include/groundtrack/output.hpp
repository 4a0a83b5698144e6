/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_OUTPUT_HPP
#define __GROUNDTRACK_OUTPUT_HPP

#include <groundtrack/track.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace groundtrack {

/**
 * Format an instant as "YYYY-MM-DD HH:MM:SS" (UTC, truncated to seconds).
 */
std::string formatTime(TimeInstant t);

/**
 * Serialize a track as a GeoJSON FeatureCollection. Coordinates are
 * [longitude, latitude].
 */
std::string toGeoJSON(const Track &track,
                      const std::vector<Segment<TrackPoint>> &segments,
                      const std::vector<TrackPoint> &markers,
                      const std::string &title);

void writeGeoJSON(std::ostream &out,
                  const Track &track,
                  const std::vector<Segment<TrackPoint>> &segments,
                  const std::vector<TrackPoint> &markers,
                  const std::string &title);

/**
 * Write a standalone HTML page that draws the GeoJSON on a world map.
 */
void writeHTML(std::ostream &out,
               const Track &track,
               const std::vector<Segment<TrackPoint>> &segments,
               const std::vector<TrackPoint> &markers,
               const std::string &title);

/**
 * Write the track to a file. Paths ending in .html or .htm produce an HTML
 * page, anything else produces GeoJSON.
 * @throws std::runtime_error if the file cannot be written
 */
void writeTrack(const std::string &path,
                const Track &track,
                const std::vector<Segment<TrackPoint>> &segments,
                const std::vector<TrackPoint> &markers,
                const std::string &title);

bool isHTMLPath(const std::string &path);

}

#endif
