/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_CELESTRAK_HPP
#define __GROUNDTRACK_CELESTRAK_HPP

#include <groundtrack/source.hpp>

#include <string>
#include <vector>

namespace celestrak {

// Celestrak GP data endpoint
// Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
constexpr const char *DEFAULT_BASE_URI = "https://celestrak.org/NORAD/elements/gp.php";

/**
 * Split a TLE format response into entries, one string per satellite.
 * Blank lines are ignored and an entry without a name line is accepted.
 */
std::vector<std::string> parseTLEResponse(const std::string& response);

/**
 * Build the query URL for a single catalog number.
 */
std::string buildCatalogURL(const std::string& baseURI, int catalogId);

/**
 * Turn the body of a single catalog number query into an element set.
 * @throws groundtrack::NotFoundException if the body is empty or says there is no data
 * @throws groundtrack::RetrievalException if the first entry does not parse or
 *         belongs to a different catalog number
 */
groundtrack::ElementSet parseElementsResponse(const std::string& response, int catalogId);

/**
 * Download the current element set for a catalog number from Celestrak.
 * @throws groundtrack::NotFoundException if Celestrak has no data for the id
 * @throws groundtrack::RetrievalException if the download fails
 */
groundtrack::ElementSet getElements(int catalogId, const std::string& baseURI = DEFAULT_BASE_URI);

/**
 * ElementSource backed by the Celestrak GP API.
 */
class CelestrakSource : public groundtrack::ElementSource {
public:
    explicit CelestrakSource(std::string baseURI = DEFAULT_BASE_URI) : baseURI_(std::move(baseURI)) {}

    groundtrack::ElementSet fetch(int catalogId) override;

private:
    std::string baseURI_;
};

} // namespace celestrak

#endif
