/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ELEMENTS_HPP
#define __GROUNDTRACK_ELEMENTS_HPP

#include <groundtrack/errors.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace groundtrack {

using time_point = std::chrono::system_clock::time_point;

/**
 * A two-line orbital element set for one catalogued object.
 *
 * Instances are created by parsing TLE text and are not modified afterwards.
 *
 * Usage:
 *   auto elements = ElementSet::fromTLE(tleString);
 *   std::cout << elements.getCatalogId() << std::endl;
 */
class ElementSet {
public:
    ElementSet() = default;

    /**
     * Parse a two or three line TLE. A line that precedes line 1 is used as the name.
     * @throws InvalidInputException if either element line is missing or malformed
     */
    static ElementSet fromTLE(std::string_view tle);

    /**
     * Parse a TLE, using the given name instead of any embedded name line.
     */
    static ElementSet fromTLE(std::string_view name, std::string_view tle);

    // Line 0 and line 1
    const std::string& getName() const { return name; }
    int getCatalogId() const { return catalogId; }
    char getClassification() const { return classification; }
    const std::string& getDesignator() const { return designator; }
    time_point getEpoch() const { return epoch; }
    double getFirstDerivativeMeanMotion() const { return firstDerivativeMeanMotion; }
    double getSecondDerivativeMeanMotion() const { return secondDerivativeMeanMotion; }
    double getBstarDragTerm() const { return bstarDragTerm; }
    int getElementSetNumber() const { return elementSetNumber; }

    // Line 2 (angles in degrees)
    double getInclination() const { return inclination; }
    double getRightAscensionOfAscendingNode() const { return rightAscensionOfAscendingNode; }
    double getEccentricity() const { return eccentricity; }
    double getArgumentOfPerigee() const { return argumentOfPerigee; }
    double getMeanAnomaly() const { return meanAnomaly; }
    double getMeanMotion() const { return meanMotion; }  ///< Revolutions per day
    int getRevolutionNumberAtEpoch() const { return revolutionNumberAtEpoch; }

    /**
     * Orbital period in minutes, derived from the mean motion.
     */
    double getPeriodInMinutes() const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

    /**
     * Format the element set as a three line TLE with fresh checksums.
     */
    std::string toTLE() const;

private:
    std::string name;

    int catalogId = 0;
    char classification = 'U';
    std::string designator;
    time_point epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;

    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;
    int revolutionNumberAtEpoch = 0;

    void parseLine1(std::string_view line);
    void parseLine2(std::string_view line);
};

// ============================================================================
// TLE Database Functions
// ============================================================================

/**
 * Read a file of TLE entries into a map keyed by catalog id.
 * A missing file yields an empty map.
 * @throws RetrievalException if the file exists but cannot be read
 */
std::map<int, ElementSet> loadTLEDatabase(const std::string &filepath);
std::map<int, ElementSet> loadTLEDatabase(std::istream &s);

// TLE formatting utilities
int calculateChecksum(std::string_view line);
std::string toTLEExponential(double value);
std::string formatFirstDerivative(double value);

}

#endif
