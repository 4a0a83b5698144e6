/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ERRORS_HPP
#define __GROUNDTRACK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace groundtrack {

/**
 * Base exception class for all ground track computation errors.
 */
class GroundTrackException : public std::runtime_error {
public:
    explicit GroundTrackException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a caller supplies invalid parameters, such as an
 * empty forecast window, a non-monotonic list of instants, or a malformed TLE.
 */
class InvalidInputException : public GroundTrackException {
public:
    explicit InvalidInputException(const std::string& msg) : GroundTrackException(msg) {}
};

/**
 * Exception thrown when an element set could not be retrieved.
 */
class RetrievalException : public GroundTrackException {
public:
    explicit RetrievalException(const std::string& msg) : GroundTrackException(msg) {}
};

/**
 * Exception thrown when no element set exists for a catalog id.
 */
class NotFoundException : public RetrievalException {
public:
    explicit NotFoundException(int catalogId)
        : RetrievalException("No element set found for catalog id " + std::to_string(catalogId)),
          catalogId_(catalogId) {}

    int catalogId() const { return catalogId_; }

private:
    int catalogId_;
};

/**
 * Base exception class for propagation errors.
 */
class PropagationException : public GroundTrackException {
public:
    explicit PropagationException(const std::string& msg) : GroundTrackException(msg) {}
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public PropagationException {
public:
    explicit InvalidOrbitException(const std::string& msg) : PropagationException(msg) {}
};

/**
 * Exception thrown when a satellite has decayed (re-entered atmosphere).
 */
class SatelliteDecayedException : public PropagationException {
public:
    SatelliteDecayedException() : PropagationException("Satellite has decayed") {}
};

/**
 * Exception thrown when the requested time is too far from the element set epoch.
 */
class EpochOutOfRangeException : public PropagationException {
public:
    explicit EpochOutOfRangeException(const std::string& msg) : PropagationException(msg) {}
};

}

#endif
