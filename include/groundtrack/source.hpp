/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_SOURCE_HPP
#define __GROUNDTRACK_SOURCE_HPP

#include <groundtrack/elements.hpp>

#include <map>
#include <string>
#include <utility>

namespace groundtrack {

/**
 * Something that can look up the current element set for a catalog id.
 */
class ElementSource {
public:
    virtual ~ElementSource() = default;

    /**
     * @throws NotFoundException if the catalog id is unknown
     * @throws RetrievalException if the lookup itself fails
     */
    virtual ElementSet fetch(int catalogId) = 0;
};

/**
 * Element sets read once from a local file in three line TLE format.
 */
class TLEFileSource : public ElementSource {
public:
    explicit TLEFileSource(const std::string &filepath);
    explicit TLEFileSource(std::map<int, ElementSet> database) : database_(std::move(database)) {}

    ElementSet fetch(int catalogId) override;

    size_t size() const { return database_.size(); }

private:
    std::map<int, ElementSet> database_;
};

}

#endif
