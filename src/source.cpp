/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/source.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace groundtrack {

TLEFileSource::TLEFileSource(const std::string &filepath)
    : database_(loadTLEDatabase(filepath)) {
    debug("TLE file {} contains {} element sets", filepath, database_.size());
}

ElementSet TLEFileSource::fetch(int catalogId) {
    auto it = database_.find(catalogId);
    if (it == database_.end()) {
        throw NotFoundException(catalogId);
    }
    return it->second;
}

}
