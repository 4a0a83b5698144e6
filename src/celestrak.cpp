/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/celestrak.hpp>
#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

using spdlog::debug;
using spdlog::info;

namespace celestrak {

using groundtrack::ElementSet;
using groundtrack::InvalidInputException;
using groundtrack::NotFoundException;
using groundtrack::RetrievalException;

namespace {

std::string doGet(const std::string& url) {
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("GET {}", url);

    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));

    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    try {
        request.perform();
    } catch (curlpp::RuntimeError& e) {
        throw RetrievalException(std::string("HTTP request failed: ") + e.what());
    } catch (curlpp::LogicError& e) {
        throw RetrievalException(std::string("HTTP logic error: ") + e.what());
    }

    long status = curlpp::infos::ResponseCode::get(request);
    std::string response = responseStream.str();
    debug("HTTP {} ({} bytes)", status, response.length());

    if (status >= 400) {
        throw RetrievalException("Celestrak returned HTTP status " + std::to_string(status));
    }
    return response;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}

// TLE format: optional name line, line 1, line 2, repeated
std::vector<std::string> parseTLEResponse(const std::string& response) {
    std::vector<std::string> entries;
    std::istringstream stream(response);
    std::string line;
    std::ostringstream entryStream;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }
        entryStream << trimmed << '\n';
        if (trimmed.starts_with("2 ")) {
            entries.push_back(entryStream.str());
            entryStream.str("");
            entryStream.clear();
        }
    }
    return entries;
}

std::string buildCatalogURL(const std::string& baseURI, int catalogId) {
    std::ostringstream urlBuilder;
    urlBuilder << baseURI << "?CATNR=" << catalogId << "&FORMAT=tle";
    return urlBuilder.str();
}

ElementSet parseElementsResponse(const std::string& response, int catalogId) {
    if (response.find("No GP data found") != std::string::npos) {
        throw NotFoundException(catalogId);
    }

    std::vector<std::string> entries = parseTLEResponse(response);
    if (entries.empty()) {
        throw NotFoundException(catalogId);
    }

    ElementSet elements;
    try {
        elements = ElementSet::fromTLE(entries.front());
    } catch (const InvalidInputException& e) {
        throw RetrievalException(std::string("Failed to parse TLE data from Celestrak: ") + e.what());
    }

    if (elements.getCatalogId() != catalogId) {
        throw RetrievalException("Celestrak returned catalog id " + std::to_string(elements.getCatalogId())
            + " when asked for " + std::to_string(catalogId));
    }
    return elements;
}

ElementSet getElements(int catalogId, const std::string& baseURI) {
    if (catalogId <= 0) {
        throw InvalidInputException("Catalog id must be positive: " + std::to_string(catalogId));
    }

    ElementSet elements = parseElementsResponse(doGet(buildCatalogURL(baseURI, catalogId)), catalogId);
    info("Fetched element set for {} ({})", elements.getName(), catalogId);
    return elements;
}

ElementSet CelestrakSource::fetch(int catalogId) {
    return getElements(catalogId, baseURI_);
}

} // namespace celestrak
