/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/celestrak.hpp>

#include <string>
#include <vector>

namespace celestrak {
namespace {

using groundtrack::ElementSet;
using groundtrack::InvalidInputException;
using groundtrack::NotFoundException;
using groundtrack::RetrievalException;

// Sample 3-line TLE strings for testing
const std::string ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n";

const std::string NOAA19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

// Nothing listens on port 1, so requests fail without leaving the machine
const std::string UNREACHABLE_URI = "http://127.0.0.1:1/NORAD/elements/gp.php";

// ============================================================================
// Response Parsing Tests
// ============================================================================

TEST(ParseTLEResponseTest, SingleEntry) {
    auto entries = parseTLEResponse(ISS_TLE);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], ISS_TLE);
}

TEST(ParseTLEResponseTest, MultipleEntries) {
    auto entries = parseTLEResponse(ISS_TLE + NOAA19_TLE);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(ElementSet::fromTLE(entries[0]).getCatalogId(), 25544);
    EXPECT_EQ(ElementSet::fromTLE(entries[1]).getName(), "NOAA 19");
}

TEST(ParseTLEResponseTest, CarriageReturnsAndBlankLines) {
    std::string response =
        "\r\n"
        "ISS (ZARYA)          \r\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\r\n"
        "\r\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\r\n";
    auto entries = parseTLEResponse(response);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], ISS_TLE);
}

TEST(ParseTLEResponseTest, TwoLineEntries) {
    auto entries = parseTLEResponse(ISS_TLE.substr(ISS_TLE.find('\n') + 1));
    ASSERT_EQ(entries.size(), 1u);
    auto elements = ElementSet::fromTLE(entries[0]);
    EXPECT_TRUE(elements.getName().empty());
    EXPECT_EQ(elements.getCatalogId(), 25544);
}

TEST(ParseTLEResponseTest, NoDataMessage) {
    EXPECT_TRUE(parseTLEResponse("No GP data found").empty());
    EXPECT_TRUE(parseTLEResponse("").empty());
}

TEST(ParseTLEResponseTest, IncompleteTrailingEntryIsDropped) {
    auto entries = parseTLEResponse(ISS_TLE + "NOAA 19\n");
    EXPECT_EQ(entries.size(), 1u);
}

// ============================================================================
// Element Response Tests
// ============================================================================

TEST(ParseElementsResponseTest, ValidResponse) {
    auto elements = parseElementsResponse(ISS_TLE, 25544);
    EXPECT_EQ(elements.getCatalogId(), 25544);
    EXPECT_EQ(elements.getName(), "ISS (ZARYA)");
    EXPECT_DOUBLE_EQ(elements.getInclination(), 51.6312);
}

TEST(ParseElementsResponseTest, FirstEntryIsUsed) {
    EXPECT_EQ(parseElementsResponse(ISS_TLE + NOAA19_TLE, 25544).getName(), "ISS (ZARYA)");
}

TEST(ParseElementsResponseTest, NoDataMessageIsNotFound) {
    try {
        parseElementsResponse("No GP data found", 99999);
        FAIL() << "Expected NotFoundException";
    } catch (const NotFoundException& e) {
        EXPECT_EQ(e.catalogId(), 99999);
    }
}

TEST(ParseElementsResponseTest, EmptyBodyIsNotFound) {
    EXPECT_THROW(parseElementsResponse("", 25544), NotFoundException);
    EXPECT_THROW(parseElementsResponse("\r\n  \n", 25544), NotFoundException);
}

TEST(ParseElementsResponseTest, UnparseableEntryIsRetrievalError) {
    try {
        parseElementsResponse("BROKEN\n1 x\n2 y\n", 25544);
        FAIL() << "Expected RetrievalException";
    } catch (const NotFoundException&) {
        FAIL() << "A malformed entry is not a missing one";
    } catch (const RetrievalException& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to parse"), std::string::npos);
    }
}

TEST(ParseElementsResponseTest, WrongCatalogIdIsRetrievalError) {
    try {
        parseElementsResponse(NOAA19_TLE, 25544);
        FAIL() << "Expected RetrievalException";
    } catch (const NotFoundException&) {
        FAIL() << "A mismatched entry is not a missing one";
    } catch (const RetrievalException& e) {
        EXPECT_NE(std::string(e.what()).find("33591"), std::string::npos);
    }
}

// ============================================================================
// URL Tests
// ============================================================================

TEST(BuildCatalogURLTest, DefaultEndpoint) {
    EXPECT_EQ(buildCatalogURL(DEFAULT_BASE_URI, 25544),
              "https://celestrak.org/NORAD/elements/gp.php?CATNR=25544&FORMAT=tle");
}

TEST(BuildCatalogURLTest, CustomEndpoint) {
    EXPECT_EQ(buildCatalogURL("http://localhost:8080/gp.php", 5),
              "http://localhost:8080/gp.php?CATNR=5&FORMAT=tle");
}

// ============================================================================
// Retrieval Error Tests
// ============================================================================

TEST(GetElementsTest, RejectsNonPositiveIds) {
    EXPECT_THROW(getElements(0, UNREACHABLE_URI), InvalidInputException);
    EXPECT_THROW(getElements(-25544, UNREACHABLE_URI), InvalidInputException);
}

TEST(GetElementsTest, ConnectionFailureIsRetrievalError) {
    EXPECT_THROW(getElements(25544, UNREACHABLE_URI), RetrievalException);
}

TEST(CelestrakSourceTest, FetchUsesConfiguredEndpoint) {
    CelestrakSource source(UNREACHABLE_URI);
    EXPECT_THROW(source.fetch(25544), RetrievalException);
}

}  // namespace
}  // namespace celestrak
