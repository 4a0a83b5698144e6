/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/output.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace groundtrack {
namespace {

using namespace std::chrono_literals;

constexpr const char* ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

const TimeInstant START = std::chrono::sys_days{std::chrono::year{2025} / 11 / 29} + 20h;

class OutputTest : public ::testing::Test {
protected:
    Track track;
    std::vector<Segment<TrackPoint>> segments;
    std::vector<TrackPoint> markers;

    void SetUp() override {
        track.elements = ElementSet::fromTLE(ISS_TLE);
        double longitudes[] = {170.0, 175.0, 179.5, -176.0, -171.0};
        for (size_t i = 0; i < 5; i++) {
            track.points.push_back({START + static_cast<int>(i) * 30s, {10.0 + static_cast<double>(i), longitudes[i]}});
        }
        segments = splitAtAntimeridian(track.points);
        markers = selectMarkers(track.points, 2);
    }

    rapidjson::Document parse(const std::string &json) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        EXPECT_FALSE(doc.HasParseError());
        return doc;
    }

    const rapidjson::Value *findFeature(const rapidjson::Document &doc, const char *role) {
        for (const auto &feature : doc["features"].GetArray()) {
            if (std::string(feature["properties"]["role"].GetString()) == role) {
                return &feature;
            }
        }
        return nullptr;
    }
};

TEST(FormatTimeTest, TruncatesToSeconds) {
    EXPECT_EQ(formatTime(START + 1500ms), "2025-11-29 20:00:01");
}

TEST_F(OutputTest, FeatureCollection) {
    auto doc = parse(toGeoJSON(track, segments, markers, "ISS pass"));
    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["type"].GetString(), "FeatureCollection");
    EXPECT_STREQ(doc["properties"]["title"].GetString(), "ISS pass");
    EXPECT_STREQ(doc["properties"]["name"].GetString(), "ISS (ZARYA)");
    EXPECT_EQ(doc["properties"]["catalogId"].GetInt(), 25544);

    // track + samples + 3 markers + start
    EXPECT_EQ(doc["features"].Size(), 6u);
}

TEST_F(OutputTest, TrackIsSplitIntoLines) {
    auto doc = parse(toGeoJSON(track, segments, markers, ""));
    auto feature = findFeature(doc, "track");
    ASSERT_NE(feature, nullptr);
    const auto &geometry = (*feature)["geometry"];
    EXPECT_STREQ(geometry["type"].GetString(), "MultiLineString");

    const auto &lines = geometry["coordinates"];
    ASSERT_EQ(lines.Size(), 2u);
    EXPECT_EQ(lines[0].Size(), 3u);
    EXPECT_EQ(lines[1].Size(), 2u);

    // Coordinates are [longitude, latitude]
    EXPECT_DOUBLE_EQ(lines[1][0][0].GetDouble(), -176.0);
    EXPECT_DOUBLE_EQ(lines[1][0][1].GetDouble(), 13.0);
}

TEST_F(OutputTest, AllSamples) {
    auto doc = parse(toGeoJSON(track, segments, markers, ""));
    auto feature = findFeature(doc, "samples");
    ASSERT_NE(feature, nullptr);
    EXPECT_STREQ((*feature)["geometry"]["type"].GetString(), "MultiPoint");
    EXPECT_EQ((*feature)["geometry"]["coordinates"].Size(), 5u);
}

TEST_F(OutputTest, MarkersAndStart) {
    auto doc = parse(toGeoJSON(track, segments, markers, ""));

    int markerCount = 0;
    for (const auto &feature : doc["features"].GetArray()) {
        if (std::string(feature["properties"]["role"].GetString()) == "marker") {
            markerCount++;
        }
    }
    EXPECT_EQ(markerCount, 3);

    auto start = findFeature(doc, "start");
    ASSERT_NE(start, nullptr);
    EXPECT_STREQ((*start)["geometry"]["type"].GetString(), "Point");
    EXPECT_STREQ((*start)["properties"]["time"].GetString(), "2025-11-29 20:00:00");
    EXPECT_DOUBLE_EQ((*start)["properties"]["longitude"].GetDouble(), 170.0);
    EXPECT_DOUBLE_EQ((*start)["properties"]["latitude"].GetDouble(), 10.0);
}

TEST_F(OutputTest, TooltipsShowCoordinates) {
    auto doc = parse(toGeoJSON(track, segments, markers, ""));

    auto start = findFeature(doc, "start");
    ASSERT_NE(start, nullptr);
    EXPECT_STREQ((*start)["properties"]["tooltip"].GetString(), "Start: 2025-11-29 20:00:00 (10.00, 170.00)");

    std::vector<std::string> tooltips;
    for (const auto &feature : doc["features"].GetArray()) {
        if (std::string(feature["properties"]["role"].GetString()) == "marker") {
            tooltips.push_back(feature["properties"]["tooltip"].GetString());
        }
    }
    ASSERT_EQ(tooltips.size(), 3u);
    EXPECT_EQ(tooltips[1], "2025-11-29 20:01:00 (12.00, 179.50)");
    EXPECT_EQ(tooltips[2], "2025-11-29 20:02:00 (14.00, -171.00)");
}

TEST_F(OutputTest, HTMLTooltipsUseCoordinates) {
    std::ostringstream out;
    writeHTML(out, track, segments, markers, "");
    auto html = out.str();
    EXPECT_NE(html.find("setTooltipContent(f.properties.tooltip)"), std::string::npos);
    EXPECT_NE(html.find(".bindTooltip(f.properties.tooltip)"), std::string::npos);
    EXPECT_NE(html.find("(14.00, -171.00)"), std::string::npos);
}

TEST_F(OutputTest, EmptyTrack) {
    Track empty;
    auto doc = parse(toGeoJSON(empty, {}, {}, ""));
    EXPECT_EQ(doc["features"].Size(), 2u);
    EXPECT_EQ(findFeature(doc, "start"), nullptr);
}

TEST_F(OutputTest, HTMLEmbedsGeoJSON) {
    std::ostringstream out;
    writeHTML(out, track, segments, markers, "<ISS & friends>");
    auto html = out.str();
    EXPECT_NE(html.find("<title>&lt;ISS &amp; friends&gt;</title>"), std::string::npos);
    EXPECT_NE(html.find("\"FeatureCollection\""), std::string::npos);
    EXPECT_NE(html.find("MultiLineString"), std::string::npos);
}

TEST_F(OutputTest, HTMLDefaultTitle) {
    std::ostringstream out;
    writeHTML(out, track, segments, markers, "");
    EXPECT_NE(out.str().find("<h1>ISS (ZARYA) (25544)</h1>"), std::string::npos);
}

TEST(IsHTMLPathTest, Extensions) {
    EXPECT_TRUE(isHTMLPath("satellite_track.html"));
    EXPECT_TRUE(isHTMLPath("/tmp/TRACK.HTM"));
    EXPECT_FALSE(isHTMLPath("track.geojson"));
    EXPECT_FALSE(isHTMLPath("track.json"));
    EXPECT_FALSE(isHTMLPath("html"));
}

TEST_F(OutputTest, WriteTrackPicksFormat) {
    auto dir = std::filesystem::temp_directory_path();
    auto jsonPath = dir / "groundtrack_output_test.geojson";
    auto htmlPath = dir / "groundtrack_output_test.html";

    writeTrack(jsonPath.string(), track, segments, markers, "");
    writeTrack(htmlPath.string(), track, segments, markers, "");

    std::ifstream jsonFile(jsonPath);
    std::string json((std::istreambuf_iterator<char>(jsonFile)), std::istreambuf_iterator<char>());
    auto doc = parse(json);
    EXPECT_STREQ(doc["type"].GetString(), "FeatureCollection");

    std::ifstream htmlFile(htmlPath);
    std::string html((std::istreambuf_iterator<char>(htmlFile)), std::istreambuf_iterator<char>());
    EXPECT_TRUE(html.starts_with("<!DOCTYPE html>"));

    std::filesystem::remove(jsonPath);
    std::filesystem::remove(htmlPath);
}

TEST_F(OutputTest, WriteTrackUnwritablePath) {
    EXPECT_THROW(writeTrack("/nonexistent/groundtrack/track.html", track, segments, markers, ""),
                 std::runtime_error);
}

} // namespace
} // namespace groundtrack
