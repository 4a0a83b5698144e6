/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/output.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

#include <date/date.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;

namespace groundtrack {

namespace {

using JSONWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeCoordinate(JSONWriter &writer, const GroundPoint &p) {
    writer.StartArray();
    writer.Double(p.longitude);
    writer.Double(p.latitude);
    writer.EndArray();
}

void writePointFeature(JSONWriter &writer, const TrackPoint &p, const char *role, const std::string &label) {
    writer.StartObject();
    writer.Key("type");
    writer.String("Feature");

    writer.Key("geometry");
    writer.StartObject();
    writer.Key("type");
    writer.String("Point");
    writer.Key("coordinates");
    writeCoordinate(writer, p.point);
    writer.EndObject();

    writer.Key("properties");
    writer.StartObject();
    writer.Key("role");
    writer.String(role);
    writer.Key("label");
    writer.String(label.c_str());
    writer.Key("time");
    writer.String(formatTime(p.time).c_str());
    writer.Key("latitude");
    writer.Double(p.point.latitude);
    writer.Key("longitude");
    writer.Double(p.point.longitude);
    writer.Key("tooltip");
    writer.String(std::format("{} ({:.2f}, {:.2f})", label, p.point.latitude, p.point.longitude).c_str());
    writer.EndObject();

    writer.EndObject();
}

// Escape "</" so the GeoJSON can sit inside a script element
std::string escapeForScript(const std::string &json) {
    std::string result;
    result.reserve(json.size());
    for (size_t i = 0; i < json.size(); i++) {
        if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
            result += "<\\/";
            i++;
        } else {
            result += json[i];
        }
    }
    return result;
}

std::string escapeHTML(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

}

std::string formatTime(TimeInstant t) {
    return date::format("%F %T", std::chrono::floor<std::chrono::seconds>(t));
}

std::string toGeoJSON(const Track &track,
                      const std::vector<Segment<TrackPoint>> &segments,
                      const std::vector<TrackPoint> &markers,
                      const std::string &title) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);

    writer.StartObject();
    writer.Key("type");
    writer.String("FeatureCollection");

    writer.Key("properties");
    writer.StartObject();
    writer.Key("title");
    writer.String(title.c_str());
    writer.Key("name");
    writer.String(track.elements.getName().c_str());
    writer.Key("catalogId");
    writer.Int(track.elements.getCatalogId());
    writer.Key("samples");
    writer.Uint64(track.points.size());
    writer.EndObject();

    writer.Key("features");
    writer.StartArray();

    // Track line, one line string per segment
    writer.StartObject();
    writer.Key("type");
    writer.String("Feature");
    writer.Key("geometry");
    writer.StartObject();
    writer.Key("type");
    writer.String("MultiLineString");
    writer.Key("coordinates");
    writer.StartArray();
    for (const auto &segment : segments) {
        writer.StartArray();
        for (const auto &p : segment) {
            writeCoordinate(writer, p.point);
        }
        writer.EndArray();
    }
    writer.EndArray();
    writer.EndObject();
    writer.Key("properties");
    writer.StartObject();
    writer.Key("role");
    writer.String("track");
    writer.Key("segments");
    writer.Uint64(segments.size());
    writer.EndObject();
    writer.EndObject();

    // Every sample
    writer.StartObject();
    writer.Key("type");
    writer.String("Feature");
    writer.Key("geometry");
    writer.StartObject();
    writer.Key("type");
    writer.String("MultiPoint");
    writer.Key("coordinates");
    writer.StartArray();
    for (const auto &p : track.points) {
        writeCoordinate(writer, p.point);
    }
    writer.EndArray();
    writer.EndObject();
    writer.Key("properties");
    writer.StartObject();
    writer.Key("role");
    writer.String("samples");
    writer.EndObject();
    writer.EndObject();

    for (const auto &marker : markers) {
        writePointFeature(writer, marker, "marker", formatTime(marker.time));
    }

    if (!track.points.empty()) {
        writePointFeature(writer, track.points.front(), "start", "Start: " + formatTime(track.points.front().time));
    }

    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

void writeGeoJSON(std::ostream &out,
                  const Track &track,
                  const std::vector<Segment<TrackPoint>> &segments,
                  const std::vector<TrackPoint> &markers,
                  const std::string &title) {
    out << toGeoJSON(track, segments, markers, title) << '\n';
}

void writeHTML(std::ostream &out,
               const Track &track,
               const std::vector<Segment<TrackPoint>> &segments,
               const std::vector<TrackPoint> &markers,
               const std::string &title) {
    std::string heading = title.empty()
        ? track.elements.getName() + " (" + std::to_string(track.elements.getCatalogId()) + ")"
        : title;

    out << "<!DOCTYPE html>\n"
        << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
        << "<title>" << escapeHTML(heading) << "</title>\n"
        << "<link rel=\"stylesheet\" href=\"https://unpkg.com/leaflet@1.9.4/dist/leaflet.css\">\n"
        << "<script src=\"https://unpkg.com/leaflet@1.9.4/dist/leaflet.js\"></script>\n"
        << "<style>\n"
        << "html, body { margin: 0; height: 100%; font-family: sans-serif; }\n"
        << "#map { position: absolute; top: 3em; bottom: 0; width: 100%; }\n"
        << "h1 { font-size: 1.2em; margin: 0.6em; }\n"
        << ".legend { background: white; padding: 0.5em; line-height: 1.5em; }\n"
        << "</style>\n</head>\n<body>\n"
        << "<h1>" << escapeHTML(heading) << "</h1>\n"
        << "<div id=\"map\"></div>\n"
        << "<script>\n"
        << "const track = " << escapeForScript(toGeoJSON(track, segments, markers, title)) << ";\n"
        << R"(const map = L.map('map', { worldCopyJump: false }).setView([0, 0], 2);
L.tileLayer('https://tile.openstreetmap.org/{z}/{x}/{y}.png', {
  maxZoom: 8, attribution: '&copy; OpenStreetMap contributors'
}).addTo(map);
L.geoJSON(track, {
  style: () => ({ color: 'blue', weight: 2 }),
  filter: f => f.properties.role === 'track'
}).addTo(map);
L.geoJSON(track, {
  filter: f => f.properties.role === 'samples',
  pointToLayer: (f, ll) => L.circleMarker(ll, { radius: 2, color: 'blue' })
}).addTo(map);
L.geoJSON(track, {
  filter: f => f.properties.role === 'marker',
  pointToLayer: (f, ll) => L.circleMarker(ll, { radius: 5, color: 'darkblue' })
    .bindTooltip(f.properties.label, { permanent: true, direction: 'right' })
    .on('mouseover', e => e.target.setTooltipContent(f.properties.tooltip))
    .on('mouseout', e => e.target.setTooltipContent(f.properties.label))
}).addTo(map);
L.geoJSON(track, {
  filter: f => f.properties.role === 'start',
  pointToLayer: (f, ll) => L.circleMarker(ll, { radius: 8, color: 'red', fillOpacity: 1 })
    .bindTooltip(f.properties.tooltip)
}).addTo(map);
const legend = L.control({ position: 'bottomleft' });
legend.onAdd = () => {
  const div = L.DomUtil.create('div', 'legend');
  div.innerHTML = '<span style="color:red">&#9679;</span> Start<br>' +
    '<span style="color:blue">&#8226;</span> Sample<br>' +
    '<span style="color:darkblue">&#9679;</span> Labeled sample';
  return div;
};
legend.addTo(map);
)"
        << "</script>\n</body>\n</html>\n";
}

bool isHTMLPath(const std::string &path) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".html" || extension == ".htm";
}

void writeTrack(const std::string &path,
                const Track &track,
                const std::vector<Segment<TrackPoint>> &segments,
                const std::vector<TrackPoint> &markers,
                const std::string &title) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Unable to open output file: " + path);
    }

    bool html = isHTMLPath(path);
    debug("Writing {} to {}", html ? "HTML" : "GeoJSON", path);
    if (html) {
        writeHTML(out, track, segments, markers, title);
    } else {
        writeGeoJSON(out, track, segments, markers, title);
    }

    out.close();
    if (out.fail()) {
        throw std::runtime_error("Unable to write output file: " + path);
    }
    info("Wrote {} samples in {} segments to {}", track.points.size(), segments.size(), path);
}

}
