/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/elements.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace groundtrack {

namespace {

constexpr size_t MIN_ELEMENT_LINE_LENGTH = 68;
constexpr size_t CHECKSUM_COLUMN = 68;

std::string_view trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Parse a fixed-width TLE field, reporting which field was bad on failure
template <typename T>
T parseField(std::string_view line, size_t pos, size_t len, const char *field) {
    auto str = trim(line.substr(pos, len));
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size()) {
        throw InvalidInputException(std::format("Invalid TLE {} field: '{}'", field, str));
    }
    return value;
}

// Parse TLE assumed-decimal exponential notation, e.g. "-11606-4" -> -0.11606e-4
double parseExponentialField(std::string_view line, size_t pos, size_t len, const char *field) {
    auto str = trim(line.substr(pos, len));
    double sign = 1.0;
    if (!str.empty() && (str.front() == '-' || str.front() == '+')) {
        sign = str.front() == '-' ? -1.0 : 1.0;
        str.remove_prefix(1);
    }

    auto expPos = str.find_last_of("+-");
    if (str.empty() || expPos == std::string_view::npos || expPos == 0) {
        throw InvalidInputException(std::format("Invalid TLE {} field: '{}'", field, str));
    }

    std::string mantissaStr = "0." + std::string(str.substr(0, expPos));
    std::string_view exponentStr = str.substr(expPos + 1);

    double mantissa = 0.0;
    int exponent = 0;
    auto [mptr, mec] = std::from_chars(mantissaStr.data(), mantissaStr.data() + mantissaStr.size(), mantissa);
    auto [eptr, eec] = std::from_chars(exponentStr.data(), exponentStr.data() + exponentStr.size(), exponent);
    if (mec != std::errc() || eec != std::errc() || exponentStr.empty()) {
        throw InvalidInputException(std::format("Invalid TLE {} field: '{}'", field, str));
    }
    if (str[expPos] == '-') {
        exponent = -exponent;
    }
    return sign * mantissa * std::pow(10.0, exponent);
}

// Parse the TLE epoch format YYDDD.DDDDDDDD
time_point parseEpoch(std::string_view line) {
    using namespace std::chrono;

    int y = parseField<int>(line, 18, 2, "epoch year");
    double dayOfYear = parseField<double>(line, 20, 12, "epoch day");
    if (dayOfYear < 1.0 || dayOfYear >= 367.0) {
        throw InvalidInputException(std::format("Invalid TLE epoch day: {}", dayOfYear));
    }

    // Two-digit years from 57 onward are in the 1900s
    y += (y < 57) ? 2000 : 1900;

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});
    return date + time;
}

void verifyChecksum(std::string_view line) {
    if (line.size() <= CHECKSUM_COLUMN) {
        return;
    }
    char c = line[CHECKSUM_COLUMN];
    if (c < '0' || c > '9') {
        return;
    }
    int expected = c - '0';
    int actual = calculateChecksum(line.substr(0, CHECKSUM_COLUMN));
    if (expected != actual) {
        warn("TLE checksum mismatch on line {} (expected {}, computed {})", line[0], expected, actual);
    }
}

}

ElementSet ElementSet::fromTLE(std::string_view name, std::string_view tle) {
    ElementSet elements = fromTLE(tle);
    elements.name = std::string(trim(name));
    return elements;
}

ElementSet ElementSet::fromTLE(std::string_view tle) {
    ElementSet elements;
    bool firstLineParsed = false;
    bool secondLineParsed = false;

    std::istringstream stream{std::string(tle)};
    std::string rawLine;
    while (std::getline(stream, rawLine)) {
        std::string_view line = trim(rawLine);
        if (line.starts_with("1 ")) {
            elements.parseLine1(line);
            firstLineParsed = true;
        } else if (line.starts_with("2 ")) {
            if (!firstLineParsed) {
                throw InvalidInputException("TLE line 2 appears before line 1");
            }
            elements.parseLine2(line);
            secondLineParsed = true;
        } else if (!firstLineParsed && !line.empty()) {
            // Three line element sets from some sources prefix the name with "0 "
            if (line.starts_with("0 ")) {
                line.remove_prefix(2);
            }
            elements.name = std::string(trim(line));
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed) {
        throw InvalidInputException("TLE is missing line 1");
    }
    if (!secondLineParsed) {
        throw InvalidInputException("TLE is missing line 2");
    }
    return elements;
}

void ElementSet::parseLine1(std::string_view line) {
    if (line.size() < MIN_ELEMENT_LINE_LENGTH) {
        throw InvalidInputException(std::format("TLE line 1 is too short ({} characters)", line.size()));
    }
    verifyChecksum(line);

    catalogId = parseField<int>(line, 2, 5, "catalog number");
    classification = line[7];
    designator = std::string(line.substr(9, 8));
    epoch = parseEpoch(line);
    firstDerivativeMeanMotion = parseField<double>(line, 33, 10, "first derivative of mean motion");
    secondDerivativeMeanMotion = parseExponentialField(line, 44, 8, "second derivative of mean motion");
    bstarDragTerm = parseExponentialField(line, 53, 8, "BSTAR");
    elementSetNumber = parseField<int>(line, 64, 4, "element set number");
}

void ElementSet::parseLine2(std::string_view line) {
    if (line.size() < MIN_ELEMENT_LINE_LENGTH) {
        throw InvalidInputException(std::format("TLE line 2 is too short ({} characters)", line.size()));
    }
    verifyChecksum(line);

    int line2CatalogId = parseField<int>(line, 2, 5, "catalog number");
    if (line2CatalogId != catalogId) {
        throw InvalidInputException(std::format(
            "TLE catalog numbers do not match (line 1: {}, line 2: {})", catalogId, line2CatalogId));
    }

    inclination = parseField<double>(line, 8, 8, "inclination");
    rightAscensionOfAscendingNode = parseField<double>(line, 17, 8, "right ascension of ascending node");
    // Eccentricity has an implied leading decimal point
    eccentricity = parseField<int>(line, 26, 7, "eccentricity") / 1.0e7;
    argumentOfPerigee = parseField<double>(line, 34, 8, "argument of perigee");
    meanAnomaly = parseField<double>(line, 43, 8, "mean anomaly");
    meanMotion = parseField<double>(line, 52, 11, "mean motion");
    revolutionNumberAtEpoch = parseField<int>(line, 63, 5, "revolution number");

    if (meanMotion <= 0.0) {
        throw InvalidInputException(std::format("Invalid TLE mean motion: {}", meanMotion));
    }
}

double ElementSet::getPeriodInMinutes() const {
    return meanMotion > 0.0 ? 1440.0 / meanMotion : 0.0;
}

void ElementSet::printInfo(std::ostream &os) const {
    auto epochSeconds = std::chrono::floor<std::chrono::seconds>(epoch);
    os << getName() << std::endl;
    os << "  Catalog ID: " << getCatalogId() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << trim(getDesignator()) << std::endl;
    os << "  Epoch: " << date::format("%F %T UTC", epochSeconds) << std::endl;
    os << "  First Derivative of Mean Motion: " << getFirstDerivativeMeanMotion() << std::endl;
    os << "  Second Derivative of Mean Motion: " << getSecondDerivativeMeanMotion() << std::endl;
    os << "  Bstar Drag Term: " << getBstarDragTerm() << std::endl;
    os << "  Element Set Number: " << getElementSetNumber() << std::endl;
    os << "  Inclination: " << getInclination() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << getRightAscensionOfAscendingNode() << " deg" << std::endl;
    os << "  Eccentricity: " << getEccentricity() << std::endl;
    os << "  Argument of Perigee: " << getArgumentOfPerigee() << " deg" << std::endl;
    os << "  Mean Anomaly: " << getMeanAnomaly() << " deg" << std::endl;
    os << "  Mean Motion: " << getMeanMotion() << " revs per day" << std::endl;
    os << "  Period: " << std::format("{:.2f}", getPeriodInMinutes()) << " min" << std::endl;
    os << "  Revolution Number at Epoch: " << getRevolutionNumberAtEpoch() << std::endl;
    os << std::endl;
}

// Mod 10 sum of digits, with '-' counting as 1
int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

// Eight characters: sign, five mantissa digits, exponent sign, exponent digit
std::string toTLEExponential(double value) {
    if (value == 0.0) {
        return " 00000+0";
    }

    char sign = (value >= 0) ? ' ' : '-';
    value = std::abs(value);

    // Mantissa is normalized to [0.1, 1.0)
    int exponent = static_cast<int>(std::floor(std::log10(value))) + 1;
    int mantissa = static_cast<int>(std::round(value / std::pow(10.0, exponent) * 100000));
    if (mantissa >= 100000) {
        mantissa = 10000;
        exponent++;
    }

    return std::format("{}{:05}{}{}", sign, mantissa, exponent >= 0 ? '+' : '-', std::abs(exponent));
}

// Ten characters, e.g. " .00008010" or "-.00012345"
std::string formatFirstDerivative(double value) {
    char sign = (value >= 0) ? ' ' : '-';
    return std::format("{}.{:08}", sign, static_cast<long>(std::round(std::abs(value) * 100000000)));
}

std::string ElementSet::toTLE() const {
    using namespace std::chrono;

    auto epochDays = floor<days>(epoch);
    year_month_day ymd{epochDays};
    int twoDigitYear = static_cast<int>(ymd.year()) % 100;
    int dayOfYear = (epochDays - sys_days{ymd.year()/January/1}).count() + 1;
    double fracDay = duration_cast<duration<double, std::ratio<86400>>>(epoch - epochDays).count();
    long fracDigits = std::min(static_cast<long>(std::round(fracDay * 100000000)), 99999999L);

    std::string line1 = std::format("1 {:05}{} {:<8.8} {:02}{:03}.{:08} {} {} {} 0 {:>4}",
        catalogId, classification, designator,
        twoDigitYear, dayOfYear, fracDigits,
        formatFirstDerivative(firstDerivativeMeanMotion),
        toTLEExponential(secondDerivativeMeanMotion),
        toTLEExponential(bstarDragTerm),
        elementSetNumber % 10000);

    std::string line2 = std::format("2 {:05} {:8.4f} {:8.4f} {:07} {:8.4f} {:8.4f} {:11.8f}{:05}",
        catalogId, inclination, rightAscensionOfAscendingNode,
        static_cast<int>(std::round(eccentricity * 10000000)),
        argumentOfPerigee, meanAnomaly, meanMotion,
        revolutionNumberAtEpoch % 100000);

    return std::format("{}\n{}{}\n{}{}\n",
        name, line1, calculateChecksum(line1), line2, calculateChecksum(line2));
}

std::map<int, ElementSet> loadTLEDatabase(const std::string &filepath) {
    if (!std::filesystem::exists(filepath)) {
        warn("TLE database file does not exist: {}", filepath);
        return {};
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw RetrievalException("Failed to open TLE database file: " + filepath);
    }
    debug("Loading TLE database from file: {}", filepath);
    return loadTLEDatabase(file);
}

std::map<int, ElementSet> loadTLEDatabase(std::istream &s) {
    std::map<int, ElementSet> database;
    std::string line, line1, nameLine;
    int skipped = 0;

    while (std::getline(s, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty()) continue;

        if (trimmed.starts_with("1 ")) {
            line1 = std::string(trimmed);
        } else if (trimmed.starts_with("2 ")) {
            try {
                auto elements = ElementSet::fromTLE(nameLine + '\n' + line1 + '\n' + std::string(trimmed));
                database[elements.getCatalogId()] = elements;
            } catch (const InvalidInputException &e) {
                warn("Skipping malformed TLE entry '{}': {}", nameLine, e.what());
                skipped++;
            }
            line1.clear();
            nameLine.clear();
        } else {
            nameLine = std::string(trimmed);
        }
    }

    debug("Loaded {} TLE entries ({} skipped).", database.size(), skipped);
    return database;
}

}
