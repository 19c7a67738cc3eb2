/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/config.hpp>

#include <algorithm>
#include <stdexcept>

namespace skyforge {

Config::Config() : date(today()) {
    for (size_t i = 0; i < MAJOR_ASPECTS.size(); i++) {
        orbs[i] = MAJOR_ASPECTS[i].orb;
    }
}

Date Config::getDate() {
    return date;
}

void Config::setDate(const Date &d) {
    date = d;
}

bool Config::hasBirthDate() {
    return birthDate.has_value();
}

void Config::clearBirthDate() {
    birthDate.reset();
}

std::optional<Date> Config::getBirthDate() {
    return birthDate;
}

void Config::setBirthDate(const Date &d) {
    birthDate = d;
}

std::string Config::getEphemerisPath() {
    return ephemerisPath;
}

void Config::setEphemerisPath(const std::string &path) {
    ephemerisPath = path;
}

bool Config::getApproximate() {
    return approximate;
}

void Config::setApproximate(bool a) {
    approximate = a;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

size_t Config::aspectIndex(std::string_view aspectName) {
    for (size_t i = 0; i < MAJOR_ASPECTS.size(); i++) {
        if (MAJOR_ASPECTS[i].name == aspectName) {
            return i;
        }
    }
    throw std::invalid_argument("Unknown aspect: " + std::string(aspectName));
}

double Config::getOrb(std::string_view aspectName) {
    return orbs[aspectIndex(aspectName)];
}

void Config::setOrb(std::string_view aspectName, const double degrees) {
    orbs[aspectIndex(aspectName)] = std::clamp(degrees, 0.0, MAX_ORB);
}

std::vector<AspectDefinition> Config::getAspectDefinitions() {
    std::vector<AspectDefinition> definitions(MAJOR_ASPECTS.begin(), MAJOR_ASPECTS.end());
    for (size_t i = 0; i < definitions.size(); i++) {
        definitions[i].orb = orbs[i];
    }
    return definitions;
}

}
