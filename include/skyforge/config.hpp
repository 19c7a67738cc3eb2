/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_CONFIG_HPP
#define __SKYFORGE_CONFIG_HPP

#include <skyforge/aspects.hpp>
#include <skyforge/ephemeris.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skyforge {

constexpr double MAX_ORB = 15.0;

class Config {
public:
    Config();
    ~Config() = default;

    Date getDate();
    void setDate(const Date &d);

    bool hasBirthDate();
    void clearBirthDate();
    std::optional<Date> getBirthDate();
    void setBirthDate(const Date &d);

    std::string getEphemerisPath();
    void setEphemerisPath(const std::string &path);

    bool getApproximate();
    void setApproximate(bool a);

    bool getVerbose();
    void setVerbose(bool v);

    /**
     * @throws std::invalid_argument if aspectName is not a major aspect
     */
    double getOrb(std::string_view aspectName);

    /**
     * Sets the orb of a major aspect, clamped to [0, 15] degrees.
     * @throws std::invalid_argument if aspectName is not a major aspect
     */
    void setOrb(std::string_view aspectName, const double degrees);

    /** The major aspects with the configured orbs, in matching order. */
    std::vector<AspectDefinition> getAspectDefinitions();

private:
    size_t aspectIndex(std::string_view aspectName);

    Date date;
    std::optional<Date> birthDate;
    std::string ephemerisPath;
    bool approximate = false;
    bool verbose = false;
    std::array<double, MAJOR_ASPECTS.size()> orbs;
};

}

#endif
