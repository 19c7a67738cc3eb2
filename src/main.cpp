/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** "Conjunction" -> "--conjunction-orb" */
std::string orbOptionName(std::string_view aspectName) {
    std::string option = "--";
    for (char c : aspectName) {
        option += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return option + "-orb";
}

/** Parse a date option, reporting bad input through CLI11. */
skyforge::Date parseDateOption(const std::string &option, const std::string &value) {
    try {
        return skyforge::parseDate(value);
    } catch (const std::invalid_argument &err) {
        throw CLI::ValidationError(option, err.what());
    }
}

/** Parse --body names, reporting unknown bodies through CLI11. */
std::vector<skyforge::Planet> parseBodyOption(const std::vector<std::string> &names) {
    std::vector<skyforge::Planet> bodies;
    for (const auto &name : names) {
        auto planet = skyforge::planetFromName(name);
        if (!planet) {
            throw CLI::ValidationError("--body", "Unknown body: " + name);
        }
        bodies.push_back(*planet);
    }
    return bodies;
}

/** Build the Sky once, honoring --approximate. */
skyforge::Sky makeSky(skyforge::Config &config) {
    if (config.getApproximate()) {
        spdlog::info("Approximate mode requested; skipping ephemeris backend");
        return skyforge::Sky{};
    }
    return skyforge::Sky{skyforge::acquireEphemerisBackend(config.getEphemerisPath())};
}

/** Program entry point */
int main(int argc, char* argv[]) {

    skyforge::Config config;

    spdlog::set_level(spdlog::level::warn);

    auto configFile = expandTilde("~/.skyforge.toml");

    CLI::App app{"Skyforge"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--date",
        [&config](const std::string &s) { config.setDate(parseDateOption("--date", s)); },
        "Date to calculate for (format: YYYY-MM-DD, default: today UTC)");
    app.add_option_function<std::string>("--birth",
        [&config](const std::string &s) { config.setBirthDate(parseDateOption("--birth", s)); },
        "Birth date used for the house focus (format: YYYY-MM-DD)");
    app.add_option_function<std::string>("--ephe-path",
        [&config](const std::string &path) { config.setEphemerisPath(expandTilde(path)); },
        "Directory containing Swiss Ephemeris data files");
    app.add_flag_function("--approximate",
        [&config](const int64_t a) { config.setApproximate(a > 0); },
        "Do not use the precise ephemeris; report the approximate Sun only");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::warn);
        },
        "Display debugging information");

    for (const auto &aspect : skyforge::MAJOR_ASPECTS) {
        std::string aspectName{aspect.name};
        app.add_option_function<double>(orbOptionName(aspect.name),
            [&config, aspectName](const double degrees) { config.setOrb(aspectName, degrees); },
            std::format("Orb for the {} aspect in degrees (default {})", aspectName, aspect.orb));
    }

    app.ignore_case();

    auto sunCommand = app.add_subcommand("sun", "Display the Sun's longitude and sign");
    auto planetsCommand = app.add_subcommand("planets", "Display the longitude and sign of each body");
    auto aspectsCommand = app.add_subcommand("aspects", "Display aspects between bodies");
    auto gatesCommand = app.add_subcommand("gates", "Display Human Design gate activations");
    auto houseCommand = app.add_subcommand("house", "Display the house focus for a birth date");
    auto snapshotCommand = app.add_subcommand("snapshot", "Display the full celestial snapshot");

    std::vector<skyforge::Planet> bodies;
    for (auto command : {planetsCommand, gatesCommand}) {
        command->add_option_function<std::vector<std::string>>("--body",
            [&bodies](const std::vector<std::string> &names) { bodies = parseBodyOption(names); },
            "Only show these bodies, in this order (ie. Sun Moon Mars)");
    }

    // Command callbacks

    sunCommand->final_callback([&config](void) {
        try {
            auto sky = makeSky(config);
            auto d = config.getDate();
            double longitude = sky.sunLongitude(d);
            auto sign = skyforge::signFor(longitude);
            std::cout << "Sun on " << date::format("%F", d) << ":" << std::endl;
            std::cout << "  Longitude: " << std::format("{:.4f}", longitude) << " deg" << std::endl;
            std::cout << "  Sign:      " << sign.name << " " << std::format("{:.2f}", skyforge::degreesInSign(longitude)) << " deg" << std::endl;
            std::cout << "  Element:   " << sign.element << std::endl;
            std::cout << "  Modality:  " << sign.modality << std::endl;
            if (!sky.isPrecise()) {
                std::cout << "  (approximate, accurate to about 1 deg)" << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    planetsCommand->final_callback([&config, &bodies](void) {
        try {
            auto sky = makeSky(config);
            auto all = sky.allPlanetPositions(config.getDate());
            auto positions = skyforge::selectBodies(all, bodies);
            constexpr std::string_view rowFormat = "{:<8} {:>10} {:<12} {:>8}";
            std::cout << std::format(rowFormat, "Body", "Longitude", "Sign", "In Sign") << std::endl;
            std::cout << std::string(41, '-') << std::endl;
            for (const auto &p : positions) {
                auto sign = skyforge::signFor(p.longitude);
                std::cout << std::format(rowFormat,
                    skyforge::planetName(p.planet),
                    std::format("{:.4f}", p.longitude),
                    sign.name,
                    std::format("{:.2f}", skyforge::degreesInSign(p.longitude))) << std::endl;
            }
            if (!all.isComplete()) {
                std::cerr << "Precise ephemeris unavailable; only the Sun is shown." << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    aspectsCommand->final_callback([&config](void) {
        try {
            auto sky = makeSky(config);
            auto positions = sky.allPlanetPositions(config.getDate());
            if (positions.size() < 2) {
                std::cerr << "Precise ephemeris unavailable; only the Sun is available, so there are no aspects." << std::endl;
            }
            auto definitions = config.getAspectDefinitions();
            auto aspects = skyforge::aspectsAmong(positions, definitions);
            for (const auto &aspect : aspects) {
                std::cout << aspect.describe()
                          << std::format(" [{:.2f} deg]", aspect.separation) << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    gatesCommand->final_callback([&config, &bodies](void) {
        try {
            auto sky = makeSky(config);
            auto all = sky.allPlanetPositions(config.getDate());
            auto positions = skyforge::selectBodies(all, bodies);
            for (const auto &g : skyforge::gatesFor(positions)) {
                std::cout << std::format("{:<8} Gate {:>2}, Line {}", skyforge::planetName(g.planet), g.gate, g.line) << std::endl;
            }
            if (!all.isComplete()) {
                std::cerr << "Precise ephemeris unavailable; only the Sun is shown." << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    houseCommand->final_callback([houseCommand, &config](void) {
        if (!config.hasBirthDate()) {
            std::cerr << "Please provide a birth date with --birth." << std::endl;
            std::cerr << houseCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            auto sky = makeSky(config);
            int house = sky.houseFocus(config.getDate(), *config.getBirthDate());
            std::cout << "House " << house << ": " << skyforge::houseTheme(house) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    snapshotCommand->final_callback([&config](void) {
        try {
            auto sky = makeSky(config);
            auto definitions = config.getAspectDefinitions();
            auto snapshot = skyforge::takeSnapshot(sky, config.getDate(), config.getBirthDate(), definitions);
            snapshot.printInfo(std::cout);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
