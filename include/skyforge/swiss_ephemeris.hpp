/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_SWISS_EPHEMERIS_HPP
#define __SKYFORGE_SWISS_EPHEMERIS_HPP

#include <skyforge/ephemeris.hpp>

#include <mutex>
#include <string>

namespace skyforge {

/**
 * Precise backend built on the Swiss Ephemeris library.
 *
 * The library keeps global state (ephemeris path, open data files), so
 * queries are serialized and only one instance should exist per process.
 * Use acquireEphemerisBackend() rather than constructing one directly.
 *
 * When no data files are found under the ephemeris path the library falls
 * back to its built-in Moshier model, which is still well within the
 * precision needed here. That fallback is logged as a warning once per
 * instance; repeats go to the debug log.
 */
class SwissEphemeris : public EphemerisBackend {
public:
    explicit SwissEphemeris(const std::string &ephemerisPath = "");
    ~SwissEphemeris() override;

    // Non-copyable, non-movable (due to mutex)
    SwissEphemeris(const SwissEphemeris&) = delete;
    SwissEphemeris& operator=(const SwissEphemeris&) = delete;
    SwissEphemeris(SwissEphemeris&&) = delete;
    SwissEphemeris& operator=(SwissEphemeris&&) = delete;

    std::string getName() const override;

    double getLongitude(double julianDay, Planet body) const override;

private:
    mutable std::mutex mutex_;
    mutable std::once_flag diagnosticLogged_;  // the fallback notice repeats on every query
};

} // namespace skyforge

#endif
