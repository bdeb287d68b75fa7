#pragma once

/// @file sim_clock.hpp
/// @brief Simulation clock: real-time following, playback speeds and time jumps.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <array>
#include <functional>
#include <string>

namespace skydome::astro
{
    /// @brief Owns the instant the sky is drawn for.
    ///
    /// Two modes:
    /// - real-time: every advance() re-reads the time source, speed is 1.
    /// - playback: time moves by real seconds × speed (sim seconds per real
    ///   second). Any explicit playback or time change enters this mode;
    ///   go_live() leaves it.
    ///
    /// The time source is injected so tests never touch the wall clock.
    class SimulationClock
    {
    public:
        /// Returns the current instant as a Julian Date.
        using TimeSource = std::function<f64()>;

        /// Playback ladder, slowest reverse to fastest forward.
        static constexpr std::array<f64, 11> kSpeeds = {
            -3600.0, -600.0, -60.0, -10.0, -1.0, 0.0, 1.0, 10.0, 60.0, 600.0, 3600.0,
        };

        /// @brief Start in real-time mode at source().
        explicit SimulationClock(TimeSource source = &TimeSystem::now_as_jd);

        /// @brief Advance by a real-time step in seconds.
        ///
        /// Real-time mode ignores the step and re-reads the source.
        /// Negative or non-finite steps are treated as zero.
        void advance(f64 real_dt_sec);

        /// @brief Paused → 1 s/s; reversing → same magnitude forward;
        ///        forward → next faster step (saturates at the top).
        void forward();

        /// @brief Mirror of forward().
        void reverse();

        void pause();

        /// @brief Set an arbitrary speed. Non-finite values are ignored.
        void set_speed(f64 speed);

        void set_time(f64 jd);
        void set_time(const DateTime& instant);

        /// @brief Jump the current instant by a number of hours.
        void shift_hours(f64 hours);

        /// @brief Back to real-time mode at 1 s/s.
        void go_live();

        [[nodiscard]] f64 jd() const { return m_jd; }
        [[nodiscard]] DateTime instant() const { return TimeSystem::from_julian_date(m_jd); }
        [[nodiscard]] f64 speed() const { return m_speed; }
        [[nodiscard]] bool is_realtime() const { return m_realtime; }
        [[nodiscard]] bool is_paused() const { return m_speed == 0.0; }

        /// @brief Short label for the playback speed ("1h/s", "PAUSED", "-10m/s").
        ///
        /// Speeds off the ladder print as "<speed>x".
        [[nodiscard]] std::string speed_label() const;

    private:
        TimeSource m_source;
        f64 m_jd = 0.0;
        f64 m_speed = 1.0;
        bool m_realtime = true;
    };

} // namespace skydome::astro
