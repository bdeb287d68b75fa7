/// @file sim_clock.cpp
/// @brief Simulation clock implementation.

#include "astro/sim_clock.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace skydome::astro
{

namespace
{
    struct SpeedLabel
    {
        f64 speed;
        const char* label;
    };

    constexpr std::array<SpeedLabel, 11> kSpeedLabels = {{
        {-3600.0, "-1h/s"},
        {-600.0, "-10m/s"},
        {-60.0, "-1m/s"},
        {-10.0, "-10s/s"},
        {-1.0, "-1s/s"},
        {0.0, "PAUSED"},
        {1.0, "1s/s"},
        {10.0, "10s/s"},
        {60.0, "1m/s"},
        {600.0, "10m/s"},
        {3600.0, "1h/s"},
    }};
}

SimulationClock::SimulationClock(TimeSource source)
    : m_source(std::move(source))
{
    if (!m_source)
    {
        m_source = &TimeSystem::now_as_jd;
    }
    m_jd = m_source();
}

void SimulationClock::advance(f64 real_dt_sec)
{
    if (m_realtime)
    {
        m_jd = m_source();
        return;
    }

    if (!std::isfinite(real_dt_sec) || real_dt_sec <= 0.0)
    {
        return;
    }

    m_jd = TimeSystem::add_seconds(m_jd, real_dt_sec * m_speed);
}

// -----------------------------------------------------------------
// Playback
//
// Stepping looks for the neighbouring ladder entry rather than the
// current index, so a speed set off the ladder still moves sensibly.
// -----------------------------------------------------------------

void SimulationClock::forward()
{
    m_realtime = false;

    if (m_speed < 0.0)
    {
        m_speed = -m_speed;
    }
    else if (m_speed == 0.0)
    {
        m_speed = 1.0;
    }
    else
    {
        const auto next = std::upper_bound(kSpeeds.begin(), kSpeeds.end(), m_speed);
        if (next != kSpeeds.end())
        {
            m_speed = *next;
        }
    }
}

void SimulationClock::reverse()
{
    m_realtime = false;

    if (m_speed > 0.0)
    {
        m_speed = -m_speed;
    }
    else if (m_speed == 0.0)
    {
        m_speed = -1.0;
    }
    else
    {
        const auto first_not_less = std::lower_bound(kSpeeds.begin(), kSpeeds.end(), m_speed);
        if (first_not_less != kSpeeds.begin())
        {
            m_speed = *std::prev(first_not_less);
        }
    }
}

void SimulationClock::pause()
{
    m_realtime = false;
    m_speed = 0.0;
}

void SimulationClock::set_speed(f64 speed)
{
    if (!std::isfinite(speed))
    {
        return;
    }
    m_realtime = false;
    m_speed = speed;
}

// -----------------------------------------------------------------
// Time jumps
// -----------------------------------------------------------------

void SimulationClock::set_time(f64 jd)
{
    if (!std::isfinite(jd))
    {
        return;
    }
    m_realtime = false;
    m_jd = jd;
}

void SimulationClock::set_time(const DateTime& instant)
{
    set_time(TimeSystem::to_julian_date(instant));
}

void SimulationClock::shift_hours(f64 hours)
{
    if (!std::isfinite(hours))
    {
        return;
    }
    m_realtime = false;
    m_jd = TimeSystem::add_seconds(m_jd, hours * 3600.0);
}

void SimulationClock::go_live()
{
    m_realtime = true;
    m_speed = 1.0;
    m_jd = m_source();
}

std::string SimulationClock::speed_label() const
{
    const auto it = std::find_if(kSpeedLabels.begin(), kSpeedLabels.end(),
                                 [this](const SpeedLabel& entry) { return entry.speed == m_speed; });
    if (it != kSpeedLabels.end())
    {
        return it->label;
    }
    return fmt::format("{:g}x", m_speed);
}

} // namespace skydome::astro
