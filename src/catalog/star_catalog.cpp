/// @file star_catalog.cpp
/// @brief StarCatalog construction and queries.

#include "catalog/star_catalog.hpp"

#include "astro/coordinates.hpp"
#include "catalog/star_color.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace skydome::catalog
{

std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// -----------------------------------------------------------------
// Build
// -----------------------------------------------------------------

StarCatalog StarCatalog::build(std::vector<StarRecord> records)
{
    StarCatalog catalog;
    catalog.m_stars.reserve(records.size());

    std::size_t dropped = 0;
    for (auto& record : records)
    {
        if (!std::isfinite(record.ra) || !std::isfinite(record.dec) || !std::isfinite(record.mag))
        {
            ++dropped;
            continue;
        }

        const f64 color_index = std::isfinite(record.color_index) ? record.color_index : 0.0;

        catalog.m_stars.push_back(Star{
            .id            = record.id,
            .equatorial    = {.ra = record.ra, .dec = record.dec},
            .magnitude     = record.mag,
            .color_index   = color_index,
            .position      = astro::Coordinates::equatorial_to_cartesian(record.ra, record.dec),
            .color         = color_index_to_rgb(color_index),
            .proper_name   = std::move(record.proper_name),
            .designation   = std::move(record.designation),
            .constellation = std::move(record.constellation),
        });
    }

    // Stable: equal magnitudes keep file order, so picking ties are deterministic
    std::stable_sort(catalog.m_stars.begin(), catalog.m_stars.end(),
                     [](const Star& a, const Star& b) { return a.magnitude < b.magnitude; });

    const std::size_t count = catalog.m_stars.size();
    catalog.m_positions.reserve(count * 3);
    catalog.m_magnitudes.reserve(count);
    catalog.m_colors.reserve(count * 3);

    for (const auto& star : catalog.m_stars)
    {
        catalog.m_positions.push_back(static_cast<f32>(star.position.x));
        catalog.m_positions.push_back(static_cast<f32>(star.position.y));
        catalog.m_positions.push_back(static_cast<f32>(star.position.z));

        catalog.m_magnitudes.push_back(static_cast<f32>(star.magnitude));

        catalog.m_colors.push_back(star.color.r);
        catalog.m_colors.push_back(star.color.g);
        catalog.m_colors.push_back(star.color.b);
    }

    if (dropped > 0)
    {
        SKY_CORE_WARN("StarCatalog: Dropped {} records with non-finite coordinates", dropped);
    }
    SKY_CORE_INFO("StarCatalog: Built catalog of {} stars", count);

    return catalog;
}

// -----------------------------------------------------------------
// Queries
// -----------------------------------------------------------------

std::size_t StarCatalog::count_brighter_than(f64 magnitude_limit) const
{
    const auto it = std::upper_bound(m_stars.begin(), m_stars.end(), magnitude_limit,
                                     [](f64 limit, const Star& star) { return limit < star.magnitude; });
    return static_cast<std::size_t>(it - m_stars.begin());
}

const Star* StarCatalog::find_by_id(u32 id) const
{
    const auto it = std::find_if(m_stars.begin(), m_stars.end(),
                                 [id](const Star& star) { return star.id == id; });
    return it != m_stars.end() ? &*it : nullptr;
}

const Star* StarCatalog::find_by_name(std::string_view name) const
{
    const std::string wanted = to_lower(name);
    for (const auto& star : m_stars)
    {
        if (star.proper_name && to_lower(*star.proper_name) == wanted)
        {
            return &star;
        }
    }
    return nullptr;
}

std::vector<const Star*> StarCatalog::find_near(const Vec3d& direction, f64 radius) const
{
    std::vector<const Star*> result;
    const f64 radius_sq = radius * radius;

    for (const auto& star : m_stars)
    {
        const Vec3d d = star.position - direction;
        if (glm::dot(d, d) < radius_sq)
        {
            result.push_back(&star);
        }
    }
    return result;
}

std::vector<const Star*> StarCatalog::search(std::string_view query, std::size_t limit) const
{
    std::vector<const Star*> matches;
    if (query.empty() || limit == 0)
    {
        return matches;
    }

    const std::string q = to_lower(query);

    for (const auto& star : m_stars)
    {
        if (!star.proper_name)
        {
            continue;
        }

        const bool name_match = to_lower(*star.proper_name).find(q) != std::string::npos;
        const bool designation_match = star.designation
                                    && to_lower(*star.designation).find(q) != std::string::npos;
        if (name_match || designation_match)
        {
            matches.push_back(&star);
        }
    }

    std::stable_sort(matches.begin(), matches.end(), [&q](const Star* a, const Star* b) {
        const std::string an = to_lower(*a->proper_name);
        const std::string bn = to_lower(*b->proper_name);
        const bool a_starts = an.starts_with(q);
        const bool b_starts = bn.starts_with(q);
        if (a_starts != b_starts)
        {
            return a_starts;
        }
        return an < bn;
    });

    if (matches.size() > limit)
    {
        matches.resize(limit);
    }
    return matches;
}

const Star* StarCatalog::resolve(std::string_view query) const
{
    if (query.empty())
    {
        return nullptr;
    }

    if (std::all_of(query.begin(), query.end(), [](char c) { return c >= '0' && c <= '9'; }))
    {
        u32 id = 0;
        const auto [ptr, ec] = std::from_chars(query.data(), query.data() + query.size(), id);
        if (ec != std::errc{} || ptr != query.data() + query.size())
        {
            return nullptr;
        }
        return find_by_id(id);
    }

    if (const Star* exact = find_by_name(query))
    {
        return exact;
    }

    const auto matches = search(query, 1);
    return matches.empty() ? nullptr : matches.front();
}

} // namespace skydome::catalog
