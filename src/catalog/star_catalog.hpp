#pragma once

/// @file star_catalog.hpp
/// @brief Immutable, magnitude-sorted star catalog with flattened render arrays.

#include "catalog/star.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace skydome::catalog
{
    /// @brief The loaded sky: stars sorted brightest first.
    ///
    /// Built once from parsed records and never mutated afterwards, so
    /// pointers and spans handed out remain valid for the catalog's lifetime.
    ///
    /// Alongside the Star objects the catalog keeps three parallel arrays
    /// for bulk consumers: positions (x,y,z per star), magnitudes and
    /// colors (r,g,b per star), all in catalog order.
    class StarCatalog
    {
    public:
        /// @brief Default radius (unit-sphere chord) for find_near().
        static constexpr f64 kDefaultNearRadius = 0.1;

        /// @brief Default result count for search().
        static constexpr std::size_t kDefaultSearchLimit = 20;

        StarCatalog() = default;

        /// @brief Derive positions and colors, drop non-finite records,
        ///        and sort ascending by magnitude (stable).
        [[nodiscard]] static StarCatalog build(std::vector<StarRecord> records);

        [[nodiscard]] std::span<const Star> stars() const { return m_stars; }
        [[nodiscard]] std::size_t size() const { return m_stars.size(); }
        [[nodiscard]] bool empty() const { return m_stars.empty(); }
        [[nodiscard]] const Star& operator[](std::size_t index) const { return m_stars[index]; }

        [[nodiscard]] std::span<const f32> positions() const { return m_positions; }
        [[nodiscard]] std::span<const f32> magnitudes() const { return m_magnitudes; }
        [[nodiscard]] std::span<const f32> colors() const { return m_colors; }

        /// @brief Number of leading stars with magnitude <= limit.
        ///
        /// Because the catalog is sorted, rendering "everything down to the
        /// limit" is a prefix of stars().
        [[nodiscard]] std::size_t count_brighter_than(f64 magnitude_limit) const;

        /// @brief Lookup by catalog id, nullptr if absent.
        [[nodiscard]] const Star* find_by_id(u32 id) const;

        /// @brief Case-insensitive exact lookup on proper name, nullptr if absent.
        [[nodiscard]] const Star* find_by_name(std::string_view name) const;

        /// @brief All stars within a chord distance of a catalog-frame direction,
        ///        in catalog order.
        [[nodiscard]] std::vector<const Star*> find_near(const Vec3d& direction,
                                                         f64 radius = kDefaultNearRadius) const;

        /// @brief Named-star search.
        ///
        /// Only stars with a proper name are candidates. The query matches
        /// case-insensitively as a substring of the proper name or of that
        /// star's designation. Names starting with the query come first,
        /// then alphabetical by name. An empty query returns nothing.
        [[nodiscard]] std::vector<const Star*> search(std::string_view query,
                                                      std::size_t limit = kDefaultSearchLimit) const;

        /// @brief Resolve a user query to one star.
        ///
        /// An all-digit query is a catalog id. Otherwise an exact proper
        /// name wins, then the first search() result. nullptr if none.
        [[nodiscard]] const Star* resolve(std::string_view query) const;

    private:
        std::vector<Star> m_stars;
        std::vector<f32> m_positions;
        std::vector<f32> m_magnitudes;
        std::vector<f32> m_colors;
    };

    /// @brief ASCII lower-case copy, used for case-insensitive matching.
    [[nodiscard]] std::string to_lower(std::string_view text);

} // namespace skydome::catalog
