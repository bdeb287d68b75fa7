/// @file constellations.cpp
/// @brief Constellation GeoJSON parsing and the IAU name table.

#include "catalog/constellations.hpp"

#include "catalog/star_catalog.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace skydome::catalog
{

namespace
{
    using NameEntry = std::pair<std::string_view, std::string_view>;

    constexpr std::array<NameEntry, 88> kConstellationNames = {{
        {"And", "Andromeda"}, {"Ant", "Antlia"}, {"Aps", "Apus"}, {"Aqr", "Aquarius"},
        {"Aql", "Aquila"}, {"Ara", "Ara"}, {"Ari", "Aries"}, {"Aur", "Auriga"},
        {"Boo", "Boötes"}, {"Cae", "Caelum"}, {"Cam", "Camelopardalis"}, {"Cnc", "Cancer"},
        {"CVn", "Canes Venatici"}, {"CMa", "Canis Major"}, {"CMi", "Canis Minor"}, {"Cap", "Capricornus"},
        {"Car", "Carina"}, {"Cas", "Cassiopeia"}, {"Cen", "Centaurus"}, {"Cep", "Cepheus"},
        {"Cet", "Cetus"}, {"Cha", "Chamaeleon"}, {"Cir", "Circinus"}, {"Col", "Columba"},
        {"Com", "Coma Berenices"}, {"CrA", "Corona Australis"}, {"CrB", "Corona Borealis"}, {"Crv", "Corvus"},
        {"Crt", "Crater"}, {"Cru", "Crux"}, {"Cyg", "Cygnus"}, {"Del", "Delphinus"},
        {"Dor", "Dorado"}, {"Dra", "Draco"}, {"Equ", "Equuleus"}, {"Eri", "Eridanus"},
        {"For", "Fornax"}, {"Gem", "Gemini"}, {"Gru", "Grus"}, {"Her", "Hercules"},
        {"Hor", "Horologium"}, {"Hya", "Hydra"}, {"Hyi", "Hydrus"}, {"Ind", "Indus"},
        {"Lac", "Lacerta"}, {"Leo", "Leo"}, {"LMi", "Leo Minor"}, {"Lep", "Lepus"},
        {"Lib", "Libra"}, {"Lup", "Lupus"}, {"Lyn", "Lynx"}, {"Lyr", "Lyra"},
        {"Men", "Mensa"}, {"Mic", "Microscopium"}, {"Mon", "Monoceros"}, {"Mus", "Musca"},
        {"Nor", "Norma"}, {"Oct", "Octans"}, {"Oph", "Ophiuchus"}, {"Ori", "Orion"},
        {"Pav", "Pavo"}, {"Peg", "Pegasus"}, {"Per", "Perseus"}, {"Phe", "Phoenix"},
        {"Pic", "Pictor"}, {"Psc", "Pisces"}, {"PsA", "Piscis Austrinus"}, {"Pup", "Puppis"},
        {"Pyx", "Pyxis"}, {"Ret", "Reticulum"}, {"Sge", "Sagitta"}, {"Sgr", "Sagittarius"},
        {"Sco", "Scorpius"}, {"Scl", "Sculptor"}, {"Sct", "Scutum"}, {"Ser", "Serpens"},
        {"Sex", "Sextans"}, {"Tau", "Taurus"}, {"Tel", "Telescopium"}, {"Tri", "Triangulum"},
        {"TrA", "Triangulum Australe"}, {"Tuc", "Tucana"}, {"UMa", "Ursa Major"}, {"UMi", "Ursa Minor"},
        {"Vel", "Vela"}, {"Vir", "Virgo"}, {"Vol", "Volans"}, {"Vul", "Vulpecula"},
    }};

    /// GeoJSON RA runs -180..180 degrees; the catalog frame wants hours.
    Vec3d geojson_to_cartesian(f64 ra_deg, f64 dec_deg)
    {
        return astro::Coordinates::equatorial_to_cartesian(ra_deg / astro_constants::kHourToDeg, dec_deg);
    }

    std::optional<Vec3d> read_point(const nlohmann::json& coord)
    {
        if (!coord.is_array() || coord.size() < 2 || !coord[0].is_number() || !coord[1].is_number())
        {
            return std::nullopt;
        }
        return geojson_to_cartesian(coord[0].get<f64>(), coord[1].get<f64>());
    }
}

std::optional<std::string_view> constellation_name(std::string_view abbreviation)
{
    const auto it = std::find_if(kConstellationNames.begin(), kConstellationNames.end(),
                                 [abbreviation](const NameEntry& e) { return e.first == abbreviation; });
    if (it == kConstellationNames.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t constellation_name_count()
{
    return kConstellationNames.size();
}

const ConstellationCenter* ConstellationSet::find(std::string_view name_or_id) const
{
    const std::string wanted = to_lower(name_or_id);
    for (const auto& center : centers)
    {
        if (to_lower(center.id) == wanted || to_lower(center.name) == wanted)
        {
            return &center;
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------
// GeoJSON parsing
//
// Centers are the normalized mean of each constellation's vertex unit
// vectors, which stays correct for figures straddling RA 0h.
// -----------------------------------------------------------------

std::optional<ConstellationSet> ConstellationLoader::parse_geojson(std::string_view text)
{
    const auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded())
    {
        SKY_CORE_ERROR("ConstellationLoader: Invalid JSON");
        return std::nullopt;
    }

    if (!json.is_object() || !json.contains("features") || !json.at("features").is_array())
    {
        SKY_CORE_ERROR("ConstellationLoader: Missing 'features' array");
        return std::nullopt;
    }

    ConstellationSet set;

    // Ordered so centers come out sorted by abbreviation
    std::map<std::string, std::pair<Vec3d, std::size_t>> sums;
    std::size_t skipped = 0;

    for (const auto& feature : json.at("features"))
    {
        if (!feature.is_object() || !feature.contains("geometry") || !feature.at("geometry").is_object())
        {
            ++skipped;
            continue;
        }

        const auto& geometry = feature.at("geometry");
        if (!geometry.contains("type") || geometry.at("type") != "MultiLineString"
            || !geometry.contains("coordinates") || !geometry.at("coordinates").is_array())
        {
            ++skipped;
            continue;
        }

        const std::string id = (feature.contains("id") && feature.at("id").is_string())
                             ? feature.at("id").get<std::string>()
                             : std::string{};

        auto& [sum, count] = sums[id];

        for (const auto& stroke : geometry.at("coordinates"))
        {
            if (!stroke.is_array())
            {
                continue;
            }

            ConstellationLine line{.id = id, .points = {}};
            for (const auto& coord : stroke)
            {
                if (const auto point = read_point(coord))
                {
                    line.points.push_back(*point);
                    sum += *point;
                    ++count;
                }
            }

            if (line.points.size() >= 2)
            {
                set.lines.push_back(std::move(line));
            }
        }
    }

    for (const auto& [id, entry] : sums)
    {
        const auto& [sum, count] = entry;
        if (count == 0 || glm::length(sum) < 1e-9)
        {
            continue;
        }

        const Vec3d position = glm::normalize(sum);
        set.centers.push_back(ConstellationCenter{
            .id         = id,
            .name       = std::string(constellation_name(id).value_or(id)),
            .equatorial = astro::Coordinates::cartesian_to_equatorial(position),
            .position   = position,
        });
    }

    if (skipped > 0)
    {
        SKY_CORE_WARN("ConstellationLoader: Skipped {} features without MultiLineString geometry", skipped);
    }
    SKY_CORE_INFO("ConstellationLoader: Loaded {} line strokes, {} constellations",
                  set.lines.size(), set.centers.size());

    return set;
}

std::optional<ConstellationSet> ConstellationLoader::load_geojson(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("ConstellationLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_geojson(buffer.str());
}

} // namespace skydome::catalog
