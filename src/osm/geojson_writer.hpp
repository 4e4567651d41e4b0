/**
 * @file geojson_writer.hpp
 * @brief Inspection GeoJSON of loaded OSM objects
 *
 * Produces a compact FeatureCollection for GIS viewers: one Point feature
 * per object (WGS84 lon/lat) carrying the identifier, type/name tags and
 * the accessibility values as acc_* properties. Optionally splits the
 * features by their wheelchair value into "<stem>_acc_yes" and
 * "<stem>_acc_no" files.
 */

#pragma once

#include "osm/types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace cityfuse::osm {

/**
 * @brief Wheelchair accessibility class of a feature
 */
enum class WheelchairClass {
    Yes,        ///< yes, true, 1, designated, limited
    No,         ///< no, false, 0, null, none, nan, unknown, empty or missing
    Other       ///< Any other value (e.g. a free-text description)
};

/**
 * @brief Counters of one write
 */
struct GeoJsonStats {
    size_t features = 0;
    size_t accessible = 0;      ///< Features in the _acc_yes subset
    size_t inaccessible = 0;    ///< Features in the _acc_no subset
};

/**
 * @brief Writes inspection GeoJSON files
 */
class GeoJsonWriter {
public:
    /**
     * @brief Build the Point feature of one object
     */
    [[nodiscard]] static nlohmann::json feature(const OsmObject& object);

    /**
     * @brief Classify a feature by its acc_wheelchair property
     */
    [[nodiscard]] static WheelchairClass classify(const nlohmann::json& feature);

    /**
     * @brief Path of a subset file: "pois.geojson" -> "pois_acc_yes.geojson"
     */
    [[nodiscard]] static std::filesystem::path subset_path(const std::filesystem::path& path,
                                                           const std::string& suffix);

    /**
     * @brief Write the collection and, when requested, the subsets
     *
     * Subset files are only written when they would hold features, and only
     * when at least one feature carries a wheelchair value.
     *
     * @return true on success, false on failure (see get_error())
     */
    bool write(const std::vector<OsmObject>& objects, const std::filesystem::path& path,
               bool write_subsets);

    [[nodiscard]] const std::string& get_error() const { return m_error; }

    [[nodiscard]] const GeoJsonStats& get_stats() const { return m_stats; }

private:
    GeoJsonStats m_stats;
    std::string m_error;
};

} // namespace cityfuse::osm
