#include "osm/geojson_writer.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace cityfuse::osm {

namespace {

const char* const kTypeTagKeys[] = {
    "amenity", "healthcare", "shop", "public_transport", "highway", "railway", "name",
};

const char* const kAccessTagKeys[] = {
    "wheelchair", "toilets:wheelchair", "wheelchair:description", "wheelchair_toilet",
    "step_free", "ramp", "ramp:wheelchair", "accessibility",
};

nlohmann::json collection(nlohmann::json features) {
    return {
        {"type", "FeatureCollection"},
        {"crs", {{"type", "name"}, {"properties", {{"name", "urn:ogc:def:crs:OGC:1.3:CRS84"}}}}},
        {"features", std::move(features)},
    };
}

// Invalid UTF-8 in tag values is replaced instead of aborting the dump
std::string dump_collection(nlohmann::json features) {
    return collection(std::move(features)).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

nlohmann::json GeoJsonWriter::feature(const OsmObject& object) {
    nlohmann::json properties;
    properties["osm_id"] = object.osm_id;
    properties["osm_type"] = element_type_name(object.type);
    properties["lat"] = object.lat;
    properties["lon"] = object.lon;

    for (const char* key : kTypeTagKeys) {
        auto it = object.tags.find(key);
        if (it != object.tags.end()) {
            properties[key] = it->second;
        }
    }

    // Accessibility map first, raw tags second
    for (const char* key : kAccessTagKeys) {
        auto acc = object.accessibility.find(key);
        if (acc != object.accessibility.end()) {
            properties[std::string("acc_") + key] = acc->second;
            continue;
        }
        auto tag = object.tags.find(key);
        if (tag != object.tags.end()) {
            properties[std::string("acc_") + key] = tag->second;
        }
    }

    return {
        {"type", "Feature"},
        {"properties", std::move(properties)},
        {"geometry", {{"type", "Point"}, {"coordinates", {object.lon, object.lat}}}},
    };
}

WheelchairClass GeoJsonWriter::classify(const nlohmann::json& feature) {
    std::string value = "nan";
    const auto& properties = feature.at("properties");
    auto it = properties.find("acc_wheelchair");
    if (it != properties.end()) {
        value = it->is_string() ? lowercase(it->get<std::string>()) : lowercase(it->dump());
    }

    static const char* const yes_values[] = {"yes", "true", "1", "designated", "limited"};
    static const char* const no_values[] = {"no", "false", "0", "null", "none", "nan", "unknown", ""};

    for (const char* v : yes_values) {
        if (value == v) return WheelchairClass::Yes;
    }
    for (const char* v : no_values) {
        if (value == v) return WheelchairClass::No;
    }
    return WheelchairClass::Other;
}

std::filesystem::path GeoJsonWriter::subset_path(const std::filesystem::path& path,
                                                 const std::string& suffix) {
    std::filesystem::path result = path;
    result.replace_filename(path.stem().string() + suffix + path.extension().string());
    return result;
}

bool GeoJsonWriter::write(const std::vector<OsmObject>& objects, const std::filesystem::path& path,
                          bool write_subsets) {
    m_stats = GeoJsonStats{};
    m_error.clear();

    if (objects.empty()) {
        m_error = "No objects to write";
        spdlog::error("GeoJSON Writer: {}", m_error);
        return false;
    }

    nlohmann::json features = nlohmann::json::array();
    bool any_wheelchair = false;
    for (const auto& object : objects) {
        nlohmann::json f = feature(object);
        any_wheelchair = any_wheelchair || f["properties"].contains("acc_wheelchair");
        features.push_back(std::move(f));
    }
    m_stats.features = features.size();

    try {
        core::write_text_file(path, dump_collection(features));
        spdlog::info("GeoJSON Writer: Wrote {} features to {}", m_stats.features, path.string());

        if (!write_subsets) return true;
        if (!any_wheelchair) {
            spdlog::info("GeoJSON Writer: No acc_wheelchair property in features; skipping subsets");
            return true;
        }

        nlohmann::json yes = nlohmann::json::array();
        nlohmann::json no = nlohmann::json::array();
        for (const auto& f : features) {
            switch (classify(f)) {
                case WheelchairClass::Yes:   yes.push_back(f); break;
                case WheelchairClass::No:    no.push_back(f); break;
                case WheelchairClass::Other: break;
            }
        }
        m_stats.accessible = yes.size();
        m_stats.inaccessible = no.size();

        if (!yes.empty()) {
            auto yes_path = subset_path(path, "_acc_yes");
            core::write_text_file(yes_path, dump_collection(std::move(yes)));
            spdlog::info("GeoJSON Writer: Wrote {} wheelchair=yes features to {}",
                         m_stats.accessible, yes_path.string());
        }
        if (!no.empty()) {
            auto no_path = subset_path(path, "_acc_no");
            core::write_text_file(no_path, dump_collection(std::move(no)));
            spdlog::info("GeoJSON Writer: Wrote {} wheelchair=no features to {}",
                         m_stats.inaccessible, no_path.string());
        }
        return true;

    } catch (const PipelineError& e) {
        m_error = e.what();
        spdlog::error("GeoJSON Writer: {}", m_error);
        return false;
    }
}

} // namespace cityfuse::osm
