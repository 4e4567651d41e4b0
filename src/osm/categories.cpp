#include "osm/categories.hpp"
#include <algorithm>

namespace cityfuse::osm {

bool TagCategory::matches(const TagMap& tags) const {
    auto it = tags.find(key);
    if (it == tags.end()) return false;
    if (std::find(values.begin(), values.end(), it->second) == values.end()) return false;

    if (!required_key.empty()) {
        auto required = tags.find(required_key);
        return required != tags.end() && required->second == required_value;
    }
    return true;
}

const std::vector<TagCategory>& poi_categories() {
    static const std::vector<TagCategory> categories = {
        {"amenities", "amenity", {
            // food / leisure
            "restaurant", "cafe", "fast_food", "bar",
            // public / civic
            "government", "townhall", "courthouse", "office", "library",
            // education
            "school", "university", "kindergarten", "childcare", "preschool",
            // money / post / fuel / parking / taxi
            "bank", "atm", "post_office", "fuel", "parking", "taxi",
            // medical
            "clinic", "hospital", "pharmacy", "doctors", "dentist", "physiotherapist",
            // care
            "nursing_home", "social_facility", "retirement_home", "assisted_living", "group_home",
        }, "", ""},
        {"healthcare", "healthcare", {
            "doctor", "dentist", "physiotherapist", "physiotherapy", "rehabilitation",
            "psychotherapist", "psychology", "speech_therapist", "occupational_therapy",
            "hearing_aids", "optometrist", "orthoptist", "podiatrist", "counselling",
            "sample_collection",
        }, "", ""},
        {"medical shops", "shop", {
            "medical_supply", "mobility_scooter", "orthopaedics",
        }, "", ""},
        {"care facilities", "social_facility:for", {
            "senior", "elderly", "retirement", "assisted_living", "disabled",
            "handicapped", "mental_health",
        }, "amenity", "social_facility"},
        {"transport (amenity)", "amenity", {
            "bus_station", "ferry_terminal",
        }, "", ""},
        {"transport (highway)", "highway", {
            "bus_stop", "bus_station",
        }, "", ""},
        {"public transport", "public_transport", {
            "stop_position", "platform", "station", "stop_area", "stop_area_group", "stop",
        }, "", ""},
        {"transport (railway)", "railway", {
            "station", "halt", "stop", "tram_stop", "subway_entrance", "platform",
        }, "", ""},
    };
    return categories;
}

bool is_point_of_interest(const TagMap& tags) {
    const auto& categories = poi_categories();
    return std::any_of(categories.begin(), categories.end(),
                       [&tags](const TagCategory& category) { return category.matches(tags); });
}

const std::vector<std::string>& accessibility_keys() {
    static const std::vector<std::string> keys = {
        "wheelchair",
        "accessibility",
        "elevator",
        "toilets:wheelchair",
        "wheelchair_toilet",
        "wheelchair:description",
        "step_free",
        "ramp",
        "ramp:wheelchair",
    };
    return keys;
}

TagMap extract_accessibility(const TagMap& tags) {
    TagMap result;
    for (const auto& key : accessibility_keys()) {
        auto it = tags.find(key);
        if (it != tags.end()) {
            result[key] = it->second;
        }
    }
    return result;
}

} // namespace cityfuse::osm
