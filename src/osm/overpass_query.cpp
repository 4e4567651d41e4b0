#include "osm/overpass_query.hpp"
#include "osm/categories.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace cityfuse::osm {

std::optional<int64_t> area_id_for(ElementType type, ElementId id) {
    switch (type) {
        case ElementType::Relation: return 3600000000LL + id;
        case ElementType::Way:      return 2400000000LL + id;
        default:                    return std::nullopt;
    }
}

std::string build_value_regex(const std::vector<std::string>& values) {
    std::vector<std::string> escaped;
    escaped.reserve(values.size());
    for (const auto& value : values) {
        std::string e;
        for (char c : value) {
            if (c == '\\' || c == '"') e += '\\';
            e += c;
        }
        escaped.push_back(std::move(e));
    }

    if (escaped.size() == 1) {
        return "^" + escaped[0] + "$";
    }
    std::string joined;
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (i > 0) joined += '|';
        joined += escaped[i];
    }
    return "^(" + joined + ")$";
}

std::string build_overpass_query(const SearchArea& area, int timeout_seconds) {
    std::string header;
    std::string filter;
    if (area.area_id) {
        header = fmt::format("area({})->.searchArea;", *area.area_id);
        filter = "(area.searchArea)";
    } else if (area.bbox && area.bbox->is_valid()) {
        const BoundingBox& b = *area.bbox;
        filter = fmt::format("({},{},{},{})", b.min_lat, b.min_lon, b.max_lat, b.max_lon);
    } else {
        throw std::invalid_argument("Overpass query needs an area id or a valid bounding box");
    }

    std::string query = fmt::format("[out:json][timeout:{}];\n", timeout_seconds);
    if (!header.empty()) {
        query += header + "\n";
    }
    query += "\n(\n";

    for (const auto& category : poi_categories()) {
        std::string selector;
        if (!category.required_key.empty()) {
            selector = fmt::format("[\"{}\"=\"{}\"]", category.required_key, category.required_value);
        }
        selector += fmt::format("[\"{}\"~\"{}\"]", category.key, build_value_regex(category.values));

        query += fmt::format("  // {}\n", category.name);
        for (const char* element : {"node", "way", "relation"}) {
            query += fmt::format("  {}{}{};\n", element, selector, filter);
        }
    }

    query += ");\n\nout center meta;\n";
    return query;
}

} // namespace cityfuse::osm
