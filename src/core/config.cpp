#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>

namespace cityfuse::core {

using json = nlohmann::json;

namespace {

using FieldReader = std::function<void(const json&)>;

template <typename T>
FieldReader field(T& target) {
    return [&target](const json& value) { target = value.get<T>(); };
}

FieldReader color_field(glm::vec4& target) {
    return [&target](const json& value) {
        if (!value.is_array() || value.size() < 3 || value.size() > 4) {
            throw std::invalid_argument("color must be an array of 3 or 4 numbers");
        }
        target = glm::vec4(value[0].get<float>(), value[1].get<float>(), value[2].get<float>(),
                           value.size() == 4 ? value[3].get<float>() : 1.0f);
    };
}

void apply_section(const json& document, const std::string& name,
                   const std::map<std::string, FieldReader>& fields) {
    auto it = document.find(name);
    if (it == document.end()) return;
    if (!it->is_object()) {
        throw std::invalid_argument("section '" + name + "' must be an object");
    }
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        auto reader = fields.find(entry.key());
        if (reader == fields.end()) {
            spdlog::warn("Config: Ignoring unknown key '{}.{}'", name, entry.key());
            continue;
        }
        try {
            reader->second(entry.value());
        } catch (const json::exception& e) {
            throw std::invalid_argument(name + "." + entry.key() + ": " + e.what());
        }
    }
}

} // namespace

bool apply_config(const json& document, PipelineConfig& config, std::string& error) {
    if (!document.is_object()) {
        error = "config root must be an object";
        return false;
    }

    static const char* const sections[] = {"reader", "match", "merge", "mesh", "output"};
    for (auto it = document.begin(); it != document.end(); ++it) {
        bool known = false;
        for (const char* s : sections) known = known || it.key() == s;
        if (!known) {
            spdlog::warn("Config: Ignoring unknown section '{}'", it.key());
        }
    }

    // Work on a copy so a bad file leaves the caller's config untouched
    PipelineConfig result = config;
    std::string directory = result.output.directory.string();

    try {
        apply_section(document, "reader", {
            {"lod_prefix", field(result.reader.lod_prefix)},
            {"fold_building_parts", field(result.reader.fold_building_parts)},
        });
        apply_section(document, "match", {
            {"search_radius_m", field(result.match.search_radius_m)},
            {"max_candidates", field(result.match.max_candidates)},
            {"select_all_containing", field(result.match.select_all_containing)},
            {"distance_tie_epsilon_m", field(result.match.distance_tie_epsilon_m)},
        });
        apply_section(document, "merge", {
            {"cityjson_key_prefix", field(result.merge.cityjson_key_prefix)},
            {"planarity_tolerance_m", field(result.merge.planarity_tolerance_m)},
            {"closure_tolerance_m", field(result.merge.closure_tolerance_m)},
            {"verbatim_building_attributes", field(result.merge.verbatim_building_attributes)},
        });
        apply_section(document, "mesh", {
            {"weld_tolerance_m", field(result.mesh.weld_tolerance_m)},
            {"min_triangle_area_m2", field(result.mesh.min_triangle_area_m2)},
            {"rebase_to_origin", field(result.mesh.rebase_to_origin)},
            {"roof_color", color_field(result.mesh.roof_color)},
            {"wall_color", color_field(result.mesh.wall_color)},
            {"ground_color", color_field(result.mesh.ground_color)},
        });
        apply_section(document, "output", {
            {"directory", field(directory)},
            {"record_suffix", field(result.output.record_suffix)},
            {"mesh_extension", field(result.output.mesh_extension)},
            {"write_point_files", field(result.output.write_point_files)},
            {"write_summary", field(result.output.write_summary)},
            {"workers", field(result.output.workers)},
        });
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }

    if (result.match.search_radius_m <= 0.0) {
        error = "match.search_radius_m must be positive";
        return false;
    }
    if (result.mesh.weld_tolerance_m < 0.0 || result.mesh.min_triangle_area_m2 < 0.0) {
        error = "mesh tolerances must not be negative";
        return false;
    }

    result.output.directory = directory;
    config = std::move(result);
    return true;
}

bool load_config_file(const std::filesystem::path& path, PipelineConfig& config, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "cannot open " + path.string();
        return false;
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        error = "invalid JSON in " + path.string();
        return false;
    }

    if (!apply_config(document, config, error)) {
        error = path.filename().string() + ": " + error;
        return false;
    }
    spdlog::info("Config: Loaded {}", path.string());
    return true;
}

} // namespace cityfuse::core
