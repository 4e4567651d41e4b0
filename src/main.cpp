#include "core/application.hpp"
#include "core/config.hpp"
#include "osm/geojson_writer.hpp"
#include "osm/overpass_query.hpp"
#include "osm/parser.hpp"
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <sstream>
#include <string>

DEFINE_string(osm, "", "OSM input: fetch output or Overpass JSON, .osm, .osm.pbf, .osm.bz2, .osm.gz");
DEFINE_string(cityjson, "", "Directory of CityJSON tiles.");
DEFINE_string(out, "", "Output directory (run) or output file (mesh).");
DEFINE_string(record, "", "Merged-record file (<stem>_bld.json) to mesh.");
DEFINE_string(geojson, "", "Inspection GeoJSON file to write.");
DEFINE_bool(subsets, false, "Also write _acc_yes / _acc_no wheelchair subsets.");
DEFINE_int64(area_id, 0, "Overpass area id to query.");
DEFINE_int64(relation, 0, "OSM relation id whose area to query.");
DEFINE_string(bbox, "", "Bounding box south,west,north,east in degrees.");
DEFINE_int32(timeout, 180, "Overpass query timeout in seconds.");
DEFINE_string(config, "", "JSON config file.");
DEFINE_string(log_level, "info", "trace, debug, info, warn, error.");
DEFINE_double(radius, 25.0, "Search radius in metres.");
DEFINE_int32(workers, 0, "Parallel workers (0 = hardware concurrency).");

namespace {

constexpr const char* kUsage =
    "Merges OSM points of interest with CityJSON LOD2 buildings into per-object GLB meshes.\n\n"
    "Commands:\n"
    "  cityfuse run --osm=pois.json --cityjson=tiles/ --out=out/\n"
    "  cityfuse mesh --record=out/node_1_bld.json [--out=node_1.glb]\n"
    "  cityfuse convert --osm=pois.json --geojson=pois.geojson [--subsets]\n"
    "  cityfuse query --area_id=3600062518 | --relation=62518 | --bbox=48.9,8.3,49.1,8.5";

bool is_set(const char* flag) {
    return !google::GetCommandLineFlagInfoOrDie(flag).is_default;
}

bool parse_bbox(const std::string& text, cityfuse::osm::BoundingBox& bbox) {
    std::istringstream stream(text);
    double values[4];
    char comma = 0;
    for (int i = 0; i < 4; ++i) {
        if (!(stream >> values[i])) return false;
        if (i < 3 && (!(stream >> comma) || comma != ',')) return false;
    }
    bbox.min_lat = values[0];
    bbox.min_lon = values[1];
    bbox.max_lat = values[2];
    bbox.max_lon = values[3];
    return bbox.is_valid();
}

bool load_pipeline_config(cityfuse::core::PipelineConfig& config) {
    if (!FLAGS_config.empty()) {
        std::string error;
        if (!cityfuse::core::load_config_file(FLAGS_config, config, error)) {
            spdlog::error("Config: {}", error);
            return false;
        }
    }

    // Command-line flags win over the config file
    if (is_set("radius")) {
        if (FLAGS_radius <= 0.0) {
            spdlog::error("--radius must be positive");
            return false;
        }
        config.match.search_radius_m = FLAGS_radius;
    }
    if (is_set("workers")) {
        if (FLAGS_workers < 0) {
            spdlog::error("--workers must not be negative");
            return false;
        }
        config.output.workers = static_cast<unsigned>(FLAGS_workers);
    }
    if (!FLAGS_out.empty()) {
        config.output.directory = FLAGS_out;
    }
    return true;
}

int command_run() {
    if (FLAGS_osm.empty() || FLAGS_cityjson.empty()) {
        spdlog::error("run needs --osm and --cityjson");
        return 1;
    }

    cityfuse::core::PipelineConfig config;
    if (!load_pipeline_config(config)) return 1;

    cityfuse::core::Application app(config);
    if (!app.init(FLAGS_osm, FLAGS_cityjson)) {
        spdlog::error("Failed to initialize: {}", app.get_error());
        return 1;
    }
    if (!app.run()) {
        spdlog::error("Run failed: {}", app.get_error());
        return 1;
    }
    return 0;
}

int command_mesh() {
    if (FLAGS_record.empty()) {
        spdlog::error("mesh needs --record");
        return 1;
    }

    cityfuse::core::PipelineConfig config;
    if (!load_pipeline_config(config)) return 1;

    std::filesystem::path record = FLAGS_record;
    std::filesystem::path destination = FLAGS_out;
    if (destination.empty()) {
        // node_1_bld.json -> node_1.glb
        std::string stem = record.stem().string();
        const std::string& suffix = config.output.record_suffix;
        if (stem.size() > suffix.size() && stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
            stem.erase(stem.size() - suffix.size());
        }
        destination = record.parent_path() / (stem + config.output.mesh_extension);
    }

    try {
        cityfuse::core::Application::mesh_record(record, destination, config.mesh);
    } catch (const cityfuse::PipelineError& e) {
        spdlog::error("mesh failed ({}): {}", cityfuse::failure_kind_name(e.kind()), e.what());
        return 1;
    }
    return 0;
}

int command_convert() {
    if (FLAGS_osm.empty() || FLAGS_geojson.empty()) {
        spdlog::error("convert needs --osm and --geojson");
        return 1;
    }

    cityfuse::osm::ParserConfig parser_config;
    if (!FLAGS_bbox.empty()) {
        cityfuse::osm::BoundingBox bbox;
        if (!parse_bbox(FLAGS_bbox, bbox)) {
            spdlog::error("Invalid --bbox '{}', expected south,west,north,east", FLAGS_bbox);
            return 1;
        }
        parser_config.filter_bounds = bbox;
    }

    cityfuse::osm::OSMParser parser;
    parser.set_config(parser_config);
    if (!parser.parse(FLAGS_osm)) return 1;
    parser.log_statistics();

    cityfuse::osm::GeoJsonWriter writer;
    return writer.write(parser.get_objects(), FLAGS_geojson, FLAGS_subsets) ? 0 : 1;
}

int command_query() {
    cityfuse::osm::SearchArea area;
    if (FLAGS_area_id != 0) {
        area.area_id = FLAGS_area_id;
    } else if (FLAGS_relation != 0) {
        area.area_id = cityfuse::osm::area_id_for(cityfuse::osm::ElementType::Relation, FLAGS_relation);
    } else if (!FLAGS_bbox.empty()) {
        cityfuse::osm::BoundingBox bbox;
        if (!parse_bbox(FLAGS_bbox, bbox)) {
            spdlog::error("Invalid --bbox '{}', expected south,west,north,east", FLAGS_bbox);
            return 1;
        }
        area.bbox = bbox;
    } else {
        spdlog::error("query needs --area_id, --relation or --bbox");
        return 1;
    }

    std::cout << cityfuse::osm::build_overpass_query(area, FLAGS_timeout);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    google::SetUsageMessage(kUsage);
    google::SetVersionString("0.1.0");
    google::ParseCommandLineFlags(&argc, &argv, true);

    spdlog::level::level_enum level = spdlog::level::from_str(FLAGS_log_level);
    if (level == spdlog::level::off && FLAGS_log_level != "off") {
        std::cerr << "Unknown --log_level '" << FLAGS_log_level << "'\n";
        return 1;
    }
    spdlog::set_level(level);

    if (argc < 2) {
        google::ShowUsageWithFlagsRestrict(argv[0], "main.cpp");
        return 1;
    }

    const std::string command = argv[1];
    spdlog::debug("cityfuse v0.1.0: {}", command);

    if (command == "run") return command_run();
    if (command == "mesh") return command_mesh();
    if (command == "convert") return command_convert();
    if (command == "query") return command_query();

    spdlog::error("Unknown command '{}'", command);
    google::ShowUsageWithFlagsRestrict(argv[0], "main.cpp");
    return 1;
}
