#include "choro/io/geojson.h"

#include <fstream>
#include <sstream>

#include "fmt/core.h"

#include "nlohmann/json.hpp"

#include "utl/verify.h"

#include "choro/error.h"

namespace choro {

using json = nlohmann::ordered_json;

geo_xy read_position(json const& j) {
  if (!j.is_array() || j.size() < 2 || !j[0].is_number() ||
      !j[1].is_number()) {
    throw malformed_geometry{fmt::format("invalid position {}", j.dump())};
  }
  return {j[0].get<geo_coord_t>(), j[1].get<geo_coord_t>()};
}

geo_ring read_ring(json const& j) {
  if (!j.is_array()) {
    throw malformed_geometry{fmt::format("invalid ring {}", j.dump())};
  }

  geo_ring ring;
  ring.reserve(j.size());
  for (auto const& pos : j) {
    ring.push_back(read_position(pos));
  }
  return ring;
}

geo_polygon read_polygon(json const& j) {
  if (!j.is_array()) {
    throw malformed_geometry{fmt::format("invalid polygon {}", j.dump())};
  }
  if (j.empty()) {
    throw malformed_geometry{"polygon without rings"};
  }

  geo_polygon polygon;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it == j.begin()) {
      polygon.outer() = read_ring(*it);
    } else {
      polygon.inners().emplace_back(read_ring(*it));
    }
  }
  return polygon;
}

geo_multi_polygon read_multi_polygon(json const& j) {
  geo_multi_polygon multi_polygon;
  multi_polygon.reserve(j.size());
  for (auto const& polygon : j) {
    multi_polygon.emplace_back(read_polygon(polygon));
  }
  return multi_polygon;
}

geo_geometry read_geometry(json const& j) {
  if (j.is_null()) {
    return geo_invalid{"null", "feature has no geometry"};
  }
  if (!j.is_object()) {
    return geo_invalid{"", "geometry is not an object"};
  }

  auto const type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string()) {
    return geo_invalid{"", "geometry has no string 'type'"};
  }
  auto const type = type_it->get<std::string>();
  if (type != "Polygon" && type != "MultiPolygon") {
    return geo_invalid{type, "only Polygon and MultiPolygon are supported"};
  }

  auto const coords_it = j.find("coordinates");
  if (coords_it == j.end() || !coords_it->is_array()) {
    return geo_invalid{type, "missing 'coordinates' array"};
  }

  try {
    if (type == "Polygon") {
      return read_polygon(*coords_it);
    } else {
      return read_multi_polygon(*coords_it);
    }
  } catch (malformed_geometry const& e) {
    return geo_invalid{type, e.what()};
  }
}

geo_geometry read_geometry(std::string_view s) {
  return read_geometry(json::parse(s));
}

std::vector<metadata> read_properties(json const& j) {
  std::vector<metadata> meta;
  if (!j.is_object()) {
    return meta;
  }

  meta.reserve(j.size());
  for (auto const& [key, value] : j.items()) {
    if (value.is_null()) {
      continue;
    } else if (value.is_string()) {
      meta.emplace_back(key, value.get<std::string>());
    } else {
      meta.emplace_back(key, value.dump());
    }
  }
  return meta;
}

feature read_feature(json const& j) {
  feature f;
  if (!j.is_object()) {
    f.geometry_ = geo_invalid{"", "feature is not an object"};
    return f;
  }

  if (auto const it = j.find("properties"); it != j.end()) {
    f.meta_ = read_properties(*it);
  }

  auto const it = j.find("geometry");
  f.geometry_ = it == j.end() ? read_geometry(json{}) : read_geometry(*it);
  return f;
}

feature_collection read_geojson(std::string_view s) {
  auto const doc = json::parse(s);

  utl::verify(doc.is_object() && doc.contains("type") &&
                  doc.at("type").is_string(),
              "geojson: top-level object has no string 'type' field");

  feature_collection fc;

  auto const type = doc.at("type").get<std::string>();
  if (type == "Feature") {
    fc.features_.emplace_back(read_feature(doc));
    return fc;
  }

  utl::verify(type == "FeatureCollection",
              "geojson: unsupported top-level type '{}'", type);
  utl::verify(doc.contains("features") && doc.at("features").is_array(),
              "geojson: FeatureCollection has no 'features' array");

  for (auto const& [key, value] : doc.items()) {
    if (key != "type" && key != "features") {
      fc.foreign_members_.emplace_back(key, value.dump());
    }
  }

  auto const& features = doc.at("features");
  fc.features_.reserve(features.size());
  for (auto const& f : features) {
    fc.features_.emplace_back(read_feature(f));
  }
  return fc;
}

feature_collection load_geojson(std::string const& fname) {
  std::ifstream in{fname};
  utl::verify(in.is_open(), "geojson: cannot open \"{}\"", fname);

  std::stringstream buffer;
  buffer << in.rdbuf();
  return read_geojson(buffer.str());
}

json write_ring(geo_ring const& ring) {
  auto arr = json::array();
  for (auto const& pt : ring) {
    arr.push_back(json::array({pt.x(), pt.y()}));
  }
  return arr;
}

json write_polygon(geo_polygon const& polygon) {
  auto arr = json::array();
  arr.push_back(write_ring(polygon.outer()));
  for (auto const& inner : polygon.inners()) {
    arr.push_back(write_ring(inner));
  }
  return arr;
}

json write_geometry(geo_polygon const& polygon) {
  return {{"type", "Polygon"}, {"coordinates", write_polygon(polygon)}};
}

json write_geometry(geo_multi_polygon const& multi_polygon) {
  auto arr = json::array();
  for (auto const& polygon : multi_polygon) {
    arr.push_back(write_polygon(polygon));
  }
  return {{"type", "MultiPolygon"}, {"coordinates", std::move(arr)}};
}

json write_geometry(geo_invalid const& invalid) {
  throw malformed_geometry{fmt::format("cannot write geometry '{}': {}",
                                       invalid.type_, invalid.reason_)};
}

json write_feature(feature const& f) {
  auto props = json::object();
  for (auto const& m : f.meta_) {
    props[m.key_] = m.value_;
  }

  json j;
  j["type"] = "Feature";
  j["properties"] = std::move(props);
  j["geometry"] =
      std::visit([](auto const& g) { return write_geometry(g); }, f.geometry_);
  return j;
}

std::string write_geojson(feature_collection const& fc) {
  json doc;
  doc["type"] = "FeatureCollection";
  for (auto const& m : fc.foreign_members_) {
    doc[m.key_] = json::parse(m.value_);
  }

  auto features = json::array();
  for (auto const& f : fc.features_) {
    features.push_back(write_feature(f));
  }
  doc["features"] = std::move(features);

  return doc.dump();
}

size_t save_geojson(feature_collection const& fc, std::string const& fname) {
  auto const str = write_geojson(fc);

  std::ofstream out{fname};
  utl::verify(out.is_open(), "geojson: cannot open \"{}\" for writing", fname);
  out << str;
  utl::verify(out.good(), "geojson: error writing \"{}\"", fname);
  return str.size();
}

}  // namespace choro
