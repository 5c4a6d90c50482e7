#pragma once

#include <string>
#include <string_view>

#include "choro/feature/feature.h"

namespace choro {

// FeatureCollection (or a single Feature) to feature_collection
// geometries which are not Polygon / MultiPolygon decode to geo_invalid
feature_collection read_geojson(std::string_view);
feature_collection load_geojson(std::string const& fname);

geo_geometry read_geometry(std::string_view);

// compact (whitespace-free) GeoJSON
std::string write_geojson(feature_collection const&);

// returns the number of bytes written
size_t save_geojson(feature_collection const&, std::string const& fname);

}  // namespace choro
