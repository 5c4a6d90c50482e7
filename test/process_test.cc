#include "catch2/catch.hpp"

#include <string>

#include "choro/error.h"
#include "choro/feature/process.h"
#include "choro/geo/algo/quantize.h"

using namespace choro;

namespace {

geo_ring square_ring(double const x, double const y, double const size) {
  return geo_ring{{x, y},
                  {x, y + size / 2 + 0.0001},
                  {x, y + size},
                  {x + size, y + size},
                  {x + size, y},
                  {x, y}};
}

feature make_feature(std::string const& id, std::string const& label,
                     double const x = -74., double const y = 4.) {
  feature f;
  f.meta_ = {{"DPTOMPIO", id},
             {"MPIO_CNMBR", label},
             {"MPIO_CCDGO", "001"},
             {"SHAPE_AREA", "0.0012"}};
  f.geometry_ = geo_polygon{square_ring(x, y, 1.)};
  return f;
}

}  // namespace

TEST_CASE("process_feature") {
  process_settings s;

  SECTION("properties are reduced to id and label") {
    auto f = make_feature("05001", "MEDELLIN");
    auto const m = process_feature(f, 0, s);

    CHECK(f.meta_ == std::vector<metadata>{{"id", "05001"},
                                           {"label", "MEDELLIN"}});
    CHECK(m.features_out_ == 1);
    CHECK(m.points_before_ == 6);
    CHECK(m.points_after_ == 5);
    CHECK(m.rings_.rings_ == 1);

    auto const& outer = std::get<geo_polygon>(f.geometry_).outer();
    CHECK(outer ==
          geo_ring{{-74., 4.}, {-74., 5.}, {-73., 5.}, {-73., 4.}, {-74., 4.}});
  }

  SECTION("custom property names") {
    s.id_field_ = "code";
    s.label_field_ = "name";
    s.id_key_ = "k";
    s.label_key_ = "n";

    feature f;
    f.meta_ = {{"name", "Bogota"}, {"code", "11001"}};
    f.geometry_ = geo_polygon{square_ring(0., 0., 1.)};
    process_feature(f, 3, s);

    CHECK(f.meta_ == std::vector<metadata>{{"k", "11001"}, {"n", "Bogota"}});
  }

  SECTION("missing identifier") {
    feature f;
    f.meta_ = {{"MPIO_CNMBR", "MEDELLIN"}};
    f.geometry_ = geo_polygon{square_ring(0., 0., 1.)};

    try {
      process_feature(f, 7, s);
      FAIL("missing_property expected");
    } catch (missing_property const& e) {
      CHECK(e.feature_idx_ == 7);
      CHECK(e.field_ == "DPTOMPIO");
    }
    CHECK(f.meta_.size() == 1);
  }

  SECTION("empty label") {
    auto f = make_feature("05001", "");
    CHECK_THROWS_AS(process_feature(f, 0, s), missing_property);
  }

  SECTION("unsupported geometry") {
    auto f = make_feature("05001", "MEDELLIN");
    f.geometry_ = geo_invalid{"Point", "only Polygon and MultiPolygon"};
    CHECK_THROWS_AS(process_feature(f, 0, s), malformed_geometry);
    CHECK(f.meta_.size() == 4);
  }
}

TEST_CASE("process_collection") {
  process_settings s;

  SECTION("order is preserved") {
    feature_collection fc;
    for (auto i = 0; i < 1000; ++i) {
      fc.features_.push_back(
          make_feature(std::to_string(i), "label " + std::to_string(i),
                       -75. + i * 0.01, 4.));
    }

    s.threads_ = 4;
    auto const m = process_collection(fc, s);

    CHECK(m.features_in_ == 1000);
    CHECK(m.features_out_ == 1000);
    CHECK(m.points_before_ == 6000);
    CHECK(m.points_after_ == 5000);
    CHECK(m.rings_.rings_ == 1000);
    CHECK(m.skipped_.empty());
    CHECK(reduction_percent(m) == Approx(100. / 6.));

    REQUIRE(fc.features_.size() == 1000);
    for (auto i = 0ULL; i < fc.features_.size(); ++i) {
      CHECK(find_meta(fc.features_[i], "id") == std::to_string(i));
    }
  }

  SECTION("empty collection") {
    feature_collection fc;
    auto const m = process_collection(fc, s);
    CHECK(fc.features_.empty());
    CHECK(m.features_in_ == 0);
    CHECK(m.features_out_ == 0);
    CHECK(reduction_percent(m) == 0.);
  }

  SECTION("strict mode reports the first bad feature") {
    feature_collection fc;
    for (auto i = 0; i < 100; ++i) {
      fc.features_.push_back(make_feature(std::to_string(i), "x"));
    }
    fc.features_[80].meta_.clear();
    fc.features_[42].meta_.erase(begin(fc.features_[42].meta_));

    s.threads_ = 8;
    try {
      process_collection(fc, s);
      FAIL("missing_property expected");
    } catch (missing_property const& e) {
      CHECK(e.feature_idx_ == 42);
    }
  }

  SECTION("strict failure leaves the collection unchanged") {
    feature_collection fc;
    for (auto i = 0; i < 3; ++i) {
      fc.features_.push_back(make_feature(std::to_string(i), "x"));
    }
    fc.features_[2].meta_.clear();
    auto const before = fc.features_;

    s.threads_ = 1;
    CHECK_THROWS_AS(process_collection(fc, s), missing_property);

    REQUIRE(fc.features_.size() == 3);
    for (auto i = 0ULL; i < fc.features_.size(); ++i) {
      CHECK(fc.features_[i].meta_ == before[i].meta_);
      CHECK(std::get<geo_polygon>(fc.features_[i].geometry_).outer() ==
            std::get<geo_polygon>(before[i].geometry_).outer());
    }
    CHECK(find_meta(fc.features_[0], "DPTOMPIO") == "0");
    CHECK(!find_meta(fc.features_[0], "id").has_value());
  }

  SECTION("lenient mode skips bad features") {
    feature_collection fc;
    for (auto i = 0; i < 50; ++i) {
      fc.features_.push_back(make_feature(std::to_string(i), "x"));
    }
    fc.features_[3].geometry_ = geo_invalid{"LineString", "unsupported"};
    fc.features_[20].meta_.erase(begin(fc.features_[20].meta_));

    s.policy_ = error_policy::lenient;
    s.threads_ = 3;
    auto const m = process_collection(fc, s);

    CHECK(m.features_in_ == 50);
    CHECK(m.features_out_ == 48);
    REQUIRE(fc.features_.size() == 48);

    REQUIRE(m.skipped_.size() == 2);
    CHECK(m.skipped_[0].idx_ == 3);
    CHECK(m.skipped_[0].id_ == "3");
    CHECK(m.skipped_[0].reason_.find("LineString") != std::string::npos);
    CHECK(m.skipped_[1].idx_ == 20);
    CHECK(m.skipped_[1].id_.empty());
    CHECK(m.skipped_[1].reason_.find("DPTOMPIO") != std::string::npos);

    CHECK(find_meta(fc.features_[2], "id") == "2");
    CHECK(find_meta(fc.features_[3], "id") == "4");
    CHECK(find_meta(fc.features_[19], "id") == "21");
  }
}

TEST_CASE("metrics merge") {
  metrics a;
  a.features_in_ = 2;
  a.points_before_ = 10;
  a.skipped_.push_back({5, "05005", "bad"});

  metrics b;
  b.features_in_ = 3;
  b.points_before_ = 7;
  b.rings_.fallback_ = 1;
  b.skipped_.push_back({1, "05001", "worse"});

  a += b;
  CHECK(a.features_in_ == 5);
  CHECK(a.points_before_ == 17);
  CHECK(a.rings_.fallback_ == 1);
  REQUIRE(a.skipped_.size() == 2);
  CHECK(a.skipped_[0].idx_ == 5);
  CHECK(a.skipped_[1].idx_ == 1);
}

TEST_CASE("verify_settings") {
  process_settings s;
  CHECK_NOTHROW(verify_settings(s));

  SECTION("tolerance") {
    s.tolerance_ = 0.;
    CHECK_THROWS(verify_settings(s));
    s.tolerance_ = -1.;
    CHECK_THROWS(verify_settings(s));
  }

  SECTION("precision") {
    s.precision_ = kMaxPrecision + 1;
    CHECK_THROWS(verify_settings(s));
  }

  SECTION("keys") {
    s.label_key_ = s.id_key_;
    CHECK_THROWS(verify_settings(s));
  }

  SECTION("fields") {
    s.id_field_.clear();
    CHECK_THROWS(verify_settings(s));
  }

  SECTION("collection is checked before processing") {
    s.tolerance_ = -1.;
    feature_collection fc;
    fc.features_.push_back(make_feature("1", "x"));
    CHECK_THROWS(process_collection(fc, s));
    CHECK(fc.features_[0].meta_.size() == 4);
  }
}
