#include <iostream>

#include "conf/configuration.h"
#include "conf/options_parser.h"

#include "choro/feature/process.h"
#include "choro/io/geojson.h"
#include "choro/util.h"

namespace choro {

struct simplify_settings : public conf::configuration {
  simplify_settings() : conf::configuration("choro-simplify options", "") {
    param(in_fname_, "in", "/path/to/municipalities.geojson");
    param(out_fname_, "out", "/path/to/simplified.geojson");
    param(tolerance_, "tolerance",
          "douglas-peucker tolerance in coordinate units (degrees)");
    param(precision_, "precision", "decimal digits kept per coordinate");
    param(id_field_, "id_field", "source property with the join key");
    param(label_field_, "label_field", "source property with the name");
    param(id_key_, "id_key", "output property name of the join key");
    param(label_key_, "label_key", "output property name of the name");
    param(strict_, "strict",
          "true: abort on the first bad feature, false: skip and report it");
    param(threads_, "threads", "worker threads (0: hardware concurrency)");
  }

  process_settings to_process_settings() const {
    process_settings s;
    s.tolerance_ = tolerance_;
    s.precision_ = precision_;
    s.id_field_ = id_field_;
    s.label_field_ = label_field_;
    s.id_key_ = id_key_;
    s.label_key_ = label_key_;
    s.policy_ = strict_ ? error_policy::strict : error_policy::lenient;
    s.threads_ = threads_;
    return s;
  }

  std::string in_fname_{"municipalities.geojson"};
  std::string out_fname_{"simplified.geojson"};
  double tolerance_{0.008};
  unsigned precision_{3};
  std::string id_field_{"DPTOMPIO"};
  std::string label_field_{"MPIO_CNMBR"};
  std::string id_key_{"id"};
  std::string label_key_{"label"};
  bool strict_{true};
  unsigned threads_{0};
};

int run_choro_simplify(int argc, char const** argv) {
  simplify_settings opt;

  try {
    conf::options_parser parser({&opt});
    parser.read_command_line_args(argc, argv, false);

    if (parser.help() || parser.version()) {
      std::cout << "choro-simplify\n\n";
      parser.print_help(std::cout);
      return 0;
    }

    parser.read_configuration_file(false);
    parser.print_used(std::cout);

    verify_settings(opt.to_process_settings());
  } catch (std::exception const& e) {
    std::cout << "options error: " << e.what() << "\n";
    return 1;
  }

  feature_collection fc;
  {
    scoped_timer t{"load geojson"};
    fc = load_geojson(opt.in_fname_);
  }
  t_log("loaded {} features", fc.features_.size());

  metrics m;
  {
    scoped_timer t{"simplify"};
    m = process_collection(fc, opt.to_process_settings());
  }
  report(m);

  auto const size = save_geojson(fc, opt.out_fname_);
  t_log("wrote {} ({:.1f} MB)", opt.out_fname_, size / 1e6);

  return 0;
}

}  // namespace choro

int main(int argc, char const** argv) {
  try {
    return choro::run_choro_simplify(argc, argv);
  } catch (std::exception const& e) {
    choro::t_log("exception caught: {}", e.what());
    return 1;
  }
}
