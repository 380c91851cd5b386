#include <raylib.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <rcr/config.hpp>
#include <rcr/track_io.hpp>
#include <rcr/viewer/app.hpp>

using namespace rcr;

namespace {

void print_usage() {
  TraceLog(LOG_INFO, "usage: rcr_viewer [--config ride.cfg] [track.csv]");
}

} // namespace

// Usage: rcr_viewer [--config ride.cfg] [track.csv]
// Without a track CSV the preset named by the config's "track" key is ridden.
int main(int argc, char** argv) {
  std::string config_path;
  std::string track_path;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        TraceLog(LOG_ERROR, "RCR: %s needs a file argument", arg.c_str());
        print_usage();
        return 1;
      }
      config_path = argv[++i];
    } else if (track_path.empty() && !arg.empty() && arg[0] != '-') {
      track_path = arg;
    } else {
      TraceLog(LOG_ERROR, "RCR: unexpected argument '%s'", arg.c_str());
      print_usage();
      return 1;
    }
  }

  RideConfig cfg{};
  if (!config_path.empty()) {
    std::vector<std::string> warnings;
    auto loaded = load_ride_config(config_path, cfg, &warnings);
    if (!loaded) {
      TraceLog(LOG_ERROR, "RCR: cannot open config %s", config_path.c_str());
      return 1;
    }
    for (const auto& w : warnings) TraceLog(LOG_WARNING, "RCR: %s: %s", config_path.c_str(), w.c_str());
    cfg = *loaded;
  }

  std::optional<std::vector<TrackPoint>> track;
  if (!track_path.empty()) {
    track = load_track_csv(track_path);
    if (!track) {
      TraceLog(LOG_ERROR, "RCR: cannot open track %s", track_path.c_str());
      return 1;
    }
    TraceLog(LOG_INFO, "RCR: riding %s instead of preset '%s'", track_path.c_str(), cfg.track.c_str());
  }

  ViewerApp app(cfg, std::move(track));
  return app.run();
}
