#include <rcr/telemetry.hpp>

namespace rcr {

void write_ride_summary_csv(std::ostream& out, const RideSummary& s) {
  out << "track,ride_time,laps,last_lap,best_lap,top_speed,lift_time\n";
  out << s.track << ","
      << s.ride_time << ","
      << (unsigned long long)s.laps << ","
      << s.last_lap << ","
      << s.best_lap << ","
      << s.top_speed << ","
      << s.lift_time << "\n";
}

} // namespace rcr
