#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <rcr/ride.hpp>

namespace rcr {

struct RideSummary {
  std::string track;
  double ride_time = 0.0;      // seconds riding
  std::uint64_t laps = 0;      // completed laps
  double last_lap = -1.0;      // -1 = none yet
  double best_lap = -1.0;
  double top_speed = 0.0;
  double lift_time = 0.0;      // seconds spent on the chain lift
};

// Accumulates ride statistics from engine frame results.
class RideTelemetry {
public:
  void reset() { *this = RideTelemetry{}; }

  void update(const FrameResult& r) {
    if (r.status != FrameStatus::Advanced) return;
    ride_time_ += r.dt;
    lap_time_  += r.dt;
    speed_ = r.speed;
    if (r.speed > top_speed_) top_speed_ = r.speed;
    if (r.phase == RidePhase::ChainLift) lift_time_ += r.dt;

    if (r.lap_completed) {
      ++laps_;
      last_lap_ = lap_time_;
      if (best_lap_ < 0.0 || lap_time_ < best_lap_) best_lap_ = lap_time_;
      lap_time_ = 0.0;
    }
  }

  RideSummary summary(const std::string& track) const {
    return RideSummary{track, ride_time_, laps_, last_lap_, best_lap_, top_speed_, lift_time_};
  }

  double speed() const { return speed_; }
  double top_speed() const { return top_speed_; }
  double ride_time() const { return ride_time_; }
  double lap_time() const { return lap_time_; }
  double last_lap() const { return last_lap_; }
  double best_lap() const { return best_lap_; }
  double lift_time() const { return lift_time_; }
  std::uint64_t laps() const { return laps_; }

private:
  double ride_time_{0.0};
  double lap_time_{0.0};
  double last_lap_{-1.0};
  double best_lap_{-1.0};
  double speed_{0.0};
  double top_speed_{0.0};
  double lift_time_{0.0};
  std::uint64_t laps_{0};
};

// Header row plus one data row.
void write_ride_summary_csv(std::ostream& out, const RideSummary& s);

} // namespace rcr
