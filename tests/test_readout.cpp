#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>

#include <chronograph/engine.hpp>
#include <chronograph/readout.hpp>

using namespace chronograph;
using namespace std::chrono_literals;

TEST_CASE("format_clock_readout prints 24h wall time") {
  REQUIRE(format_clock_readout(make_instant(2024, 1, 1, 3, 15, 30, 500000)) == "03:15:30");
  REQUIRE(format_clock_readout(make_instant(2024, 1, 1, 23, 5, 9)) == "23:05:09");
  REQUIRE(format_clock_readout(make_instant(2024, 1, 1)) == "00:00:00");
}

TEST_CASE("format_stopwatch_readout prints elapsed with centiseconds") {
  SECTION("zero") {
    REQUIRE(format_stopwatch_readout(Duration::zero()) == "00:00:00.00");
  }
  SECTION("truncates below a centisecond") {
    REQUIRE(format_stopwatch_readout(Duration{1'239'999}) == "00:00:01.23");
  }
  SECTION("hours do not wrap") {
    REQUIRE(format_stopwatch_readout(25h + 1min + 2s + 990ms) == "25:01:02.99");
  }
  SECTION("negative durations are not shown") {
    REQUIRE(format_stopwatch_readout(-1s) == "--:--:--.--");
  }
}

TEST_CASE("readout follows the engine mode") {
  auto clock = std::make_shared<ManualTimeSource>(make_instant(2024, 1, 1, 14, 30, 0));
  ChronographEngine engine(clock);
  REQUIRE(readout(engine) == "14:30:00");

  engine.start_stopwatch();
  clock->advance(61s + 500ms);
  REQUIRE(readout(engine) == "00:01:01.50");
}

TEST_CASE("control_state mirrors the stopwatch lifecycle") {
  auto clock = std::make_shared<ManualTimeSource>(make_instant(2024, 1, 1, 8, 0, 0));
  ChronographEngine engine(clock);

  SECTION("clock mode offers no controls") {
    const ControlState st = control_state(engine);
    REQUIRE_FALSE(st.start_enabled);
    REQUIRE_FALSE(st.stop_enabled);
    REQUIRE_FALSE(st.reset_enabled);
    REQUIRE(std::string(st.start_label) == "Start");
  }

  SECTION("fresh stopwatch can only start") {
    engine.set_mode(Mode::Stopwatch);
    const ControlState st = control_state(engine);
    REQUIRE(st.start_enabled);
    REQUIRE_FALSE(st.stop_enabled);
    REQUIRE_FALSE(st.reset_enabled);
    REQUIRE(std::string(st.start_label) == "Start");
  }

  SECTION("running stopwatch can stop and reset") {
    engine.start_stopwatch();
    clock->advance(3s);
    const ControlState st = control_state(engine);
    REQUIRE_FALSE(st.start_enabled);
    REQUIRE(st.stop_enabled);
    REQUIRE(st.reset_enabled);
  }

  SECTION("stopped with time on it offers resume") {
    engine.start_stopwatch();
    clock->advance(3s);
    engine.stop_stopwatch();
    const ControlState st = control_state(engine);
    REQUIRE(st.start_enabled);
    REQUIRE_FALSE(st.stop_enabled);
    REQUIRE(st.reset_enabled);
    REQUIRE(std::string(st.start_label) == "Resume");
  }
}
