#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vclimb/combo.hpp>

using Catch::Approx;
using namespace vclimb;

static ComboConfig short_window() {
  ComboConfig c;
  c.window_ms = 600.0;
  c.step = 0.2;
  c.max_multiplier = 5.0;
  return c;
}

static ComboEvent ev(double t, double v, bool eligible = true) {
  ComboEvent e;
  e.timestamp_ms = t;
  e.base_value = v;
  e.chain_eligible = eligible;
  e.source = ComboSource::WallBounce;
  return e;
}

TEST_CASE("combo_multiplier grows by step and caps") {
  ComboConfig c = short_window();
  REQUIRE(combo_multiplier(0, c) == Approx(1.0));
  REQUIRE(combo_multiplier(1, c) == Approx(1.0));
  REQUIRE(combo_multiplier(3, c) == Approx(1.4));
  REQUIRE(combo_multiplier(21, c) == Approx(5.0));
  REQUIRE(combo_multiplier(200, c) == Approx(5.0));

  double prev = 0.0;
  for (std::size_t n = 0; n < 40; ++n) {
    const double m = combo_multiplier(n, c);
    REQUIRE(m >= prev);
    REQUIRE(m >= 1.0);
    REQUIRE(m <= c.max_multiplier);
    prev = m;
  }
}

TEST_CASE("Three events inside the window score each at its multiplier") {
  ComboEngine e(short_window());
  REQUIRE_FALSE(e.record_event(ev(0.0, 10.0)));
  REQUIRE_FALSE(e.record_event(ev(300.0, 10.0)));
  REQUIRE_FALSE(e.record_event(ev(550.0, 10.0)));

  REQUIRE(e.current_length() == 3);
  REQUIRE(e.current_multiplier() == Approx(1.4));
  // 10*1.0 + 10*1.2 + 10*1.4
  REQUIRE(e.current_chain_total() == Approx(36.0));

  auto s = e.finish_session();
  REQUIRE(s);
  REQUIRE(s->length == 3);
  REQUIRE(s->score == Approx(36.0));
  REQUIRE(s->end == ChainEnd::SessionEnd);

  auto st = e.get_stats();
  REQUIRE(st.total_score == Approx(36.0));
  REQUIRE(st.chain_score == Approx(36.0));
  REQUIRE(st.longest_chain == 3);
  REQUIRE(st.total_chains == 1);
}

TEST_CASE("Idle check closes a lapsed chain once") {
  ComboEngine e(short_window());
  e.record_event(ev(0.0, 10.0));
  e.record_event(ev(300.0, 10.0));
  e.record_event(ev(550.0, 10.0));

  REQUIRE_FALSE(e.update(1150.0));        // exactly at the window edge
  auto s = e.update(1151.0);
  REQUIRE(s);
  REQUIRE(s->end == ChainEnd::Lapsed);
  REQUIRE(s->score == Approx(36.0));
  REQUIRE_FALSE(e.update(5000.0));
  REQUIRE_FALSE(e.has_open_chain());
  REQUIRE(e.get_stats().total_score == Approx(36.0));
}

TEST_CASE("An event after a lapse closes the old chain and starts a new one") {
  ComboEngine e(short_window());
  e.record_event(ev(0.0, 10.0));
  e.record_event(ev(100.0, 10.0));

  auto closed = e.record_event(ev(1000.0, 50.0));
  REQUIRE(closed);
  REQUIRE(closed->length == 2);
  REQUIRE(closed->score == Approx(22.0));

  REQUIRE(e.current_length() == 1);
  REQUIRE(e.current_chain_total() == Approx(50.0));
  REQUIRE(e.get_stats().total_score == Approx(22.0));
}

TEST_CASE("Non-eligible events are credited at face value") {
  ComboEngine e(short_window());
  e.record_event(ev(0.0, 10.0));
  REQUIRE_FALSE(e.record_event(ev(100.0, 1500.0, false)));

  REQUIRE(e.current_length() == 1);       // chain unaffected
  auto st = e.get_stats();
  REQUIRE(st.bonus_score == Approx(1500.0));
  REQUIRE(st.total_score == Approx(1500.0));

  // The bonus does not refresh the window either
  REQUIRE(e.update(601.0));
}

TEST_CASE("cancel_for_reset drops the open chain without crediting it") {
  ComboEngine e(short_window());
  e.record_event(ev(0.0, 10.0));
  e.record_event(ev(100.0, 10.0));
  e.update(5000.0);
  e.record_event(ev(6000.0, 10.0));

  auto dropped = e.cancel_for_reset();
  REQUIRE(dropped);
  REQUIRE(dropped->end == ChainEnd::Reset);
  REQUIRE(dropped->score == Approx(0.0));
  REQUIRE(dropped->length == 1);

  auto st = e.get_stats();
  REQUIRE(st.total_score == Approx(0.0));
  REQUIRE(st.total_chains == 0);
  REQUIRE_FALSE(e.has_open_chain());
  REQUIRE_FALSE(e.cancel_for_reset());
}

TEST_CASE("time_remaining counts down from the last event") {
  ComboEngine e(short_window());
  REQUIRE(e.time_remaining(0.0) == Approx(0.0));
  e.record_event(ev(1000.0, 10.0));
  REQUIRE(e.time_remaining(1200.0) == Approx(400.0));
  REQUIRE(e.time_remaining(2000.0) == Approx(0.0));
}

TEST_CASE("finish_session with no chain is a no-op") {
  ComboEngine e(short_window());
  REQUIRE_FALSE(e.finish_session());
  REQUIRE(e.get_stats().total_score == Approx(0.0));
}
