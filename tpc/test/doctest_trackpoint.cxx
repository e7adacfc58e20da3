#include <doctest/doctest.h>
#include "MatchaTpc/TrackPoint.h"
#include "MatchaTpc/DriftConfig.h"
#include "MatchaUtil/Logging.h"

#include <spdlog/sinks/ostream_sink.h>

#include <cmath>
#include <sstream>

using namespace Matcha;
using spdlog::debug;

TEST_CASE("tpc trackpoint construct")
{
    TrackPoint tp(7, -300.0, 10.0, 20.0, 0.0, 0.6, 0.8);
    CHECK(tp.track_id() == 7);
    CHECK(tp.position_x() == -300.0);
    CHECK(tp.position_y() == 10.0);
    CHECK(tp.position_z() == 20.0);
    CHECK(tp.direction_x() == 0.0);
    CHECK(tp.direction_y() == 0.6);
    CHECK(tp.direction_z() == 0.8);
    CHECK(tp.region() == TpcRegion::WestVolume);
    REQUIRE(tp.has_drift_direction());
    CHECK(*tp.drift_direction() == +1);

    TrackPoint gap(8, 0.0, 0, 0, 1, 0, 0);
    CHECK(gap.region() == TpcRegion::BetweenVolumes);
    CHECK(!gap.has_drift_direction());
    CHECK(!gap.drift_direction());

    TrackPoint east(9, 300.0, 0, 0, 1, 0, 0);
    CHECK(*east.drift_direction() == -1);
}

TEST_CASE("tpc trackpoint setters")
{
    TrackPoint tp(1, 100.0, 0, 0, 0, 0, 1);
    tp.set_track_id(2);
    tp.set_position_y(1.5);
    tp.set_position_z(2.5);
    tp.set_direction_x(0.1);
    tp.set_direction_y(0.2);
    tp.set_direction_z(0.3);
    CHECK(tp.track_id() == 2);
    CHECK(tp.position_y() == 1.5);
    CHECK(tp.position_z() == 2.5);
    CHECK(tp.direction_x() == 0.1);
    CHECK(tp.direction_y() == 0.2);
    CHECK(tp.direction_z() == 0.3);

    // setting x keeps the old classification
    tp.set_position_x(0.0);
    CHECK(tp.position_x() == 0.0);
    CHECK(tp.region() == TpcRegion::WestFacingEastVolume);
    CHECK(*tp.drift_direction() == +1);

    tp.reclassify();
    CHECK(tp.region() == TpcRegion::BetweenVolumes);
    CHECK(!tp.has_drift_direction());

    tp.set_drift_direction(-1);
    CHECK(*tp.drift_direction() == -1);
    tp.set_drift_direction(std::nullopt);
    CHECK(!tp.has_drift_direction());
}

TEST_CASE("tpc trackpoint shift")
{
    SUBCASE("west drifting") {
        TrackPoint tp(1, 100.0, 0, 0, 0, 0, 1);
        REQUIRE(*tp.drift_direction() == +1);
        tp.shift_position_x(2.0, 0.5);
        CHECK(tp.position_x() == doctest::Approx(101.0));
    }
    SUBCASE("east drifting via override") {
        TrackPoint tp(1, 100.0, 0, 0, 0, 0, 1);
        tp.set_drift_direction(-1);
        tp.shift_position_x(2.0, 0.5);
        CHECK(tp.position_x() == doctest::Approx(99.0));
    }
    SUBCASE("east drifting by region") {
        TrackPoint tp(1, 300.0, 0, 0, 0, 0, 1);
        tp.shift_position_x(2.0, 0.5);
        CHECK(tp.position_x() == doctest::Approx(299.0));
    }
    SUBCASE("negative t0") {
        TrackPoint tp(1, 100.0, 0, 0, 0, 0, 1);
        tp.shift_position_x(-4.0, 0.5);
        CHECK(tp.position_x() == doctest::Approx(98.0));
    }
    SUBCASE("shifts compose") {
        TrackPoint tp(1, 0.0, 0, 0, 0, 0, 1);
        tp.set_drift_direction(+1);
        tp.shift_position_x(1.0, 1.0);
        tp.shift_position_x(1.0, 1.0);
        CHECK(tp.position_x() == doctest::Approx(2.0));
    }
    SUBCASE("shift keeps classification") {
        TrackPoint tp(1, 200.0, 0, 0, 0, 0, 1);
        tp.shift_position_x(100.0, 1.0);
        CHECK(tp.position_x() == doctest::Approx(300.0));
        CHECK(tp.region() == TpcRegion::WestFacingEastVolume);
        CHECK(*tp.drift_direction() == +1);
    }
}

TEST_CASE("tpc trackpoint shift without drift direction")
{
    TrackPoint tp(3, 0.0, 0, 0, 0, 0, 1);
    REQUIRE(!tp.has_drift_direction());
    CHECK_THROWS_AS(tp.shift_position_x(1.0, 1.0), UndefinedDriftDirection);
    CHECK_THROWS_AS(tp.shift_position_x(1.0, 1.0), ValueError);
    CHECK(tp.position_x() == 0.0);

    TrackPoint outside(4, 1000.0, 0, 0, 0, 0, 1);
    CHECK_THROWS_AS(outside.shift_position_x(1.0, 1.0), UndefinedDriftDirection);
    CHECK(outside.position_x() == 1000.0);
}

TEST_CASE("tpc trackpoint shift with drift config")
{
    TrackPoint tp(1, 100.0, 0, 0, 0, 0, 1);

    DriftConfig unset;
    CHECK_THROWS_AS(tp.shift_position_x(2.0, unset), ConfigurationError);
    CHECK(tp.position_x() == 100.0);

    DriftConfig drift(0.5);
    tp.shift_position_x(2.0, drift);
    CHECK(tp.position_x() == doctest::Approx(101.0));
}

TEST_CASE("tpc trackpoint shift is logged")
{
    TrackPoint tp(7, -300.0, 0, 0, 1, 0, 0);
    tp.shift_position_x(1.0, 0.5);

    // the first shift made the "tpc" logger
    auto log = spdlog::get("tpc");
    REQUIRE(log);
    CHECK(Log::logger("tpc") == log);

    std::ostringstream ss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(ss);
    log->sinks().push_back(sink);
    const auto lvl = log->level();
    log->set_level(spdlog::level::debug);

    tp.shift_position_x(1.0, 0.5);
    log->flush();
    CHECK(ss.str().find("track 7 shift x") != std::string::npos);

    log->sinks().pop_back();
    log->set_level(lvl);
}

TEST_CASE("tpc trackpoint with shifted x")
{
    TrackPoint tp(5, 200.0, 1, 2, 0, 0, 1);
    auto moved = tp.with_shifted_x(20.0, 1.0);

    CHECK(tp.position_x() == 200.0);
    CHECK(tp.region() == TpcRegion::WestFacingEastVolume);

    CHECK(moved.track_id() == 5);
    CHECK(moved.position_x() == doctest::Approx(220.0));
    CHECK(moved.position_y() == 1);
    CHECK(moved.region() == TpcRegion::EastVolume);
    CHECK(*moved.drift_direction() == -1);

    TrackPoint gap(6, 0.0, 0, 0, 0, 0, 1);
    CHECK_THROWS_AS(gap.with_shifted_x(1.0, 1.0), UndefinedDriftDirection);
}

TEST_CASE("tpc trackpoint custom boundaries")
{
    const tpc_boundaries_t small = {-3, -2, -1, 1, 2, 3};
    TrackPoint tp(1, 2.5, 0, 0, 1, 0, 0, small);
    CHECK(tp.region() == TpcRegion::EastVolume);
    CHECK(tp.boundaries() == small);
    tp.shift_position_x(1.0, 1.0);
    CHECK(tp.position_x() == doctest::Approx(1.5));
    tp.reclassify();
    CHECK(tp.region() == TpcRegion::WestFacingEastVolume);
}

TEST_CASE("tpc trackpoint json")
{
    TrackPoint tp(11, -150.0, 5.0, 6.0, 1.0, 0.0, 0.0);
    auto jpt = tp.to_json();
    CHECK(jpt["track_id"].asInt() == 11);
    CHECK(jpt["position"][0].asDouble() == -150.0);
    CHECK(jpt["direction"][0].asDouble() == 1.0);
    CHECK(jpt["drift_direction"].asInt() == -1);
    CHECK(jpt["region"].asString() == "WE");

    auto back = TrackPoint::from_json(jpt);
    CHECK(back.track_id() == 11);
    CHECK(back.position_z() == 6.0);
    CHECK(back.region() == TpcRegion::EastFacingWestVolume);

    TrackPoint gap(12, 0.0, 0, 0, 0, 0, 1);
    CHECK(gap.to_json()["drift_direction"].isNull());

    Configuration bad = jpt;
    bad["position"].resize(2);
    CHECK_THROWS_AS(TrackPoint::from_json(bad), ConfigurationError);
    bad = jpt;
    bad["direction"][1] = "up";
    CHECK_THROWS_AS(TrackPoint::from_json(bad), ConfigurationError);
    bad = jpt;
    bad.removeMember("track_id");
    CHECK_THROWS_AS(TrackPoint::from_json(bad), ConfigurationError);
    CHECK_THROWS_AS(TrackPoint::from_json(Configuration(Json::arrayValue)), ConfigurationError);
}

TEST_CASE("tpc trackpoint printing")
{
    TrackPoint tp(13, 300.0, 0, 0, 0, 0, 1);
    std::stringstream ss;
    ss << tp;
    CHECK(ss.str().find("track:13") != std::string::npos);
    CHECK(ss.str().find("EastVolume") != std::string::npos);
    CHECK(ss.str().find("drift:-1") != std::string::npos);
    debug("{}", tp);

    TrackPoint gap(14, 0.0, 0, 0, 0, 0, 1);
    CHECK(fmt::format("{}", gap).find("drift:none") != std::string::npos);
}
