#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>

#include <f1ml/event_csv.hpp>

using Catch::Approx;
using namespace f1ml;

static const char* kHistoryCsv = R"(# season results
year,round_number,driver_code,driver_number,constructor,circuit_name,country,event_name,grid_position,qualifying_position,race_position,points,dnf,avg_air_temp,max_rainfall,had_rain
2023,1,VER,1,Red Bull Racing,Bahrain,Bahrain,Bahrain Grand Prix,1,1,1,25,False,27.5,0.0,False
2023,1,HAM,44,Mercedes,Bahrain,Bahrain,Bahrain Grand Prix,7,7,5,10,False,27.5,0.0,False
2023,1,ALO,14,Aston Martin,Bahrain,Bahrain,Bahrain Grand Prix,5,5,nan,0,True,27.5,0.0,False

2023,2,VER,1,Red Bull Racing,Jeddah,Saudi Arabia,"Saudi Arabian Grand Prix, Jeddah",15,15,2,18,False,nan,,
,3,LEC,16,Ferrari,Melbourne,Australia,Australian Grand Prix,2,2,3,15,False,20,0,False
2023,3,SAI,55,Ferrari,Melbourne,Australia,Australian Grand Prix,fast,5,4,12,False,20,0,False
)";

TEST_CASE("Historical CSV loads valid rows and skips broken ones") {
  std::istringstream ss(kHistoryCsv);
  const auto events = event_table_from_csv_stream(ss);
  REQUIRE(events.size() == 4);

  const auto& ver = events[0];
  REQUIRE(ver.key() == SeasonRound{2023, 1});
  REQUIRE(ver.driver_code == "VER");
  REQUIRE(ver.driver_number == 1);
  REQUIRE(ver.constructor == "Red Bull Racing");
  REQUIRE(ver.race_position.value() == Approx(1.0));
  REQUIRE(ver.points == Approx(25.0));
  REQUIRE(ver.avg_air_temp.value() == Approx(27.5));

  SECTION("winner is derived from race position when absent") {
    REQUIRE(events[0].winner);
    REQUIRE_FALSE(events[1].winner);
  }

  SECTION("DNF rows keep a missing position") {
    const auto& alo = events[2];
    REQUIRE(alo.dnf);
    REQUIRE_FALSE(alo.race_position.has_value());
    REQUIRE_FALSE(alo.winner);
  }

  SECTION("quoted fields and empty cells") {
    const auto& jed = events[3];
    REQUIRE(jed.event_name == "Saudi Arabian Grand Prix, Jeddah");
    REQUIRE_FALSE(jed.avg_air_temp.has_value());
    REQUIRE_FALSE(jed.max_rainfall.has_value());
    REQUIRE_FALSE(jed.had_rain);
  }
}

TEST_CASE("Column order does not matter") {
  std::istringstream ss(
    "driver_code,round_number,year,race_position,points\n"
    "NOR,7,2024,1,25\n");
  const auto events = event_table_from_csv_stream(ss);
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].season == 2024);
  REQUIRE(events[0].round == 7);
  REQUIRE(events[0].winner);
}

TEST_CASE("Missing file yields nullopt") {
  REQUIRE_FALSE(load_event_table_csv("/nonexistent/f1ml/history.csv").has_value());
  REQUIRE_FALSE(load_target_event_csv("/nonexistent/f1ml/event.csv").has_value());
}

TEST_CASE("Pre-race CSV keeps drivers with malformed cells") {
  std::istringstream ss(R"(year,round_number,driver_code,constructor,circuit_name,grid_position,qualifying_position,q3_time,max_rainfall,race_position
2024,5,VER,Red Bull Racing,Miami,1,1,87.241,0.0,1
2024,5,NOR,McLaren,Miami,abc,2,87.5,,2
2024,6,LEC,Ferrari,Imola,3,3,88.0,0.0,
2024,5,,Haas,Miami,15,15,,,
)");
  const auto ev = target_event_from_csv_stream(ss);
  REQUIRE(ev.has_value());
  REQUIRE(ev->key == SeasonRound{2024, 5});
  REQUIRE(ev->drivers.size() == 2);

  const auto& nor = ev->drivers[1];
  REQUIRE(nor.driver_code == "NOR");
  REQUIRE_FALSE(nor.grid_position.has_value());
  REQUIRE(nor.qualifying_position.value() == Approx(2.0));
  REQUIRE_FALSE(nor.max_rainfall.has_value());
  REQUIRE_FALSE(nor.had_rain.has_value());
}

TEST_CASE("Pre-race CSV with no usable rows is nullopt") {
  std::istringstream ss("year,round_number,driver_code\n,,\n");
  REQUIRE_FALSE(target_event_from_csv_stream(ss).has_value());
}

TEST_CASE("Year and round cells must be whole numbers in int range") {
  std::istringstream ss(
    "year,round_number,driver_code,race_position,points\n"
    "inf,1,VER,1,25\n"
    "1e12,1,HAM,2,18\n"
    "2023.9,1,LEC,3,15\n"
    "2023,1.5,SAI,4,12\n"
    "2023.0,2,NOR,5,10\n");
  const auto events = event_table_from_csv_stream(ss);
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].driver_code == "NOR");
  REQUIRE(events[0].key() == SeasonRound{2023, 2});

  SECTION("the same rule applies to pre-race rows") {
    std::istringstream pre(
      "year,round_number,driver_code\n"
      "-inf,4,VER\n"
      "2024,4,HAM\n");
    const auto ev = target_event_from_csv_stream(pre);
    REQUIRE(ev.has_value());
    REQUIRE(ev->drivers.size() == 1);
    REQUIRE(ev->drivers[0].driver_code == "HAM");
  }
}
