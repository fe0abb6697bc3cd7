#include <gtest/gtest.h>
#include "oncourt/records.hpp"
#include "game_fixtures.hpp"
#include <cstdint>
#include <limits>

using namespace oncourt;
using json = nlohmann::json;

namespace {

json pbp_row() {
    return {
        {"game_id", "0021900001"},
        {"eventnum", 12},
        {"period", 1},
        {"pctimestring", "4:00"},
        {"eventmsgtype", 2},
        {"player1_id", 203954},
        {"player1_team_id", 1610612744},
        {"player2_id", 0},
        {"player2_team_id", nullptr},
        {"player3_id", 1628369.0},
        {"player3_team_id", 1610612747.0},
    };
}

} // namespace

TEST(ParseEvent, ReadsPlayByPlayRow) {
    auto e = parse_event(pbp_row());
    ASSERT_TRUE(e.has_value()) << e.error().message;

    EXPECT_EQ(e->game_id, 21900001);
    EXPECT_EQ(e->event_num, 12);
    EXPECT_EQ(e->period, 1);
    EXPECT_EQ(e->clock, "4:00");
    EXPECT_EQ(e->type, EventType::MissedShot);
    EXPECT_TRUE(e->is_game_action());

    ASSERT_TRUE(e->participants[0].has_value());
    EXPECT_EQ(e->participants[0]->player_id, 203954);
    EXPECT_EQ(e->participants[0]->team_id, 1610612744);
    // A zero id is an empty slot.
    EXPECT_FALSE(e->participants[1].has_value());
    ASSERT_TRUE(e->participants[2].has_value());
    EXPECT_EQ(e->participants[2]->player_id, 1628369);
    EXPECT_EQ(e->participants[2]->team_id, 1610612747);
}

TEST(ParseEvent, KeepsUnlistedEventTypes) {
    auto row = pbp_row();
    row["eventmsgtype"] = 18;
    auto e = parse_event(row);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(e->is_game_action());
    EXPECT_FALSE(e->is_substitution());
    EXPECT_FALSE(e->is_period_end());
}

TEST(ParseEvent, EventNumberZeroIsValid) {
    auto row = pbp_row();
    row["eventnum"] = 0;
    auto e = parse_event(row);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->event_num, 0);
}

TEST(ParseEvent, MissingParticipantTeamIsTolerated) {
    auto row = pbp_row();
    row.erase("player1_team_id");
    auto e = parse_event(row);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(e->participants[0]->team_id.has_value());
}

TEST(ParseEvent, MissingFieldsAreMalformed) {
    for (auto key : {"eventnum", "game_id", "period", "pctimestring", "eventmsgtype"}) {
        auto row = pbp_row();
        row.erase(key);
        auto e = parse_event(row);
        ASSERT_FALSE(e.has_value()) << key;
        EXPECT_EQ(e.error().kind, ErrorKind::MalformedRecord) << key;
    }

    auto row = pbp_row();
    row["pctimestring"] = 240;
    EXPECT_FALSE(parse_event(row).has_value());

    EXPECT_FALSE(parse_event(json::array()).has_value());
}

TEST(ParseEvent, OutOfRangeNumbersAreMalformed) {
    auto huge_period = pbp_row();
    huge_period["period"] = 1e12;
    EXPECT_FALSE(parse_event(huge_period).has_value());

    auto wide_type = pbp_row();
    wide_type["eventmsgtype"] = 4294967298LL;
    EXPECT_FALSE(parse_event(wide_type).has_value());

    auto half_period = pbp_row();
    half_period["period"] = 2.5;
    EXPECT_FALSE(parse_event(half_period).has_value());

    auto huge_id = pbp_row();
    huge_id["eventnum"] = 1e30;
    auto e = parse_event(huge_id);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.error().kind, ErrorKind::MalformedRecord);

    auto unsigned_id = pbp_row();
    unsigned_id["eventnum"] = std::numeric_limits<std::uint64_t>::max();
    EXPECT_FALSE(parse_event(unsigned_id).has_value());

    auto float_period = pbp_row();
    float_period["period"] = 3.0;
    ASSERT_TRUE(parse_event(float_period).has_value());
    EXPECT_EQ(parse_event(float_period)->period, 3);
}

TEST(ParseEvent, ErrorNamesEvent) {
    auto row = pbp_row();
    row.erase("period");
    auto e = parse_event(row);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.error().event_num, 12);
}

TEST(ParseEvents, StopsAtFirstBadRow) {
    auto bad = pbp_row();
    bad["eventnum"] = "twelve";
    auto rows = json::array({pbp_row(), bad});

    auto events = parse_events(rows);
    ASSERT_FALSE(events.has_value());
    EXPECT_EQ(events.error().kind, ErrorKind::MalformedRecord);

    EXPECT_FALSE(parse_events(pbp_row()).has_value());
    EXPECT_EQ(parse_events(json::array({pbp_row()}))->size(), 1u);
}

TEST(ParseBoxScore, ReadsRows) {
    auto rows = json::array({
        {{"player_id", 201939}, {"team_id", 1610612744}, {"min", "34:12"}},
        {{"player_id", "2544"}, {"team_id", "1610612747"}},
    });
    auto box = parse_box_score(rows);
    ASSERT_TRUE(box.has_value());
    ASSERT_EQ(box->size(), 2u);
    EXPECT_EQ((*box)[1].player_id, 2544);
    EXPECT_EQ((*box)[1].team_id, 1610612747);

    auto missing_team = json::array({{{"player_id", 201939}}});
    EXPECT_FALSE(parse_box_score(missing_team).has_value());
}

TEST(ParseGame, AcceptsObjectOrSingleRow) {
    json game = {
        {"game_id", 21900001},
        {"home_team_id", 1610612744},
        {"visitor_team_id", 1610612747},
    };

    auto from_object = parse_game(game);
    ASSERT_TRUE(from_object.has_value());
    EXPECT_EQ(from_object->home_team_id, 1610612744);

    auto from_row = parse_game(json::array({game}));
    ASSERT_TRUE(from_row.has_value());
    EXPECT_EQ(from_row->visitor_team_id, 1610612747);

    auto two_rows = parse_game(json::array({game, game}));
    ASSERT_FALSE(two_rows.has_value());
    EXPECT_EQ(two_rows.error().kind, ErrorKind::MalformedRecord);

    game.erase("visitor_team_id");
    EXPECT_FALSE(parse_game(game).has_value());
}

TEST(ToJson, LineupRowColumns) {
    LineupRow row{.game_id = 21900001, .event_num = 7,
                  .home = {1, 2, 3, 4, 5}, .visitor = {11, 12, 13, 14, 15}};
    auto j = to_json(row);
    EXPECT_EQ(j["game_id"], 21900001);
    EXPECT_EQ(j["eventnum"], 7);
    EXPECT_EQ(j["home_player_1"], 1);
    EXPECT_EQ(j["home_player_5"], 5);
    EXPECT_EQ(j["visitor_player_3"], 13);
    EXPECT_EQ(j.size(), 12u);
}

TEST(ToJson, GameLineups) {
    auto result = reconstruct_game(fixtures::two_period_game());
    ASSERT_TRUE(result.has_value());

    auto j = to_json(*result);
    EXPECT_EQ(j["game_id"], fixtures::game_id);
    EXPECT_EQ(j["home_team_id"], fixtures::home);
    EXPECT_EQ(j["visitor_team_id"], fixtures::visitor);
    EXPECT_EQ(j["lineups"].size(), result->rows.size());
    ASSERT_EQ(j["intervals"].size(), result->intervals.intervals.size());

    auto& first = j["intervals"][0];
    EXPECT_EQ(first["player_id"], 1);
    EXPECT_EQ(first["time_in"], 2400.0);
    EXPECT_EQ(first["period"], 1);
}
