/** \file candidate_csv_test.cpp
 *  \brief Loading bet candidates from header-named CSV.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "calibet/backtest/candidate_csv.hpp"

using namespace calibet;
using namespace calibet::backtest;
using Catch::Matchers::WithinAbs;

TEST_CASE("CSV field splitting handles quotes", "[csv]") {
    auto f = split_csv_line(R"(a,"b,c","say ""hi""",)");
    REQUIRE(f.size() == 4);
    REQUIRE(f[0] == "a");
    REQUIRE(f[1] == "b,c");
    REQUIRE(f[2] == "say \"hi\"");
    REQUIRE(f[3].empty());
}

TEST_CASE("candidates parse with aliases and defaults", "[csv]") {
    const std::string text =
        "Game_Date,Player,Prob_Over,Odds,Confidence,Line,Predicted_Value,Value\r\n"
        "2024-01-03,Bravo,62%,+150,80,24.5,26.1,27\r\n"
        "2024-01-01,Alpha,0.55,2.1,0.7,10.5,,pending\r\n"
        "\r\n";

    auto rows = parse_candidates_csv(text);
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);

    const auto& first = (*rows)[0];
    REQUIRE(first.label == "Alpha");
    REQUIRE_THAT(first.probability, WithinAbs(0.55, 1e-12));
    REQUIRE_THAT(first.odds, WithinAbs(2.1, 1e-12));
    REQUIRE_FALSE(first.actual.has_value());
    REQUIRE_FALSE(first.prediction.has_value());

    const auto& second = (*rows)[1];
    REQUIRE(second.label == "Bravo");
    REQUIRE_THAT(second.probability, WithinAbs(0.62, 1e-12));
    REQUIRE_THAT(second.odds, WithinAbs(2.5, 1e-12));
    REQUIRE_THAT(second.confidence.value(), WithinAbs(0.8, 1e-12));
    REQUIRE(second.line.value() == 24.5);
    REQUIRE(second.prediction.value() == 26.1);
    REQUIRE(second.actual.value() == 27.0);
    REQUIRE(first.event_time < second.event_time);
}

TEST_CASE("missing optional columns use defaults", "[csv]") {
    auto rows = parse_candidates_csv("date\n2024-05-05\n");
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    REQUIRE((*rows)[0].probability == 0.5);
    REQUIRE((*rows)[0].odds == 2.0);
    REQUIRE_FALSE((*rows)[0].confidence.has_value());
    REQUIRE_FALSE((*rows)[0].actual.has_value());
}

TEST_CASE("under odds remove the vig", "[csv]") {
    auto rows = parse_candidates_csv("date,decimal_odds,decimal_odds_under\n2024-05-05,1.9,1.9\n2024-05-06,1.9,bad\n");
    REQUIRE(rows.has_value());
    REQUIRE_THAT((*rows)[0].odds, WithinAbs(2.0, 1e-12));
    // unparsable under odds keep the over odds
    REQUIRE_THAT((*rows)[1].odds, WithinAbs(1.9, 1e-12));
}

TEST_CASE("malformed rows report the line number", "[csv]") {
    auto no_date = parse_candidates_csv("player,odds\nA,2.0\n");
    REQUIRE_FALSE(no_date.has_value());
    REQUIRE(no_date.error().code == core::error_code::data_integrity);

    auto bad_prob = parse_candidates_csv("date,over_probability\n2024-01-01,0.5\n2024-01-02,lots\n");
    REQUIRE_FALSE(bad_prob.has_value());
    REQUIRE(bad_prob.error().code == core::error_code::data_integrity);
    REQUIRE(bad_prob.error().message.find("line 3") != std::string::npos);

    auto empty = parse_candidates_csv("");
    REQUIRE_FALSE(empty.has_value());
}

TEST_CASE("candidates load from a file", "[csv]") {
    namespace fs = std::filesystem;
    std::random_device rd;
    const auto path = fs::temp_directory_path() / ("calibet_candidates_" + std::to_string(rd()) + ".csv");
    {
        std::ofstream out(path);
        out << "date,player,over_probability,decimal_odds,actual_value,line\n";
        out << "2024-02-01,A,0.6,2.0,30,25.5\n";
    }
    auto rows = load_candidates_csv(path);
    std::error_code ec;
    fs::remove(path, ec);
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    REQUIRE((*rows)[0].actual.value() == 30.0);

    auto missing = load_candidates_csv(path);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == core::error_code::not_found);
}
