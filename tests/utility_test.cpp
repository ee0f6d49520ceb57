// utility_test.cpp — enum names, treatment parsing and track shaping

#include <gtest/gtest.h>

#include "posescope/CsvReader.h"
#include "posescope/Logging.h"
#include "posescope/Utility.h"
#include "test_helpers.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

using namespace posescope;

TEST(UtilityTest, FeatureKindNamesRoundTrip) {
    for (FeatureKind kind : {FeatureKind::MeanSpeed, FeatureKind::TotalDistance, FeatureKind::VelocityPerMinute,
                             FeatureKind::StopCount, FeatureKind::MeanCurvature, FeatureKind::MeanMisalignment,
                             FeatureKind::MeanHeadBodyMisalignment, FeatureKind::MeanTailBend,
                             FeatureKind::MeanAngularSpeed, FeatureKind::TimeInCenter,
                             FeatureKind::TimeInCorners, FeatureKind::SpatialEntropy,
                             FeatureKind::AccelOutlierCount, FeatureKind::JerkOutlierCount}) {
        EXPECT_EQ(feature_kind_from_string(feature_kind_to_string(kind)), kind);
    }
    EXPECT_EQ(feature_kind_from_string("spatial_entropy"), FeatureKind::SpatialEntropy);
    EXPECT_THROW(feature_kind_from_string("mean_velocity"), std::invalid_argument);
}

TEST(UtilityTest, SweepParameterNames) {
    EXPECT_EQ(sweep_parameter_to_string(SweepParameter::TimeLimitSeconds), "time_limit_s");
    EXPECT_EQ(sweep_parameter_from_string("derivative_window"), SweepParameter::DerivativeWindow);
    EXPECT_THROW(sweep_parameter_from_string("window"), std::invalid_argument);
}

TEST(UtilityTest, TreatmentCellsMapSentinelsToNone) {
    EXPECT_TRUE(treatment_from_cell(std::nullopt).isNone());
    for (const char* cell : {"", "  ", "NA", "nan", "None", "NULL"}) {
        EXPECT_TRUE(treatment_from_cell(std::string(cell)).isNone()) << "'" << cell << "'";
    }
    const Treatment t = treatment_from_cell(std::string(" CNO "));
    ASSERT_FALSE(t.isNone());
    EXPECT_EQ(t.label(), "CNO");
    EXPECT_EQ(treatment_to_string(Treatment::none()), "none");
    EXPECT_THROW(Treatment::none().label(), std::logic_error);
}

TEST(UtilityTest, TreatmentFilterStrings) {
    EXPECT_EQ(treatment_filter_from_string("any").kind(), TreatmentFilter::Kind::Any);
    EXPECT_EQ(treatment_filter_from_string("None").kind(), TreatmentFilter::Kind::None);
    const TreatmentFilter named = treatment_filter_from_string("saline");
    EXPECT_EQ(named.kind(), TreatmentFilter::Kind::Named);
    EXPECT_TRUE(named.matches(Treatment::named("saline")));
    EXPECT_FALSE(named.matches(Treatment::none()));
}

TEST(UtilityTest, TrackShapingSortsAndDropsEmptyLandmarks) {
    CoordinateTrack track;
    track.frameCount = 2;
    track.landmarks.push_back(test_helpers::make_raw_landmark("Tailbase", {1, 2}, {1, 2}));
    track.landmarks.push_back(
        test_helpers::make_raw_landmark("Ear", {test_helpers::kNaN, test_helpers::kNaN},
                                        {test_helpers::kNaN, test_helpers::kNaN}, 0.0));
    track.landmarks.push_back(test_helpers::make_raw_landmark("Head", {test_helpers::kNaN, 3}, {4, 5}));

    drop_untracked_landmarks(track);
    canonicalize_track(track);
    ASSERT_EQ(track.landmarks.size(), 2u);
    EXPECT_EQ(track.landmarks[0].name, "Head");
    EXPECT_EQ(track.landmarks[1].name, "Tailbase");
}

TEST(LoggingTest, UnknownLevelFallsBackToInfo) {
    configure_logging("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    configure_logging("chatty");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
    configure_logging("off");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
    configure_logging("info");
}

TEST(CsvReaderTest, QuotedCellsKeepDelimitersAndEscapes) {
    const CsvRow row = split_delimited_line("a,\"b,c\",\"say \"\"hi\"\"\",,end\r", ',');
    ASSERT_EQ(row.size(), 5u);
    EXPECT_EQ(row[1], "b,c");
    EXPECT_EQ(row[2], "say \"hi\"");
    EXPECT_TRUE(row[3].empty());
    EXPECT_EQ(row[4], "end");
}

TEST(CsvReaderTest, ParseNumberRejectsNonNumericCells) {
    EXPECT_DOUBLE_EQ(*parse_number(" 12.5 "), 12.5);
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("12abc").has_value());
    EXPECT_FALSE(parse_number("nan").has_value());
}
