#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "heatcal/errors.hpp"
#include "heatcal/time_normalizer.hpp"

using namespace heatcal;
using namespace heatcal::test;

class TimeNormalizerTest : public ::testing::Test {
protected:
	void SetUp() override {
		cfg.min_year = 1950;
		cfg.max_year = 2100;
	}

	NormalizerConfig cfg;
};

TEST_F(TimeNormalizerTest, UtcTargetUsesUtcDay) {
	// 2024-01-01 23:30 +0200 is 21:30 UTC
	EXPECT_EQ(normalize_commit(commit_at("2024-01-01 23:30:00", 120), cfg), day("2024-01-01"));
	// 2024-01-02 01:00 +0200 is still 2024-01-01 in UTC
	EXPECT_EQ(normalize_commit(commit_at("2024-01-02 01:00:00", 120), cfg), day("2024-01-01"));
}

TEST_F(TimeNormalizerTest, TargetOffsetMovesLateCommitsToNextDay) {
	cfg.timezone_offset_minutes = 9*60;
	// 20:00 UTC is 05:00 next day in +0900
	EXPECT_EQ(normalize_commit(commit_at("2024-03-10 20:00:00", 0), cfg), day("2024-03-11"));
	cfg.timezone_offset_minutes = -5*60;
	EXPECT_EQ(normalize_commit(commit_at("2024-03-10 03:00:00", 0), cfg), day("2024-03-09"));
}

TEST_F(TimeNormalizerTest, OriginOffsetKeepsLocalDay) {
	cfg.use_origin_offset       = true;
	cfg.timezone_offset_minutes = -8*60;
	EXPECT_EQ(normalize_commit(commit_at("2024-01-01 23:30:00",  120), cfg), day("2024-01-01"));
	EXPECT_EQ(normalize_commit(commit_at("2024-01-02 00:15:00", -420), cfg), day("2024-01-02"));
}

TEST_F(TimeNormalizerTest, LeapDay) {
	EXPECT_EQ(normalize_commit(commit_at("2024-02-29 10:00:00"), cfg), day("2024-02-29"));
	cfg.timezone_offset_minutes = 14*60;
	EXPECT_EQ(normalize_commit(commit_at("2024-02-28 12:00:00"), cfg), day("2024-02-29"));
}

TEST_F(TimeNormalizerTest, KeepsOrder) {
	std::vector<CommitEvent> events{
		commit_at("2024-05-03 10:00:00"),
		commit_at("2024-05-01 10:00:00"),
		commit_at("2024-05-02 10:00:00"),
	};
	std::vector<CivilDate> dates = normalize_commits(events, cfg);
	ASSERT_EQ(dates.size(), 3u);
	EXPECT_EQ(dates[0], day("2024-05-03"));
	EXPECT_EQ(dates[1], day("2024-05-01"));
	EXPECT_EQ(dates[2], day("2024-05-02"));
}

TEST_F(TimeNormalizerTest, EmptyInput) {
	EXPECT_TRUE(normalize_commits({}, cfg).empty());
}

TEST_F(TimeNormalizerTest, OutOfBoundsYearIsInvalidTimestamp) {
	try {
		normalize_commits({ commit_at("1900-06-01 12:00:00") }, cfg);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidTimestamp);
		EXPECT_EQ(err.stage, Stage::normalize);
	}
	EXPECT_THROW(normalize_commit(commit_at("2150-06-01 12:00:00"), cfg), HeatmapError);
}

TEST_F(TimeNormalizerTest, SpecialInstantIsInvalidTimestamp) {
	CommitEvent ev;
	ev.instant = boost::posix_time::ptime(boost::date_time::not_a_date_time);
	try {
		normalize_commit(ev, cfg);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidTimestamp);
	}
}

TEST_F(TimeNormalizerTest, AbsurdEventOffsetIsInvalidTimestamp) {
	CommitEvent ev = commit_at("2024-01-01 12:00:00");
	ev.utc_offset_minutes = 100*60;
	EXPECT_THROW(normalize_commit(ev, cfg), HeatmapError);
}

TEST_F(TimeNormalizerTest, BadTargetOffsetIsInvalidConfiguration) {
	cfg.timezone_offset_minutes = 25*60;
	try {
		normalize_commits({ commit_at("2024-01-01 12:00:00") }, cfg);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidConfiguration);
	}
}
