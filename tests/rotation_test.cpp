// rotation_test.cpp - Tests for layer date enumeration and rotation assignment
//
// Enumeration: chronological, only configured weekdays, half-open range.
// Rotation: person = team[i % k]; the index advances through suppressed
// (dummy) dates, so placeholders never shift later assignments.

#include <gtest/gtest.h>

#include "schedule/layer_dates.hpp"
#include "schedule/rotation.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using test_helpers::d;
using test_helpers::make_layer;

// ===========================================================================
// Layer date enumeration
// ===========================================================================
class LayerDatesTest : public ::testing::Test {};

TEST_F(LayerDatesTest, OnlyConfiguredWeekdays) {
    auto layer = make_layer("A", {"monday", "wednesday"}, {"Alice"});
    // 2026-01-05 is a Monday; two full weeks.
    auto dates = enumerate_layer_dates(layer, DateRange{d(2026, 1, 5), d(2026, 1, 19)});
    ASSERT_EQ(dates.size(), 4u);
    EXPECT_EQ(dates[0].date, d(2026, 1, 5));
    EXPECT_EQ(dates[0].weekday, "monday");
    EXPECT_EQ(dates[1].date, d(2026, 1, 7));
    EXPECT_EQ(dates[1].weekday, "wednesday");
    EXPECT_EQ(dates[2].date, d(2026, 1, 12));
    EXPECT_EQ(dates[3].date, d(2026, 1, 14));
}

TEST_F(LayerDatesTest, EndIsExclusive) {
    auto layer = make_layer("A", {"monday"}, {"Alice"});
    auto dates = enumerate_layer_dates(layer, DateRange{d(2026, 1, 5), d(2026, 1, 12)});
    ASSERT_EQ(dates.size(), 1u);
    EXPECT_EQ(dates[0].date, d(2026, 1, 5));
}

TEST_F(LayerDatesTest, StrictlyChronological) {
    auto layer = make_layer("A", {"monday", "tuesday", "wednesday", "thursday", "friday",
                                  "saturday", "sunday"}, {"Alice"});
    auto dates = enumerate_layer_dates(layer, DateRange{d(2026, 1, 1), d(2026, 3, 1)});
    ASSERT_EQ(dates.size(), 59u);
    for (size_t i = 1; i < dates.size(); ++i) {
        EXPECT_EQ(dates[i].date, time_utils::add_days(dates[i - 1].date, 1));
    }
}

TEST_F(LayerDatesTest, EmptyRangeYieldsNothing) {
    auto layer = make_layer("A", {"monday"}, {"Alice"});
    EXPECT_TRUE(enumerate_layer_dates(layer, DateRange{d(2026, 1, 12), d(2026, 1, 5)}).empty());
}

TEST_F(LayerDatesTest, NoWindowsYieldsNothing) {
    LayerDefinition layer;
    layer.name = "Empty";
    layer.rotation_team = {"Alice"};
    EXPECT_TRUE(enumerate_layer_dates(layer, DateRange{d(2026, 1, 1), d(2026, 2, 1)}).empty());
}

TEST_F(LayerDatesTest, DummyWindowsAreStillEnumerated) {
    auto layer = make_layer("A", {"monday", "tuesday"}, {"Alice"});
    layer.time_windows["tuesday"].dummy = true;
    auto dates = enumerate_layer_dates(layer, DateRange{d(2026, 1, 5), d(2026, 1, 7)});
    EXPECT_EQ(dates.size(), 2u);
}

// ===========================================================================
// Rotation assignment
// ===========================================================================
class RotationTest : public ::testing::Test {
protected:
    // Monday..Friday for three weeks starting 2026-01-05: 15 dates.
    DateRange three_weeks{d(2026, 1, 5), d(2026, 1, 26)};

    LayerDefinition weekdays(std::vector<std::string> team) {
        return make_layer("Weekdays", {"monday", "tuesday", "wednesday", "thursday", "friday"},
                          std::move(team));
    }
};

TEST_F(RotationTest, PersonIsTeamIndexModuloSize) {
    auto layer = weekdays({"Alice", "Bob", "Carol"});
    auto slots = assign_rotation(layer, enumerate_layer_dates(layer, three_weeks));
    ASSERT_EQ(slots.size(), 15u);
    const std::vector<std::string> team = {"Alice", "Bob", "Carol"};
    for (size_t i = 0; i < slots.size(); ++i) {
        EXPECT_EQ(slots[i].position, i);
        EXPECT_EQ(slots[i].person, team[i % 3]);
    }
}

TEST_F(RotationTest, AssignmentIsPurelyCyclic) {
    auto layer = weekdays({"Alice", "Bob", "Carol", "Dave"});
    auto shifts = resolve_layer_shifts(layer, 0, three_weeks);
    const size_t k = layer.rotation_team.size();
    ASSERT_GT(shifts.size(), k);
    for (size_t i = 0; i + k < shifts.size(); ++i) {
        EXPECT_EQ(shifts[i].person, shifts[i + k].person) << "position " << i;
    }
}

TEST_F(RotationTest, EmptyTeamProducesNoShifts) {
    auto layer = weekdays({});
    auto dates = enumerate_layer_dates(layer, three_weeks);
    EXPECT_EQ(dates.size(), 15u);
    EXPECT_TRUE(assign_rotation(layer, dates).empty());
    EXPECT_TRUE(resolve_layer_shifts(layer, 0, three_weeks).empty());
}

TEST_F(RotationTest, SinglePersonTeamTakesEveryShift) {
    auto layer = weekdays({"Solo"});
    auto shifts = resolve_layer_shifts(layer, 0, three_weeks);
    ASSERT_EQ(shifts.size(), 15u);
    for (const auto& s : shifts) EXPECT_EQ(s.person, "Solo");
}

TEST_F(RotationTest, ShiftCarriesWindowAndLayer) {
    auto layer = make_layer("Morning", {"monday"}, {"Alice"}, "08:00", "10:30");
    auto shifts = resolve_layer_shifts(layer, 3, DateRange{d(2026, 1, 5), d(2026, 1, 6)});
    ASSERT_EQ(shifts.size(), 1u);
    EXPECT_EQ(shifts[0].date, d(2026, 1, 5));
    EXPECT_EQ(shifts[0].layer_name, "Morning");
    EXPECT_EQ(shifts[0].start_time, "08:00");
    EXPECT_EQ(shifts[0].end_time, "10:30");
    EXPECT_EQ(shifts[0].layer_index, 3);
    EXPECT_DOUBLE_EQ(shifts[0].hours(), 2.5);
}

// ===========================================================================
// Dummy suppression - the rotation index advances through suppressed dates
// ===========================================================================
class DummySuppressionTest : public RotationTest {};

TEST_F(DummySuppressionTest, WindowDummyDropsOnlyThatWeekday) {
    auto layer = weekdays({"Alice", "Bob"});
    layer.time_windows["wednesday"].dummy = true;
    auto dates = enumerate_layer_dates(layer, three_weeks);
    auto shifts = resolve_layer_shifts(layer, 0, three_weeks);
    EXPECT_EQ(shifts.size(), dates.size() - 3);
    for (const auto& s : shifts) {
        EXPECT_NE(time_utils::weekday_key(s.date), "wednesday");
    }
}

TEST_F(DummySuppressionTest, SuppressedDateStillConsumesRotationPosition) {
    // Mon..Fri with team [Alice, Bob]: Mon=Alice Tue=Bob Wed=Alice Thu=Bob Fri=Alice.
    // Suppressing Wednesday must leave Thursday with Bob, not Alice.
    auto layer = weekdays({"Alice", "Bob"});
    layer.time_windows["wednesday"].dummy = true;
    auto shifts = resolve_layer_shifts(layer, 0, DateRange{d(2026, 1, 5), d(2026, 1, 10)});
    ASSERT_EQ(shifts.size(), 4u);
    EXPECT_EQ(shifts[0].date, d(2026, 1, 5));
    EXPECT_EQ(shifts[0].person, "Alice");
    EXPECT_EQ(shifts[1].date, d(2026, 1, 6));
    EXPECT_EQ(shifts[1].person, "Bob");
    EXPECT_EQ(shifts[2].date, d(2026, 1, 8));
    EXPECT_EQ(shifts[2].person, "Bob");
    EXPECT_EQ(shifts[3].date, d(2026, 1, 9));
    EXPECT_EQ(shifts[3].person, "Alice");
}

TEST_F(DummySuppressionTest, AssignmentUnchangedBySuppression) {
    auto plain = weekdays({"Alice", "Bob", "Carol"});
    auto with_dummy = plain;
    with_dummy.time_windows["tuesday"].dummy = true;

    auto plain_shifts = resolve_layer_shifts(plain, 0, three_weeks);
    auto dummy_shifts = resolve_layer_shifts(with_dummy, 0, three_weeks);

    // Every surviving shift matches the same date in the unsuppressed run.
    size_t j = 0;
    for (const auto& s : dummy_shifts) {
        while (j < plain_shifts.size() && plain_shifts[j].date != s.date) ++j;
        ASSERT_LT(j, plain_shifts.size());
        EXPECT_EQ(plain_shifts[j].person, s.person);
    }
}

TEST_F(DummySuppressionTest, SlotsAreTaggedNotDropped) {
    auto layer = weekdays({"Alice", "Bob"});
    layer.time_windows["friday"].dummy = true;
    auto slots = assign_rotation(layer, enumerate_layer_dates(layer, three_weeks));
    ASSERT_EQ(slots.size(), 15u);
    int suppressed = 0;
    for (const auto& slot : slots) {
        if (slot.state == SlotState::SUPPRESSED) {
            ++suppressed;
            EXPECT_EQ(slot.entry.weekday, "friday");
        }
    }
    EXPECT_EQ(suppressed, 3);
}

TEST_F(DummySuppressionTest, LayerDummySuppressesEverythingButAdvancesCounter) {
    auto layer = weekdays({"Alice", "Bob", "Carol"});
    layer.dummy = true;
    auto dates = enumerate_layer_dates(layer, three_weeks);
    auto slots = assign_rotation(layer, dates);

    EXPECT_EQ(dates.size(), 15u);
    ASSERT_EQ(slots.size(), 15u);
    for (size_t i = 0; i < slots.size(); ++i) {
        EXPECT_EQ(slots[i].state, SlotState::SUPPRESSED);
        EXPECT_EQ(slots[i].position, i);
    }
    EXPECT_TRUE(materialize_shifts(layer, 0, slots).empty());
}

TEST_F(DummySuppressionTest, LayerDummyOverridesNonDummyWindows) {
    auto layer = weekdays({"Alice"});
    layer.dummy = true;
    for (auto& [day, w] : layer.time_windows) w.dummy = false;
    EXPECT_TRUE(resolve_layer_shifts(layer, 0, three_weeks).empty());
}
