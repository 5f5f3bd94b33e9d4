#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <random>
#include <stdexcept>

namespace {

// Reference: walk the full Cartesian product and keep clash-free combinations.
size_t brute_force_count(const std::vector<Course>& courses) {
    for (const auto& c : courses) {
        if (c.sections.empty()) return 0;
    }

    std::vector<size_t> index(courses.size(), 0);
    size_t valid = 0;
    while (true) {
        bool ok = true;
        for (size_t i = 0; i < courses.size() && ok; ++i) {
            for (size_t j = i + 1; j < courses.size() && ok; ++j) {
                if (sections_conflict(courses[i].sections[index[i]], courses[j].sections[index[j]])) ok = false;
            }
        }
        if (ok) ++valid;

        size_t pos = 0;
        while (pos < courses.size() && ++index[pos] == courses[pos].sections.size()) {
            index[pos] = 0;
            ++pos;
        }
        if (pos == courses.size()) break;
    }
    return valid;
}

bool schedule_is_valid(const Schedule& schedule) {
    for (size_t i = 0; i < schedule.size(); ++i) {
        for (size_t j = i + 1; j < schedule.size(); ++j) {
            if (sections_conflict(*schedule[i].section, *schedule[j].section)) return false;
        }
    }
    return true;
}

std::vector<Course> random_courses(unsigned seed, int course_count, int max_sections) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> section_count(1, max_sections);
    std::uniform_int_distribution<int> block_count(0, 2);
    std::uniform_int_distribution<int> day_mask(1, 0x1F);
    std::uniform_int_distribution<int> start_slot(16, 36);   // 08:00..18:00 in half hours
    std::uniform_int_distribution<int> length_slots(1, 4);

    std::vector<Course> courses;
    for (int c = 0; c < course_count; ++c) {
        Course current;
        current.course_id = "C" + std::to_string(c);
        int sections = section_count(rng);
        for (int s = 0; s < sections; ++s) {
            Section sec;
            sec.section_id = current.course_id + "-" + std::to_string(s);
            int blocks = block_count(rng);
            for (int b = 0; b < blocks; ++b) {
                int start = start_slot(rng) * 30;
                sec.blocks.emplace_back(static_cast<DayMask>(day_mask(rng)), start, start + length_slots(rng) * 30);
            }
            current.sections.push_back(sec);
        }
        courses.push_back(current);
    }
    return courses;
}

TEST(ScheduleEnumeratorTest, EmptyCourseListYieldsOneEmptySchedule) {
    EnumerationResult result = enumerate_schedules({}, 50);
    ASSERT_EQ(result.schedules.size(), 1u);
    EXPECT_TRUE(result.schedules[0].empty());
    EXPECT_FALSE(result.truncated);
    EXPECT_FALSE(result.timed_out);
}

TEST(ScheduleEnumeratorTest, CourseWithoutSectionsShortCircuits) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("M", "09:00", "10:00")})}),
        course("B", {}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_FALSE(result.truncated);
}

TEST(ScheduleEnumeratorTest, EveryCombinationConflicts) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("M", "09:00", "10:00")}),
                     section("A2", {block("M", "10:00", "11:00")})}),
        course("B", {section("B1", {block("M", "09:30", "10:30")})}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_FALSE(result.truncated);
}

TEST(ScheduleEnumeratorTest, ResultsFollowCatalogueOrder) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("M", "09:00", "10:00")}),
                     section("A2", {block("M", "10:00", "11:00")})}),
        course("B", {section("B1", {block("M", "11:00", "12:00")})}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_EQ(describe(result), (std::vector<std::string>{"A:A1 B:B1", "A:A2 B:B1"}));
    EXPECT_FALSE(result.truncated);
}

TEST(ScheduleEnumeratorTest, DepthFirstOrderAcrossThreeCourses) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("M", "09:00", "10:00")}),
                     section("A2", {block("T", "09:00", "10:00")})}),
        course("B", {section("B1", {block("M", "09:30", "10:30")}),
                     section("B2", {block("W", "09:00", "10:00")})}),
        course("C", {section("C1", {}),
                     section("C2", {block("T", "09:00", "09:30")})}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_EQ(describe(result), (std::vector<std::string>{
        "A:A1 B:B2 C:C1",
        "A:A1 B:B2 C:C2",
        "A:A2 B:B1 C:C1",
        "A:A2 B:B2 C:C1",
    }));
}

TEST(ScheduleEnumeratorTest, SectionsWithoutMeetingsNeverConflict) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("MTWRF", "08:00", "20:00")})}),
        course("ONLINE", {section("O1", {}), section("O2", {})}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_EQ(describe(result), (std::vector<std::string>{"A:A1 ONLINE:O1", "A:A1 ONLINE:O2"}));
}

TEST(ScheduleEnumeratorTest, MultiBlockSectionsCheckEveryMeeting) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("MW", "10:00", "11:20"), block("F", "14:00", "16:00")})}),
        course("B", {section("B1", {block("F", "15:00", "16:00")}),
                     section("B2", {block("MW", "11:30", "12:50")})}),
    };
    EnumerationResult result = enumerate_schedules(pointers(courses), 50);
    EXPECT_EQ(describe(result), (std::vector<std::string>{"A:A1 B:B2"}));
}

TEST(ScheduleEnumeratorTest, CapStopsSearchAndReportsTruncation) {
    std::vector<Course> courses = {
        course("A", {section("A1", {}), section("A2", {}), section("A3", {})}),
        course("B", {section("B1", {}), section("B2", {})}),
    };

    EnumerationResult capped = enumerate_schedules(pointers(courses), 4);
    EXPECT_EQ(describe(capped), (std::vector<std::string>{"A:A1 B:B1", "A:A1 B:B2", "A:A2 B:B1", "A:A2 B:B2"}));
    EXPECT_TRUE(capped.truncated);

    // The sixth schedule is the last combination, so nothing was cut off.
    EnumerationResult exact = enumerate_schedules(pointers(courses), 6);
    EXPECT_EQ(exact.schedules.size(), 6u);
    EXPECT_FALSE(exact.truncated);

    EnumerationResult one_short = enumerate_schedules(pointers(courses), 7);
    EXPECT_EQ(one_short.schedules.size(), 6u);
    EXPECT_FALSE(one_short.truncated);

    EnumerationResult roomy = enumerate_schedules(pointers(courses), 50);
    EXPECT_EQ(roomy.schedules.size(), 6u);
    EXPECT_FALSE(roomy.truncated);
}

TEST(ScheduleEnumeratorTest, CapOfOneOnEmptyCourseList) {
    EnumerationResult result = enumerate_schedules({}, 1);
    EXPECT_EQ(result.schedules.size(), 1u);
    EXPECT_FALSE(result.truncated);
}

TEST(ScheduleEnumeratorTest, CapWithUnexploredBranchesReportsTruncation) {
    // Only A1+B1 is valid, but A2 is still unexplored when the cap is hit.
    std::vector<Course> courses = {
        course("A", {section("A1", {}), section("A2", {block("M", "09:00", "10:00")})}),
        course("B", {section("B1", {block("M", "09:00", "10:00")})}),
    };
    EnumerationResult capped = enumerate_schedules(pointers(courses), 1);
    EXPECT_EQ(describe(capped), (std::vector<std::string>{"A:A1 B:B1"}));
    EXPECT_TRUE(capped.truncated);

    EnumerationResult roomy = enumerate_schedules(pointers(courses), 2);
    EXPECT_EQ(roomy.schedules.size(), 1u);
    EXPECT_FALSE(roomy.truncated);
}

TEST(ScheduleEnumeratorTest, CapReturnsPrefixOfFullResult) {
    std::vector<Course> courses = {
        course("A", {section("A1", {block("M", "09:00", "10:00")}),
                     section("A2", {block("M", "10:00", "11:00")}),
                     section("A3", {block("T", "09:00", "10:00")})}),
        course("B", {section("B1", {block("M", "09:30", "10:30")}),
                     section("B2", {block("W", "09:00", "10:00")}),
                     section("B3", {})}),
        course("C", {section("C1", {block("T", "09:30", "10:00")}),
                     section("C2", {block("F", "09:00", "12:00")})}),
    };
    EnumerationResult full = enumerate_schedules(pointers(courses), 100000);
    ASSERT_GT(full.schedules.size(), 3u);

    EnumerationResult capped = enumerate_schedules(pointers(courses), 3);
    std::vector<std::string> expected = describe(full);
    expected.resize(3);
    EXPECT_EQ(describe(capped), expected);
    EXPECT_TRUE(capped.truncated);
}

TEST(ScheduleEnumeratorTest, MatchesBruteForceReference) {
    for (unsigned seed = 1; seed <= 40; ++seed) {
        std::vector<Course> courses = random_courses(seed, 1 + static_cast<int>(seed % 5), 5);
        size_t expected = brute_force_count(courses);

        EnumerationResult result = enumerate_schedules(pointers(courses), 100000);
        ASSERT_EQ(result.schedules.size(), expected) << "seed " << seed;
        EXPECT_FALSE(result.truncated) << "seed " << seed;

        for (const auto& schedule : result.schedules) {
            ASSERT_EQ(schedule.size(), courses.size());
            for (size_t i = 0; i < schedule.size(); ++i) {
                EXPECT_EQ(schedule[i].course, &courses[i]);
            }
            EXPECT_TRUE(schedule_is_valid(schedule)) << "seed " << seed;
        }

        if (expected > 2) {
            EnumerationResult capped = enumerate_schedules(pointers(courses), static_cast<int>(expected - 1));
            EXPECT_EQ(capped.schedules.size(), expected - 1);
            EXPECT_TRUE(capped.truncated);
        }
    }
}

TEST(ScheduleEnumeratorTest, RepeatedRunsGiveIdenticalOrder) {
    std::vector<Course> courses = random_courses(99, 6, 6);
    ScheduleEnumerator enumerator;
    auto first = describe(enumerator.enumerate(pointers(courses)));
    auto second = describe(enumerator.enumerate(pointers(courses)));
    auto fresh = describe(enumerate_schedules(pointers(courses)));
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, fresh);
}

TEST(ScheduleEnumeratorTest, DefaultCapIsFifty) {
    std::vector<Course> courses;
    for (int c = 0; c < 3; ++c) {
        std::vector<Section> sections;
        for (int s = 0; s < 5; ++s) sections.push_back(section(std::to_string(s), {}));
        courses.push_back(course("C" + std::to_string(c), sections));
    }
    EnumerationResult result = enumerate_schedules(pointers(courses));
    EXPECT_EQ(result.schedules.size(), 50u);
    EXPECT_TRUE(result.truncated);
}

TEST(ScheduleEnumeratorTest, AvailabilityWindowFiltersSections) {
    std::vector<Course> courses = {
        course("A", {section("EARLY", {block("M", "08:00", "09:00")}),
                     section("MID", {block("M", "10:00", "11:00")}),
                     section("LATE", {block("M", "17:00", "18:30")})}),
        course("B", {section("FRI", {block("F", "10:00", "11:00")}),
                     section("TUE", {block("T", "12:00", "13:00")}),
                     section("WEB", {})}),
    };

    EnumerationOptions options;
    options.earliest_start = parse_hhmm("09:00");
    options.latest_end = parse_hhmm("16:00");
    options.allowed_days = parse_days("MTWR");

    ScheduleEnumerator enumerator(options);
    EnumerationResult result = enumerator.enumerate(pointers(courses));
    EXPECT_EQ(describe(result), (std::vector<std::string>{"A:MID B:TUE", "A:MID B:WEB"}));

    EXPECT_TRUE(enumerator.section_allowed(courses[0].sections[1]));
    EXPECT_FALSE(enumerator.section_allowed(courses[0].sections[0]));
    EXPECT_FALSE(enumerator.section_allowed(courses[1].sections[0]));
    EXPECT_TRUE(enumerator.section_allowed(courses[1].sections[2]));
}

TEST(ScheduleEnumeratorTest, PassedDeadlineStopsImmediately) {
    std::vector<Course> courses = random_courses(3, 4, 5);
    EnumerationOptions options;
    options.has_deadline = true;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    ScheduleEnumerator enumerator(options);
    EnumerationResult result = enumerator.enumerate(pointers(courses));
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_FALSE(result.truncated);
}

TEST(ScheduleEnumeratorTest, GenerousDeadlineDoesNotInterfere) {
    std::vector<Course> courses = random_courses(11, 4, 4);
    EnumerationOptions options;
    options.cap = 100000;
    options.set_timeout(std::chrono::minutes(5));

    ScheduleEnumerator enumerator(options);
    EnumerationResult result = enumerator.enumerate(pointers(courses));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.schedules.size(), brute_force_count(courses));
}

TEST(ScheduleEnumeratorTest, RejectsInvalidOptions) {
    EnumerationOptions zero_cap;
    zero_cap.cap = 0;
    EXPECT_THROW(ScheduleEnumerator{zero_cap}, std::invalid_argument);

    EnumerationOptions inverted;
    inverted.earliest_start = parse_hhmm("15:00");
    inverted.latest_end = parse_hhmm("09:00");
    EXPECT_THROW(ScheduleEnumerator{inverted}, std::invalid_argument);
}

TEST(ScheduleEnumeratorTest, LargeSearchSpaceStopsAtCap) {
    // 10^8 combinations without conflicts; the cap must end the search at once.
    std::vector<Course> courses;
    for (int c = 0; c < 8; ++c) {
        std::vector<Section> sections;
        for (int s = 0; s < 10; ++s) sections.push_back(section(std::to_string(s), {}));
        courses.push_back(course("C" + std::to_string(c), sections));
    }
    EnumerationResult result = enumerate_schedules(pointers(courses), 25);
    EXPECT_EQ(result.schedules.size(), 25u);
    EXPECT_TRUE(result.truncated);
}

TEST(ScheduleEnumeratorTest, CapReachedBeforeDeadTailReturnsAtOnce) {
    // Eight courses of ten mutually compatible sections, then one course whose only
    // section clashes with every meeting. Only the all-online prefix completes, and
    // it is the first leaf; the other 10^8 - 1 prefixes all die at the last course.
    std::vector<Course> courses;
    for (int c = 0; c < 8; ++c) {
        std::vector<Section> sections = {section("WEB", {})};
        for (int s = 1; s < 10; ++s) {
            int start = parse_hhmm("08:00") + (c * 9 + s - 1) * 10;
            sections.push_back(section(std::to_string(s), {TimeBlock(day_bit('M'), start, start + 10)}));
        }
        courses.push_back(course("C" + std::to_string(c), sections));
    }
    courses.push_back(course("LAB", {section("ALLWEEK", {block("MTWRF", "00:00", "24:00")})}));

    EnumerationOptions options;
    options.cap = 1;
    options.set_timeout(std::chrono::seconds(5));

    auto started = std::chrono::steady_clock::now();
    ScheduleEnumerator enumerator(options);
    EnumerationResult result = enumerator.enumerate(pointers(courses));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(result.schedules.size(), 1u);
    EXPECT_EQ(result.schedules[0].back().section->section_id, "ALLWEEK");
    EXPECT_TRUE(result.truncated);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

}  // namespace
