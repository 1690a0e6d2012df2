// sync_test.cpp — turning an LMS export into calendar events

#include <gtest/gtest.h>

#include "sync.hpp"
#include "test_helpers.hpp"

#include <sstream>

class SyncTest : public ::testing::Test {
protected:
    ScheduleIndex schedule = cs363_schedule();
    DateInferenceEngine engine{schedule, fixed_clock(2024, 1, 20), nullptr};
    std::ostringstream log;

    SyncOptions options() {
        SyncOptions opt;
        opt.today = CivilDate{2024, 1, 20};
        opt.log = &log;
        return opt;
    }

    static Announcement announcement(const std::string& title, const std::string& message,
                                     const std::string& posted_at) {
        return Announcement{title, message, posted_at, "https://lms/n/1"};
    }
};

TEST_F(SyncTest, AssignmentsBecomeTimedEvents) {
    Feed feed;
    Course c;
    c.course_code = "CS 363-001";
    c.assignments.push_back({"HW1", "2024-01-10T23:59:00Z", "https://lms/a/1"});
    c.assignments.push_back({"Reading", "", ""});
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    EXPECT_TRUE(log.str().empty());  // undated is not an error
    const auto& e = cal.events()[0];
    EXPECT_EQ(e.summary, "📝 HW1 (CS 363-001)");
    EXPECT_TRUE(e.start.has_time);
    EXPECT_FALSE(e.all_day);
    EXPECT_EQ(e.description, "https://lms/a/1");
}

TEST_F(SyncTest, AnnouncementDateIsInferredFromTitleAndMessage) {
    Feed feed;
    Course c;
    c.course_code = "CS 363-001 Fall 2024";
    c.announcements.push_back(announcement("Quiz", "moved to next class", "2024-01-03T09:00:00Z"));
    c.announcements.push_back(announcement("Due 3rd Oct, 2024", "see syllabus", "2024-01-05T09:00:00Z"));
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 2u);

    const auto& quiz = cal.events()[0];
    EXPECT_EQ(quiz.summary, "📢 Quiz (CS 363-001 Fall 2024)");
    EXPECT_TRUE(quiz.all_day);
    EXPECT_EQ(quiz.start.date, (CivilDate{2024, 1, 4}));
    EXPECT_EQ(quiz.description,
              "Originally Posted: 2024-01-03\nhttps://lms/n/1\n\nmoved to next class...");

    EXPECT_EQ(cal.events()[1].start.date, (CivilDate{2024, 10, 3}));
}

TEST_F(SyncTest, OldAndUndatedAnnouncementsAreSkipped) {
    Feed feed;
    Course c;
    c.course_code = "CS 363";
    c.announcements.push_back(announcement("Old", "", "2023-12-01T09:00:00Z"));
    c.announcements.push_back(announcement("Edge", "", "2023-12-21"));
    c.announcements.push_back(announcement("Undated", "", ""));
    c.announcements.push_back(announcement("Fresh", "", "2023-12-22T00:00:00Z"));
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    EXPECT_EQ(cal.events()[0].start.date, (CivilDate{2023, 12, 22}));
}

TEST_F(SyncTest, MalformedPostedValueIsSkippedWithWarning) {
    Feed feed;
    Course c;
    c.course_code = "CS 363";
    c.announcements.push_back(announcement("Broken", "", "garbage"));
    c.announcements.push_back(announcement("Fine", "", "2024-01-05T09:00:00Z"));
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    EXPECT_EQ(cal.events()[0].summary, "📢 Fine (CS 363)");
    EXPECT_NE(log.str().find("Broken"), std::string::npos);
}

TEST_F(SyncTest, LongMessageIsTruncatedByCodePoint) {
    Feed feed;
    Course c;
    c.course_code = "CS 363";
    std::string message;
    for (int i = 0; i < 250; ++i) message += "é";
    c.announcements.push_back(announcement("Long", message, "2024-01-05T09:00:00Z"));
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    std::string expected_tail;
    for (int i = 0; i < 200; ++i) expected_tail += "é";
    expected_tail += "...";
    const std::string& d = cal.events()[0].description;
    EXPECT_EQ(d.substr(d.size() - expected_tail.size()), expected_tail);
}

TEST_F(SyncTest, CalendarItemsAreAddedWhenParseable) {
    Feed feed;
    feed.calendar_events.push_back({"Career fair", "2024-01-12T15:00:00Z"});
    feed.calendar_events.push_back({"Someday", "tbd"});

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    EXPECT_EQ(cal.events()[0].summary, "🗓️ Career fair");
    EXPECT_NE(log.str().find("warning: skipping calendar event 'Someday'"), std::string::npos);
}

TEST_F(SyncTest, UnreadableDueDateIsSkippedWithWarning) {
    Feed feed;
    Course c;
    c.course_code = "CS 363";
    c.assignments.push_back({"Lab 2", "2024-01-10T23:59:00-05:00", "https://lms/a/2"});
    c.assignments.push_back({"Lab 3", "2024-01-17T23:59:00Z", "https://lms/a/3"});
    feed.courses.push_back(c);

    Calendar cal = build_calendar(feed, engine, options());
    ASSERT_EQ(cal.size(), 1u);
    EXPECT_EQ(cal.events()[0].summary, "📝 Lab 3 (CS 363)");
    EXPECT_NE(log.str().find("warning: skipping assignment 'Lab 2'"), std::string::npos);
}

TEST(Utf8PrefixTest, CountsCodePoints) {
    EXPECT_EQ(utf8_prefix("héllo", 2), "hé");
    EXPECT_EQ(utf8_prefix("abc", 10), "abc");
    EXPECT_EQ(utf8_prefix("abc", 0), "");
}
