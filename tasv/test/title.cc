#include <gtest/gtest.h>
#include <tasv/submissions/queries.hh>
#include <tasv/submissions/title.hh>

using std::string;
using std::vector;
using namespace tasv::submissions;

// NOLINTNEXTLINE
TEST(Title, movie_time) {
    EXPECT_EQ(movie_time(0, std::nullopt), "00:00.000");
    EXPECT_EQ(movie_time(60, std::nullopt), "00:01.000");
    EXPECT_EQ(movie_time(1, 60.0), "00:00.017");
    EXPECT_EQ(movie_time(17868, 60.0988138974405), "04:57.310");
    EXPECT_EQ(movie_time(600, 50.0069789081886), "00:11.998");
    EXPECT_EQ(movie_time(60 * 3723, 60.0), "1:02:03.000");
    EXPECT_EQ(movie_time(120, 0.0), "00:02.000");
}

// NOLINTNEXTLINE
TEST(Title, join_authors) {
    EXPECT_EQ(join_authors({}), "");
    EXPECT_EQ(join_authors({"a"}), "a");
    EXPECT_EQ(join_authors({"a", "b"}), "a & b");
    EXPECT_EQ(join_authors({"a", "b", "c"}), "a, b & c");
}

// NOLINTNEXTLINE
TEST(Title, all_authors) {
    EXPECT_EQ(all_authors({"alice"}, ""), (vector<string>{"alice"}));
    EXPECT_EQ(
        all_authors({"alice", "dave"}, " bisqwit,, , Mr. Pineapple "),
        (vector<string>{"alice", "dave", "bisqwit", "Mr. Pineapple"})
    );
    EXPECT_EQ(all_authors({}, "x"), (vector<string>{"x"}));
}

// NOLINTNEXTLINE
TEST(Title, normalize_csv) {
    EXPECT_EQ(normalize_csv(""), "");
    EXPECT_EQ(normalize_csv(" , ,"), "");
    EXPECT_EQ(normalize_csv("a,b"), "a, b");
    EXPECT_EQ(normalize_csv("  a  ,,b c ,"), "a, b c");
}

// NOLINTNEXTLINE
TEST(Title, submission_title) {
    TitleParts parts{
        .system_code = "NES",
        .game_name = "Super Mario Bros.",
        .goal = "warpless",
        .authors = {"alice", "dave"},
        .frames = 17868,
        .frame_rate = 60.0988138974405,
    };
    EXPECT_EQ(
        submission_title(12, parts),
        "#12: alice & dave's NES Super Mario Bros. \"warpless\" in 04:57.310"
    );
    parts.goal.clear();
    EXPECT_EQ(submission_title(12, parts), "#12: alice & dave's NES Super Mario Bros. in 04:57.310");
}

// NOLINTNEXTLINE
TEST(Title, publication_title) {
    TitleParts parts{
        .system_code = "SNES",
        .game_name = "Super Metroid",
        .goal = "baseline",
        .authors = {"a", "b", "c"},
        .frames = 60,
        .frame_rate = std::nullopt,
    };
    EXPECT_EQ(publication_title(parts), "SNES Super Metroid by a, b & c in 00:01.000");
    parts.goal = "100%";
    EXPECT_EQ(publication_title(parts), "SNES Super Metroid \"100%\" by a, b & c in 00:01.000");
}
