#include <gtest/gtest.h>
#include "landmark_reader.hpp"
#include "gesture_classifier.hpp"
#include "gesture_errors.hpp"
#include "synthetic_hand.hpp"
#include <cmath>
#include <sstream>
#include <string>

using namespace landmarks;

namespace {

std::string landmark_array(int count, bool with_z = false) {
    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < count; ++i) {
        if (i) oss << ",";
        oss << "[" << 10 + i << "," << 20 + i;
        if (with_z) oss << ",-0.5";
        oss << "]";
    }
    oss << "]";
    return oss.str();
}

} // namespace

TEST(LandmarkReaderTest, ParsesFrameWithTimestamp) {
    std::istringstream in("{\"t\": 1.25, \"landmarks\": " + landmark_array(21) + "}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 1.25);
    EXPECT_TRUE(frame.has_hand);
    ASSERT_EQ(frame.landmarks.size(), 21u);
    EXPECT_FLOAT_EQ(frame.landmarks[0].x, 10.0f);
    EXPECT_FLOAT_EQ(frame.landmarks[20].y, 40.0f);

    EXPECT_FALSE(reader.next(frame));
}

TEST(LandmarkReaderTest, NoHandVariants) {
    std::istringstream in(
        "{\"t\": 0.1, \"landmarks\": null}\n"
        "{\"t\": 0.2}\n"
        "{\"t\": 0.3, \"landmarks\": []}\n"
        "{\"t\": 0.4, \"hands\": []}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    int frames = 0;
    while (reader.next(frame)) {
        ++frames;
        EXPECT_FALSE(frame.has_hand) << "frame " << frames;
        EXPECT_TRUE(frame.landmarks.empty());
    }
    EXPECT_EQ(frames, 4);
    EXPECT_EQ(reader.get_stats().malformed_lines, 0u);
}

TEST(LandmarkReaderTest, HandsListUsesFirstHand) {
    std::istringstream in(
        "{\"t\": 2.0, \"hands\": [{\"lmList\": " + landmark_array(21, true) + "},"
        " {\"lmList\": " + landmark_array(5) + "}]}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    EXPECT_TRUE(frame.has_hand);
    ASSERT_EQ(frame.landmarks.size(), 21u);
    EXPECT_FLOAT_EQ(frame.landmarks[3].x, 13.0f);
    EXPECT_FLOAT_EQ(frame.landmarks[3].y, 23.0f);
}

TEST(LandmarkReaderTest, SkipsBlankLinesAndComments) {
    std::istringstream in(
        "\n"
        "# recorded session\n"
        "   \n"
        "{\"t\": 0.5, \"landmarks\": null}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.5);
    EXPECT_FALSE(reader.next(frame));
    EXPECT_EQ(reader.get_stats().lines_read, 4u);
    EXPECT_EQ(reader.get_stats().frames_delivered, 1u);
}

TEST(LandmarkReaderTest, MalformedLineBecomesNoHandFrame) {
    std::istringstream in(
        "{\"t\": 0.5, \"landmarks\": " + landmark_array(21) + "}\n"
        "{\"t\": 0.6, \"landmarks\": [[1,2],\n"
        "[1, 2, 3]\n"
        "{\"t\": 0.7, \"landmarks\": null}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    EXPECT_TRUE(frame.has_hand);

    ASSERT_TRUE(reader.next(frame));
    EXPECT_FALSE(frame.has_hand);
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.5);

    ASSERT_TRUE(reader.next(frame));
    EXPECT_FALSE(frame.has_hand);

    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.7);

    EXPECT_EQ(reader.get_stats().malformed_lines, 2u);
}

TEST(LandmarkReaderTest, NonNumericPointIsRejectedByClassifier) {
    std::string lms = landmark_array(20);
    lms.insert(lms.size() - 1, ",[\"a\", 3]");
    std::istringstream in("{\"t\": 1.0, \"landmarks\": " + lms + "}\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    ASSERT_TRUE(frame.has_hand);
    ASSERT_EQ(frame.landmarks.size(), 21u);
    EXPECT_TRUE(std::isnan(frame.landmarks[20].x));

    gesture::GestureClassifier classifier;
    EXPECT_THROW(classifier.classify(frame.landmarks), gesture::InvalidInput);
}

TEST(LandmarkReaderTest, MissingTimestampUsesReaderClock) {
    std::istringstream in("{\"landmarks\": null}\n{\"landmarks\": null}\n");
    LandmarkReader reader(in);
    LandmarkFrame first, second;

    ASSERT_TRUE(reader.next(first));
    ASSERT_TRUE(reader.next(second));
    EXPECT_GE(first.timestamp, 0.0);
    EXPECT_GE(second.timestamp, first.timestamp);
}

TEST(LandmarkReaderTest, WrittenFramesReadBack) {
    LandmarkFrame out;
    out.timestamp = 3.5;
    out.has_hand = true;
    out.landmarks = SyntheticHand::pointing(90.0).build();

    LandmarkFrame empty;
    empty.timestamp = 3.6;

    std::istringstream in(to_json_line(out) + "\n" + to_json_line(empty) + "\n");
    LandmarkReader reader(in);
    LandmarkFrame frame;

    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 3.5);
    ASSERT_EQ(frame.landmarks.size(), out.landmarks.size());
    EXPECT_FLOAT_EQ(frame.landmarks[8].x, out.landmarks[8].x);
    EXPECT_FLOAT_EQ(frame.landmarks[8].y, out.landmarks[8].y);

    ASSERT_TRUE(reader.next(frame));
    EXPECT_FALSE(frame.has_hand);
}
