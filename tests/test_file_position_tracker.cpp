// EN: Unit tests for FilePositionTracker and rewindToLineStart.
// FR: Tests unitaires pour FilePositionTracker et rewindToLineStart.

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "loopsaver/iteration/file_position_tracker.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"
#include "loopsaver/state/checkpoint_store.hpp"

using namespace LSV;

namespace {

const std::string kLines = "alpha\nbeta\ngamma\ndelta\n";

std::unique_ptr<std::istream> makeStream(const std::string& text) {
    return std::make_unique<std::istringstream>(text, std::ios::in | std::ios::binary);
}

} // namespace

// EN: Properties of the backward scan, checked at every offset of several inputs
// FR: Propriétés du parcours à rebours, vérifiées à chaque offset de plusieurs entrées
class RewindToLineStartTest : public ::testing::TestWithParam<size_t> {
protected:
    void checkEveryOffset(const std::string& text) {
        const size_t step = GetParam();
        for (std::streamoff pos = 0; pos <= static_cast<std::streamoff>(text.size()); ++pos) {
            std::istringstream stream(text);
            const std::streamoff r = rewindToLineStart(stream, pos, step);

            SCOPED_TRACE("pos=" + std::to_string(pos) + " step=" + std::to_string(step));
            EXPECT_LE(r, pos);
            EXPECT_TRUE(r == 0 || text[static_cast<size_t>(r - 1)] == '\n');
            for (std::streamoff i = r; i + 1 < pos; ++i) {
                EXPECT_NE(text[static_cast<size_t>(i)], '\n') << "newline skipped at " << i;
            }
            EXPECT_EQ(static_cast<std::streamoff>(stream.tellg()), r);
        }
    }
};

TEST_P(RewindToLineStartTest, EveryOffset_ShouldLandOnTheEnclosingLineStart) {
    checkEveryOffset("ab\ncd\nef\n");
    checkEveryOffset(kLines);
    checkEveryOffset("no newline at all");
    checkEveryOffset("\n\n\nx\n\n");
    checkEveryOffset(std::string(250, 'x') + "\n" + std::string(320, 'y') + "\nz");
}

INSTANTIATE_TEST_SUITE_P(WindowSteps, RewindToLineStartTest, ::testing::Values(1, 2, 100),
                         [](const ::testing::TestParamInfo<size_t>& info) {
                             return "Step" + std::to_string(info.param);
                         });

TEST(RewindToLineStartExamples, ShortLines_ShouldMatchKnownOffsets) {
    const std::string text = "ab\ncd\nef\n";

    std::istringstream inside(text);
    EXPECT_EQ(rewindToLineStart(inside, 4), 3);

    // EN: Offset just past a line's terminator rewinds to that line's start
    // FR: Un offset juste après le terminateur d'une ligne revient au début de cette ligne
    std::istringstream after_newline(text);
    EXPECT_EQ(rewindToLineStart(after_newline, 6), 3);

    std::istringstream first_line(text);
    EXPECT_EQ(rewindToLineStart(first_line, 3), 0);

    std::istringstream zero(text);
    EXPECT_EQ(rewindToLineStart(zero, 0), 0);
}

TEST(RewindToLineStartExamples, ZeroWindow_ShouldBeRejected) {
    std::istringstream stream("abc\n");
    EXPECT_THROW(rewindToLineStart(stream, 2, 0), std::invalid_argument);
}

class FilePositionTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("lsv_tracker_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        checkpoint_ = test_dir_ / "position.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void writeCheckpoint(const std::string& content) {
        std::ofstream out(checkpoint_, std::ios::binary | std::ios::trunc);
        out << content;
    }

    int64_t savedPosition() const {
        return CheckpointStore(checkpoint_).load().get<int64_t>(kPositionKey);
    }

    static std::vector<std::string> drain(FilePositionTracker& tracker) {
        std::vector<std::string> lines;
        for (const std::string& line : tracker) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path checkpoint_;
};

TEST_F(FilePositionTrackerTest, Interruption_ShouldResumeAfterLastReadLine) {
    {
        FilePositionTracker tracker(makeStream(kLines), checkpoint_);
        EXPECT_EQ(tracker.nextLine(), "alpha");
        EXPECT_EQ(tracker.nextLine(), "beta");
        EXPECT_EQ(tracker.position(), 11);
    }
    EXPECT_EQ(savedPosition(), 11);

    FilePositionTracker resumed(makeStream(kLines), checkpoint_);
    EXPECT_EQ(resumed.startOffset(), 11);
    EXPECT_FALSE(resumed.realigned());
    EXPECT_EQ(drain(resumed), (std::vector<std::string>{"gamma", "delta"}));
    EXPECT_FALSE(std::filesystem::exists(checkpoint_));
}

TEST_F(FilePositionTrackerTest, ReplayInFlight_ShouldSaveStartOfLastLine) {
    IterationOptions options;
    options.replay_in_flight = true;
    {
        FilePositionTracker tracker(makeStream(kLines), checkpoint_, options);
        tracker.nextLine();
        tracker.nextLine();
    }
    EXPECT_EQ(savedPosition(), 6);

    FilePositionTracker resumed(makeStream(kLines), checkpoint_, options);
    EXPECT_EQ(drain(resumed), (std::vector<std::string>{"beta", "gamma", "delta"}));
}

TEST_F(FilePositionTrackerTest, ReplayInFlight_BeforeAnyLineShouldSaveCurrentOffset) {
    IterationOptions options;
    options.replay_in_flight = true;
    {
        FilePositionTracker tracker(makeStream(kLines), checkpoint_, options);
    }
    EXPECT_EQ(savedPosition(), 0);
}

TEST_F(FilePositionTrackerTest, MidLineOffset_ShouldRealignToLineStart) {
    writeCheckpoint("{\"pos\":8}\n");

    FilePositionTracker tracker(makeStream(kLines), checkpoint_);
    EXPECT_TRUE(tracker.realigned());
    EXPECT_EQ(tracker.startOffset(), 6);
    EXPECT_EQ(tracker.nextLine(), "beta");
}

TEST_F(FilePositionTrackerTest, RewindDisabled_ShouldStartAtSavedOffset) {
    writeCheckpoint("{\"pos\":8}\n");

    IterationOptions options;
    options.rewind_on_resume = false;
    FilePositionTracker tracker(makeStream(kLines), checkpoint_, options);
    EXPECT_FALSE(tracker.realigned());
    EXPECT_EQ(tracker.startOffset(), 8);
    EXPECT_EQ(tracker.nextLine(), "ta");
}

TEST_F(FilePositionTrackerTest, SmallRewindWindow_ShouldStillFindLineStart) {
    const std::string text = "header\n" + std::string(500, 'x') + "\nnext\n";
    writeCheckpoint("{\"pos\":400}\n");

    IterationOptions options;
    options.rewind_window = 3;
    FilePositionTracker tracker(makeStream(text), checkpoint_, options);
    EXPECT_EQ(tracker.startOffset(), 7);
    EXPECT_EQ(tracker.nextLine(), std::string(500, 'x'));
    EXPECT_EQ(tracker.nextLine(), "next");
}

TEST_F(FilePositionTrackerTest, AuxiliaryState_ShouldSurviveAndPosShouldBeReserved) {
    {
        FilePositionTracker tracker(makeStream(kLines), checkpoint_);
        tracker.nextLine();
        tracker.set("lines_seen", 1);
        EXPECT_THROW(tracker.set(kPositionKey, 0), std::invalid_argument);
        EXPECT_THROW(tracker.erase(kPositionKey), std::invalid_argument);
    }

    FilePositionTracker resumed(makeStream(kLines), checkpoint_);
    EXPECT_EQ(resumed.get<int>("lines_seen"), 1);
    EXPECT_EQ(resumed.get<int64_t>(kPositionKey), 6);
    EXPECT_EQ(resumed.nextLine(), "beta");
}

TEST_F(FilePositionTrackerTest, InvalidSavedPosition_ShouldRaiseCorruptCheckpoint) {
    writeCheckpoint("{\"pos\":-3}\n");
    EXPECT_THROW(FilePositionTracker(makeStream(kLines), checkpoint_), CorruptCheckpointError);

    writeCheckpoint("{\"pos\":\"12\"}\n");
    EXPECT_THROW(FilePositionTracker(makeStream(kLines), checkpoint_), CorruptCheckpointError);

    writeCheckpoint("{\"pos\":1.5}\n");
    EXPECT_THROW(FilePositionTracker(makeStream(kLines), checkpoint_), CorruptCheckpointError);
}

TEST_F(FilePositionTrackerTest, Close_ShouldReleaseStreamAndStopIteration) {
    FilePositionTracker tracker(makeStream(kLines), checkpoint_);
    tracker.nextLine();
    EXPECT_TRUE(tracker.streamOpen());

    tracker.close(CompletionStatus::Interrupted);
    EXPECT_FALSE(tracker.streamOpen());
    EXPECT_TRUE(tracker.closed());
    EXPECT_FALSE(tracker.nextLine().has_value());
    EXPECT_EQ(savedPosition(), 6);
}

TEST_F(FilePositionTrackerTest, ForEachStop_ShouldPersistOffsetAfterStoppedLine) {
    {
        FilePositionTracker tracker(makeStream(kLines), checkpoint_);
        std::vector<std::string> seen;
        CompletionStatus status = tracker.forEach([&](const std::string& line) {
            seen.push_back(line);
            return line == "beta" ? LoopControl::Stop : LoopControl::Continue;
        });
        EXPECT_EQ(status, CompletionStatus::Interrupted);
        EXPECT_EQ(seen, (std::vector<std::string>{"alpha", "beta"}));
        EXPECT_FALSE(tracker.streamOpen());
    }
    EXPECT_EQ(savedPosition(), 11);
}

TEST_F(FilePositionTrackerTest, ForEachCompletion_ShouldEraseCheckpoint) {
    writeCheckpoint("{\"pos\":11,\"run\":\"first\"}\n");

    FilePositionTracker tracker(makeStream(kLines), checkpoint_);
    size_t count = 0;
    EXPECT_EQ(tracker.forEach([&](const std::string&) { ++count; }), CompletionStatus::Completed);
    EXPECT_EQ(count, 2u);
    EXPECT_FALSE(std::filesystem::exists(checkpoint_));
}

TEST_F(FilePositionTrackerTest, LastLineWithoutNewline_ShouldCountOnlyItsBytes) {
    FilePositionTracker tracker(makeStream("one\ntwo"), checkpoint_);
    EXPECT_EQ(tracker.nextLine(), "one");
    EXPECT_EQ(tracker.position(), 4);
    EXPECT_EQ(tracker.nextLine(), "two");
    EXPECT_EQ(tracker.position(), 7);
    EXPECT_FALSE(tracker.nextLine().has_value());
    EXPECT_FALSE(std::filesystem::exists(checkpoint_));
}

TEST_F(FilePositionTrackerTest, OpenFile_ShouldReadFromDiskAndFailOnMissingFile) {
    auto data = test_dir_ / "data.txt";
    {
        std::ofstream out(data, std::ios::binary);
        out << kLines;
    }

    {
        auto tracker = FilePositionTracker::openFile(data, checkpoint_);
        EXPECT_EQ(tracker->nextLine(), "alpha");
    }
    EXPECT_EQ(savedPosition(), 6);

    auto resumed = FilePositionTracker::openFile(data, checkpoint_);
    EXPECT_EQ(resumed->nextLine(), "beta");

    EXPECT_THROW(FilePositionTracker::openFile(test_dir_ / "missing.txt", test_dir_ / "other.json"), IOFailure);
}

TEST_F(FilePositionTrackerTest, Construction_ShouldRejectNullStreamAndZeroWindow) {
    EXPECT_THROW(FilePositionTracker(nullptr, checkpoint_), std::invalid_argument);

    IterationOptions options;
    options.rewind_window = 0;
    EXPECT_THROW(FilePositionTracker(makeStream(kLines), checkpoint_, options), std::invalid_argument);
}
