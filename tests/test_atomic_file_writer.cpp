// EN: Unit tests for AtomicFileWriter - temp sibling, commit by rename, discard on failure.
// FR: Tests unitaires pour AtomicFileWriter - fichier temporaire voisin, commit par renommage, abandon en cas d'échec.

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "loopsaver/state/atomic_file_writer.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"
#include "loopsaver/infrastructure/system/errors.hpp"

using namespace LSV;

class AtomicFileWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("lsv_atomic_writer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        target_ = test_dir_ / "state.ckpt";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path target_;
};

TEST_F(AtomicFileWriterTest, TempPath_ShouldBeSiblingWithTmpSuffix) {
    EXPECT_EQ(AtomicFileWriter::tempPathFor(target_), test_dir_ / "state.ckpt.tmp");
}

TEST_F(AtomicFileWriterTest, Commit_ShouldReplaceTargetAndRemoveTemp) {
    writeFile(target_, "old content\n");

    {
        AtomicFileWriter writer(target_);
        writer.writeLine("first");
        writer.write("second");

        // EN: Target untouched until commit
        // FR: Cible intacte jusqu'au commit
        EXPECT_EQ(readFile(target_), "old content\n");
        EXPECT_TRUE(std::filesystem::exists(writer.tempPath()));

        writer.commit();
        EXPECT_TRUE(writer.committed());
    }

    EXPECT_EQ(readFile(target_), "first\nsecond");
    EXPECT_FALSE(std::filesystem::exists(AtomicFileWriter::tempPathFor(target_)));
}

TEST_F(AtomicFileWriterTest, Destruction_WithoutCommitShouldLeaveTargetIntact) {
    writeFile(target_, "previous\n");

    {
        AtomicFileWriter writer(target_);
        writer.writeLine("partial");
    }

    EXPECT_EQ(readFile(target_), "previous\n");
    EXPECT_FALSE(std::filesystem::exists(AtomicFileWriter::tempPathFor(target_)));
}

TEST_F(AtomicFileWriterTest, Discard_ShouldBeIdempotentAndBlockCommit) {
    AtomicFileWriter writer(target_);
    writer.writeLine("data");
    writer.discard();
    writer.discard();

    EXPECT_FALSE(std::filesystem::exists(writer.tempPath()));
    EXPECT_THROW(writer.commit(), IOFailure);
    EXPECT_FALSE(std::filesystem::exists(target_));
}

TEST_F(AtomicFileWriterTest, Open_ShouldFailInMissingDirectory) {
    auto missing = test_dir_ / "no" / "such" / "dir" / "state.ckpt";
    try {
        AtomicFileWriter writer(missing);
        FAIL() << "Expected IOFailure";
    } catch (const IOFailure& e) {
        EXPECT_EQ(e.path(), AtomicFileWriter::tempPathFor(missing));
        EXPECT_TRUE(static_cast<bool>(e.code()));
    }
}

TEST_F(AtomicFileWriterTest, Commit_ShouldWorkWithoutDurableSync) {
    AtomicFileWriter writer(target_, false);
    writer.write("fast");
    writer.commit();
    EXPECT_EQ(readFile(target_), "fast");
}
