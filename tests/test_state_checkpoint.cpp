// EN: Unit tests for StateCheckpoint - scoped state kept across interrupted runs.
// FR: Tests unitaires pour StateCheckpoint - état à portée conservé entre exécutions interrompues.

#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "loopsaver/state/state_checkpoint.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

using namespace LSV;

class StateCheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("lsv_state_ckpt_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "state.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
};

TEST_F(StateCheckpointTest, NormalExit_ShouldKeepStateByDefault) {
    {
        StateCheckpoint state(path_);
        EXPECT_EQ(state.size(), 0u);
        state.set("cursor", "page-3");
    }
    ASSERT_TRUE(std::filesystem::exists(path_));

    StateCheckpoint reopened(path_);
    EXPECT_EQ(reopened.get<std::string>("cursor"), "page-3");
}

TEST_F(StateCheckpointTest, NormalExit_WithEraseOnSuccessShouldRemoveFile) {
    {
        StateCheckpoint state(path_, true);
        EXPECT_TRUE(state.eraseOnSuccess());
        state.set("cursor", "page-3");
        state.save();
        EXPECT_TRUE(std::filesystem::exists(path_));
    }
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(StateCheckpointTest, ExceptionUnwinding_ShouldSaveEvenWithEraseOnSuccess) {
    EXPECT_THROW(
        {
            StateCheckpoint state(path_, true);
            state.set("processed", 41);
            throw std::runtime_error("worker crashed");
        },
        std::runtime_error);

    ASSERT_TRUE(std::filesystem::exists(path_));
    StateCheckpoint reopened(path_, true);
    EXPECT_EQ(reopened.get<int>("processed"), 41);
}

TEST_F(StateCheckpointTest, ExplicitClose_ShouldFinalizeOnceAndBlockSave) {
    StateCheckpoint state(path_, true);
    state.set("k", "v");

    state.close(CompletionStatus::Interrupted);
    EXPECT_TRUE(state.closed());
    EXPECT_TRUE(std::filesystem::exists(path_));

    // EN: A later completion is a no-op, the saved file stays
    // FR: Une terminaison ultérieure est sans effet, le fichier sauvegardé reste
    state.close(CompletionStatus::Completed);
    EXPECT_TRUE(std::filesystem::exists(path_));

    EXPECT_THROW(state.save(), std::logic_error);
}

TEST_F(StateCheckpointTest, Scope_ShouldFinalizeAsInterruptedWithoutFinish) {
    StateCheckpoint state(path_, true);
    state.set("step", 2);
    {
        CheckpointScope scope(state);
    }
    EXPECT_TRUE(state.closed());
    EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(StateCheckpointTest, EraseKey_ShouldNotReappearAfterReload) {
    {
        StateCheckpoint state(path_);
        state.set("a", 1);
        state.set("b", 2);
    }
    {
        StateCheckpoint state(path_);
        EXPECT_TRUE(state.erase("a"));
        EXPECT_FALSE(state.erase("missing"));
    }

    StateCheckpoint reopened(path_);
    EXPECT_FALSE(reopened.contains("a"));
    EXPECT_EQ(reopened.getOr<int>("b", 0), 2);
    EXPECT_THROW(reopened.get("a"), NotFoundError);
}

TEST_F(StateCheckpointTest, YamlBackend_ShouldPersistThroughSameLifecycle) {
    auto yaml_path = test_dir_ / "state.yaml";
    {
        StateCheckpoint state(yaml_path, false, makeStateBackend("yaml"));
        state.set("offset", 128);
    }

    StateCheckpoint reopened(yaml_path, false, makeStateBackend("yaml"));
    EXPECT_EQ(reopened.get<int>("offset"), 128);
}
