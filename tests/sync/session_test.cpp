#include "ddsync/sync/session.hpp"

#include <gtest/gtest.h>

using ddsync::ErrorKind;
using ddsync::sync::Direction;
using ddsync::sync::SessionState;
using ddsync::sync::SyncSession;

TEST(SyncSessionTest, StartsIdle) {
    SyncSession session{Direction::Upload, "demo"};

    const auto& info = session.info();
    EXPECT_EQ(info.project, "demo");
    EXPECT_EQ(info.direction, Direction::Upload);
    EXPECT_EQ(info.state, SessionState::Idle);
    EXPECT_EQ(info.files_pending, 0u);
}

TEST(SyncSessionTest, UploadPhasesInOrder) {
    SyncSession session{Direction::Upload, "demo"};

    EXPECT_TRUE(session.transition_to(SessionState::Scanning).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::FetchingRemote).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Planning).is_ok());
    session.update_pending(3, 1024);
    EXPECT_TRUE(session.transition_to(SessionState::Transferring).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Verifying).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Complete).is_ok());

    EXPECT_EQ(session.info().files_pending, 3u);
    EXPECT_EQ(session.info().bytes_pending, 1024u);

    auto illegal = session.transition_to(SessionState::Transferring);
    ASSERT_TRUE(illegal.is_error());
    EXPECT_EQ(illegal.error().kind, ErrorKind::Validation);
}

TEST(SyncSessionTest, DownloadFetchesBeforeScanning) {
    SyncSession session{Direction::Download, "demo"};

    EXPECT_TRUE(session.transition_to(SessionState::FetchingRemote).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Scanning).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Planning).is_ok());
}

TEST(SyncSessionTest, PhasesCannotBeSkippedOrReversed) {
    SyncSession session{Direction::Upload, "demo"};

    EXPECT_TRUE(session.transition_to(SessionState::Transferring).is_error());
    ASSERT_TRUE(session.transition_to(SessionState::Scanning).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Planning).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Scanning).is_error());
    EXPECT_EQ(session.state(), SessionState::Planning);
}

TEST(SyncSessionTest, DryRunCompletesStraightFromPlanning) {
    SyncSession session{Direction::Upload, "demo"};
    ASSERT_TRUE(session.transition_to(SessionState::Scanning).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Planning).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Complete).is_ok());
}

TEST(SyncSessionTest, AllowsFailureFromAnyState) {
    SyncSession session{Direction::Upload, "demo"};
    ASSERT_TRUE(session.transition_to(SessionState::Scanning).is_ok());

    auto failed = session.mark_failed("unreadable file");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.info().last_error, "unreadable file");

    EXPECT_TRUE(session.transition_to(SessionState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Planning).is_error());
}

TEST(SyncSessionTest, CompleteSessionCannotFail) {
    SyncSession session{Direction::Upload, "demo"};
    ASSERT_TRUE(session.transition_to(SessionState::Scanning).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Planning).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Complete).is_ok());

    EXPECT_TRUE(session.mark_failed("late").is_error());
    EXPECT_EQ(session.state(), SessionState::Complete);
    EXPECT_TRUE(session.info().last_error.empty());
}
