#include <gtest/gtest.h>

#include "media_relay/errors.hpp"
#include "media_relay/types.hpp"

using namespace media_relay;

TEST(RetryPolicy, OnlyTransientNetworkErrorsAreRetried) {
  EXPECT_TRUE(retry_policy_for(ErrorKind::ConnectionFailed).retryable);
  EXPECT_TRUE(retry_policy_for(ErrorKind::RemoteWriteFailed).retryable);
  EXPECT_EQ(retry_policy_for(ErrorKind::ConnectionFailed).max_attempts, 5);

  for (ErrorKind kind :
       {ErrorKind::AuthenticationFailed, ErrorKind::ChecksumMismatch,
        ErrorKind::NotFound, ErrorKind::UnreadableContainer,
        ErrorKind::RemuxFailed, ErrorKind::Cancelled}) {
    EXPECT_FALSE(retry_policy_for(kind).retryable) << error_name(kind);
    EXPECT_EQ(retry_policy_for(kind).max_attempts, 1) << error_name(kind);
  }
}

TEST(ErrorNames, ParseBack) {
  ErrorKind kind = ErrorKind::None;
  ASSERT_TRUE(parse_error_name("ChecksumMismatch", kind));
  EXPECT_EQ(kind, ErrorKind::ChecksumMismatch);
  EXPECT_FALSE(parse_error_name("checksum", kind));
}

TEST(PipelineStates, TerminalSet) {
  EXPECT_TRUE(is_terminal(PipelineState::CleanedUp));
  EXPECT_TRUE(is_terminal(PipelineState::CleanedUpPartial));
  EXPECT_TRUE(is_terminal(PipelineState::Failed));
  EXPECT_TRUE(is_terminal(PipelineState::Skipped));
  EXPECT_FALSE(is_terminal(PipelineState::Verified));
  EXPECT_FALSE(is_terminal(PipelineState::Transferring));

  PipelineState state = PipelineState::Discovered;
  ASSERT_TRUE(parse_state(to_string(PipelineState::CleanedUpPartial), state));
  EXPECT_EQ(state, PipelineState::CleanedUpPartial);
}

TEST(LanguageBucket, Aliases) {
  EXPECT_EQ(language_bucket("ML"), Language::Malayalam);
  EXPECT_EQ(language_bucket("malayalam"), Language::Malayalam);
  EXPECT_EQ(language_bucket("en"), Language::English);
  EXPECT_EQ(language_bucket("tam"), Language::Other);
  EXPECT_TRUE(is_untagged("und"));
  EXPECT_TRUE(is_untagged(""));
}
