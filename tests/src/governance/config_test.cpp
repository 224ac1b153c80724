#include <ballot/governance/config.hpp>
#include <ballot/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <string>

namespace {

std::string write_config(const std::string_view prefix,
                         const std::string_view contents) {
  auto path = ballot::testing::make_db_path(prefix) + ".ini";
  auto out = std::ofstream{path};
  out << contents;
  return path;
}

}  // namespace

TEST(governance_config, defaults_are_valid) {
  auto config = ballot::governance::governance_config{};
  auto error = std::string{};
  EXPECT_TRUE(ballot::governance::validate_config(config, error));
  EXPECT_EQ(config.voting_delay, 0u);
  EXPECT_EQ(config.voting_period, 604'800'000u);
  EXPECT_EQ(config.execution_delay, 172'800'000u);
  EXPECT_EQ(config.approval_threshold_percent, 50u);
  EXPECT_EQ(config.weighting, ballot::schema::vote_weighting_t::linear);
  EXPECT_FALSE(config.abstain_counts_toward_approval);
  EXPECT_EQ(config.max_actions, 16u);
}

TEST(governance_config, validate_rejects_out_of_range_threshold) {
  auto config = ballot::governance::governance_config{};
  auto error = std::string{};
  config.approval_threshold_percent = 0;
  EXPECT_FALSE(ballot::governance::validate_config(config, error));
  EXPECT_NE(error.find("approval_threshold_percent"), std::string::npos);

  config.approval_threshold_percent = 101;
  EXPECT_FALSE(ballot::governance::validate_config(config, error));

  config.approval_threshold_percent = 100;
  config.voting_period = 0;
  EXPECT_FALSE(ballot::governance::validate_config(config, error));
  EXPECT_NE(error.find("voting_period"), std::string::npos);
}

TEST(governance_config, load_reads_governance_section) {
  auto canceller = std::string(64, 'a');
  auto executor = std::string(64, 'b');
  auto path = write_config("ballot_config_full",
                           "[governance]\n"
                           "voting_delay_ms = 5\n"
                           "voting_period_ms = 100\n"
                           "execution_delay_ms = 60\n"
                           "quorum = 1000\n"
                           "approval_threshold_percent = 60\n"
                           "proposal_threshold = 25\n"
                           "weighting = quadratic\n"
                           "abstain_counts_toward_approval = true\n"
                           "max_actions = 4\n"
                           "canceller = " +
                               canceller + "\nexecutor = 0x" + executor +
                               "\n");

  auto config = ballot::governance::governance_config{};
  auto error = std::string{};
  ASSERT_TRUE(ballot::governance::load_config(path, config, error)) << error;
  EXPECT_EQ(config.voting_delay, 5u);
  EXPECT_EQ(config.voting_period, 100u);
  EXPECT_EQ(config.execution_delay, 60u);
  EXPECT_EQ(config.quorum, 1000);
  EXPECT_EQ(config.approval_threshold_percent, 60u);
  EXPECT_EQ(config.proposal_threshold, 25);
  EXPECT_EQ(config.weighting, ballot::schema::vote_weighting_t::quadratic);
  EXPECT_TRUE(config.abstain_counts_toward_approval);
  EXPECT_EQ(config.max_actions, 4u);
  ASSERT_EQ(config.cancellers.size(), 1u);
  EXPECT_EQ(config.cancellers[0][0], 0xAA);
  ASSERT_EQ(config.executors.size(), 1u);
  EXPECT_EQ(config.executors[0][31], 0xBB);
  EXPECT_TRUE(config.queuers.empty());
  ballot::testing::remove_path(path);
}

TEST(governance_config, load_keeps_unset_fields) {
  auto path = write_config("ballot_config_partial",
                           "[governance]\nquorum = 7\n");
  auto config = ballot::governance::governance_config{};
  config.execution_delay = 99;
  auto error = std::string{};
  ASSERT_TRUE(ballot::governance::load_config(path, config, error)) << error;
  EXPECT_EQ(config.quorum, 7);
  EXPECT_EQ(config.execution_delay, 99u);
  ballot::testing::remove_path(path);
}

TEST(governance_config, load_reports_bad_values_and_leaves_config_unchanged) {
  auto error = std::string{};
  auto config = ballot::governance::governance_config{};

  auto bad_weighting = write_config("ballot_config_weighting",
                                    "[governance]\nweighting = cubic\n");
  EXPECT_FALSE(ballot::governance::load_config(bad_weighting, config, error));
  EXPECT_NE(error.find("weighting"), std::string::npos);
  ballot::testing::remove_path(bad_weighting);

  auto bad_account = write_config("ballot_config_account",
                                  "[governance]\nqueuer = 1234\n");
  EXPECT_FALSE(ballot::governance::load_config(bad_account, config, error));
  EXPECT_NE(error.find("queuer"), std::string::npos);
  ballot::testing::remove_path(bad_account);

  auto bad_threshold =
      write_config("ballot_config_threshold",
                   "[governance]\napproval_threshold_percent = 0\n");
  EXPECT_FALSE(ballot::governance::load_config(bad_threshold, config, error));
  ballot::testing::remove_path(bad_threshold);

  EXPECT_EQ(config.weighting, ballot::schema::vote_weighting_t::linear);
  EXPECT_TRUE(config.queuers.empty());
  EXPECT_EQ(config.approval_threshold_percent, 50u);
}

TEST(governance_config, load_fails_for_missing_file) {
  auto config = ballot::governance::governance_config{};
  auto error = std::string{};
  EXPECT_FALSE(ballot::governance::load_config(
      "/nonexistent/ballot/governance.ini", config, error));
  EXPECT_FALSE(error.empty());
}
