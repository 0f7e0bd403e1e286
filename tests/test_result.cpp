#include <gtest/gtest.h>
#include <idscrub/idscrub.hpp>

#include <memory>

namespace idscrub {
namespace {

TEST(ResultTest, OkResultIsNotError) {
    auto result = Result<int>::ok(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.error_code(), ErrorCode::Success);
}

TEST(ResultTest, ErrorResultIsNotOk) {
    auto result = Result<int>::error(ErrorCode::StoreLocked, "Database is busy");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::StoreLocked);
    EXPECT_EQ(result.error_message(), "Database is busy");
}

TEST(ResultTest, VoidOkResult) {
    auto result = Result<void>::ok();

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::Success);
}

TEST(ResultTest, VoidErrorResult) {
    auto result = Result<void>::error(ErrorCode::WriteFailure);

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::WriteFailure);
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));

    ASSERT_TRUE(result.is_ok());
    auto value = std::move(result).value();
    EXPECT_EQ(*value, 7);
}

TEST(ErrorCodeTest, ToStringConversion) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::Success), "Success");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NotFound), "Not found");
    EXPECT_STREQ(error_code_to_string(ErrorCode::StoreLocked), "Store locked");
    EXPECT_STREQ(error_code_to_string(ErrorCode::StoreCorrupt), "Store corrupt");
    EXPECT_STREQ(error_code_to_string(ErrorCode::PermissionDenied), "Permission denied");
    EXPECT_STREQ(error_code_to_string(ErrorCode::Unknown), "Unknown error");
}

TEST(ErrorCodeTest, OnlyStoreLockedIsRecoverable) {
    EXPECT_TRUE(is_recoverable(ErrorCode::StoreLocked));
    EXPECT_FALSE(is_recoverable(ErrorCode::StoreCorrupt));
    EXPECT_FALSE(is_recoverable(ErrorCode::WriteFailure));
    EXPECT_FALSE(is_recoverable(ErrorCode::NotFound));
}

TEST(OutcomeTest, ErrorsMapToReportStatus) {
    EXPECT_EQ(outcome_for_error(ErrorCode::Success), OutcomeStatus::Ok);
    EXPECT_EQ(outcome_for_error(ErrorCode::NotFound), OutcomeStatus::Skipped);
    EXPECT_EQ(outcome_for_error(ErrorCode::ParseError), OutcomeStatus::Skipped);
    EXPECT_EQ(outcome_for_error(ErrorCode::StoreLocked), OutcomeStatus::Skipped);
    EXPECT_EQ(outcome_for_error(ErrorCode::PermissionDenied), OutcomeStatus::Skipped);
    EXPECT_EQ(outcome_for_error(ErrorCode::Cancelled), OutcomeStatus::Skipped);
    EXPECT_EQ(outcome_for_error(ErrorCode::StoreCorrupt), OutcomeStatus::Failed);
    EXPECT_EQ(outcome_for_error(ErrorCode::WriteFailure), OutcomeStatus::Failed);
    EXPECT_EQ(outcome_for_error(ErrorCode::InvalidParameter), OutcomeStatus::Failed);
}

TEST(RunReportTest, ExitCodes) {
    RunReport report;
    EXPECT_EQ(report.exit_code(), EXIT_OK);

    report.outcomes.push_back({"/a", TargetKind::IdentityFile, OutcomeStatus::Ok,
                               ErrorCode::Success, ""});
    EXPECT_EQ(report.exit_code(), EXIT_OK);

    report.outcomes.push_back({"/b", TargetKind::Store, OutcomeStatus::Skipped,
                               ErrorCode::StoreLocked, "locked"});
    EXPECT_EQ(report.exit_code(), EXIT_PARTIAL);
    EXPECT_EQ(report.count(OutcomeStatus::Ok), 1u);
    EXPECT_EQ(report.count(OutcomeStatus::Skipped), 1u);
    EXPECT_EQ(report.count(OutcomeStatus::Failed), 0u);

    report.fatal = true;
    EXPECT_EQ(report.exit_code(), EXIT_FATAL);
}

TEST(CriteriaTest, DefaultCriteriaMatchTelemetryKeys) {
    auto criteria = default_criteria();

    EXPECT_EQ(criteria.table, "ItemTable");
    EXPECT_EQ(criteria.key_column, "key");
    EXPECT_TRUE(criteria.matches("telemetry.machineId"));
    EXPECT_TRUE(criteria.matches("Augment.vscode-augment"));
    EXPECT_TRUE(criteria.matches("workbench.augment.state"));
    EXPECT_FALSE(criteria.matches("Telemetry.machineId"));
    EXPECT_FALSE(criteria.matches("workbench.panel.telemetry"));
}

TEST(CriteriaTest, NoPatternsMatchNothing) {
    TelemetryRowCriteria criteria;
    EXPECT_FALSE(criteria.matches("telemetry.machineId"));
    EXPECT_FALSE(criteria.matches(""));
}

TEST(CriteriaTest, MatchingIsLiteral) {
    TelemetryRowCriteria criteria;
    criteria.patterns = {{MatchKind::Prefix, "a%"}, {MatchKind::Exact, "b_c"}};

    EXPECT_TRUE(criteria.matches("a%b"));
    EXPECT_FALSE(criteria.matches("ab"));
    EXPECT_TRUE(criteria.matches("b_c"));
    EXPECT_FALSE(criteria.matches("bxc"));
}

TEST(EnumStringTest, MatchKindRoundTrip) {
    for (auto kind : {MatchKind::Prefix, MatchKind::Contains, MatchKind::Exact}) {
        auto parsed = match_kind_from_string(match_kind_to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(match_kind_from_string("glob").has_value());
}

TEST(EnumStringTest, ReportLabels) {
    EXPECT_STREQ(outcome_status_to_string(OutcomeStatus::Skipped), "SKIPPED");
    EXPECT_STREQ(target_kind_to_string(TargetKind::MachineIdFile), "machineid");
    EXPECT_STREQ(protection_mode_to_string(ProtectionMode::Soft), "soft");
    EXPECT_STREQ(platform_to_string(Platform::Linux), "linux");
}

}  // namespace
}  // namespace idscrub
