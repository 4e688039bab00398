#include <gtest/gtest.h>
#include <ai-cmdguard/exec/multi_step.hpp>

using namespace cmdguard;

TEST(MultiStepParse, SingleLineIsNotAPlan) {
    EXPECT_FALSE(MultiStepPlan::parse("ls -la").has_value());
    EXPECT_FALSE(MultiStepPlan::parse("").has_value());
    EXPECT_FALSE(MultiStepPlan::parse("# only a comment\nls\n\n").has_value());
}

TEST(MultiStepParse, StepsAndDescriptions) {
    auto plan = MultiStepPlan::parse("mkdir test-project\ncd test-project\ngit init\necho 'Hello World' > README.md\ngit add README.md\ngit commit -m 'Initial commit'");
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->steps().size(), 6u);
    EXPECT_EQ(plan->steps()[0].command, "mkdir test-project");
    EXPECT_EQ(plan->steps()[0].description, "Step 1: mkdir test-project");
    EXPECT_EQ(plan->steps()[5].number, 6);
}

TEST(MultiStepParse, CommentsSkipped) {
    auto plan = MultiStepPlan::parse("# This is a comment\nmkdir test\n# Another comment\n  cd test  ");
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->steps().size(), 2u);
    EXPECT_EQ(plan->steps()[1].command, "cd test");
}

TEST(MultiStepParse, LongCommandDescriptionTruncated) {
    std::string cmd = "echo " + std::string(55, 'x');
    auto plan = MultiStepPlan::parse(cmd + "\nls");
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->steps()[0].description, "Step 1: " + cmd.substr(0, 47) + "...");
    EXPECT_EQ(plan->steps()[0].command, cmd);
}

TEST(MultiStepParse, Dependencies) {
    auto plan = MultiStepPlan::parse("mkdir a\ncd a || true\nls; pwd\nmake && make install\ntouch done");
    ASSERT_TRUE(plan.has_value());
    auto &s = plan->steps();
    EXPECT_FALSE(s[0].depends_on_previous);
    EXPECT_FALSE(s[1].depends_on_previous);
    EXPECT_FALSE(s[2].depends_on_previous);
    EXPECT_TRUE(s[3].depends_on_previous);
    EXPECT_TRUE(s[4].depends_on_previous);
}

TEST(MultiStepProgress, WalkThrough) {
    auto plan = MultiStepPlan::parse("mkdir test\ncd test\ntouch file.txt");
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->progress(), (std::pair<std::size_t, std::size_t>{0, 3}));
    EXPECT_TRUE(plan->has_more_steps());
    auto *step = plan->next_step();
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->command, "mkdir test");

    EXPECT_TRUE(plan->complete_current_step(true));
    EXPECT_EQ(plan->progress().first, 1u);
    EXPECT_TRUE(plan->complete_current_step(true));
    EXPECT_TRUE(plan->complete_current_step(true));
    EXPECT_EQ(plan->progress(), (std::pair<std::size_t, std::size_t>{3, 3}));
    EXPECT_FALSE(plan->has_more_steps());
    EXPECT_EQ(plan->next_step(), nullptr);
    EXPECT_FALSE(plan->complete_current_step(true));
}

TEST(MultiStepProgress, FailureStopsDependentStep) {
    auto plan = MultiStepPlan::parse("mkdir a\ncd a");
    ASSERT_TRUE(plan.has_value());
    EXPECT_FALSE(plan->complete_current_step(false));
    EXPECT_TRUE(plan->has_more_steps());

    auto independent = MultiStepPlan::parse("mkdir a\necho x || true");
    ASSERT_TRUE(independent.has_value());
    EXPECT_TRUE(independent->complete_current_step(false));
}

TEST(MultiStepDisplay, Markers) {
    auto plan = MultiStepPlan::parse("mkdir test\ncd test\ntouch file.txt");
    ASSERT_TRUE(plan.has_value());
    plan->complete_current_step(true);
    std::string out = plan->format_for_display();
    EXPECT_EQ(out.rfind("Multi-step execution (3 steps):\n", 0), 0u);
    EXPECT_NE(out.find("✓ Step 1: mkdir test"), std::string::npos);
    EXPECT_NE(out.find("→ Step 2: cd test"), std::string::npos);
}

TEST(MultiStepEvaluate, ValidatesAndResolvesEachStep) {
    auto plan = MultiStepPlan::parse("ls --hidden\nrm -rf /\ncat /path/to/file");
    ASSERT_TRUE(plan.has_value());
    CommandValidator validator;
    Configuration config; config.safety_level = SafetyLevel::High;
    plan->evaluate(validator, config);
    auto &s = plan->steps();
    ASSERT_TRUE(s[0].validation && s[0].mode);
    EXPECT_EQ(s[0].validation->command, "ls -a");
    EXPECT_TRUE(s[0].mode->requires_confirmation());
    EXPECT_EQ(*s[1].mode, ExecutionMode::blocked("Command blocked due to high safety level"));
    EXPECT_TRUE(s[2].validation->is_invalid());
    EXPECT_TRUE(s[2].mode->is_blocked());
    EXPECT_NE(plan->format_for_display().find("[BLOCKED"), std::string::npos);
}
