#include <cmath>
#include <sstream>

#include "test_helpers.hpp"

using Tessel::Testing::gaussian_clusters;
using Tessel::Testing::small_config;

TEST(EvaluationTest, AccuracyIsOneWhenEveryPredictionMatches) {
    const auto log_probs = torch::log_softmax(torch::tensor({{4.0, 0.0, 0.0}, {0.0, 4.0, 0.0}, {0.0, 0.0, 4.0}}), 1);
    const auto targets = torch::tensor({0, 1, 2}, torch::kLong);
    EXPECT_DOUBLE_EQ(Tessel::Evaluation::accuracy(log_probs, targets), 1.0);
}

TEST(EvaluationTest, AccuracyIsZeroWhenNoPredictionMatches) {
    const auto log_probs = torch::log_softmax(torch::tensor({{4.0, 0.0, 0.0}, {0.0, 4.0, 0.0}, {0.0, 0.0, 4.0}}), 1);
    const auto targets = torch::tensor({1, 2, 0}, torch::kLong);
    EXPECT_DOUBLE_EQ(Tessel::Evaluation::accuracy(log_probs, targets), 0.0);
}

TEST(EvaluationTest, AccuracyCountsPartialMatches) {
    const auto log_probs = torch::log_softmax(torch::tensor({{4.0, 0.0}, {0.0, 4.0}, {4.0, 0.0}, {4.0, 0.0}}), 1);
    const auto targets = torch::tensor({0, 1, 1, 1}, torch::kLong);
    EXPECT_DOUBLE_EQ(Tessel::Evaluation::accuracy(log_probs, targets), 0.5);
}

TEST(EvaluationTest, ReportMatchesManualComputation) {
    torch::manual_seed(17);
    Tessel::Model model(small_config());
    auto [inputs, targets] = gaussian_clusters(10, 12);

    // Uneven final batch.
    const auto report = model.evaluate(inputs, targets, {.batch_size = 7});

    torch::Tensor expected_log_probs;
    {
        torch::NoGradGuard no_grad;
        model.eval();
        expected_log_probs = model.forward(inputs);
        model.train();
    }
    const auto expected_loss = torch::nll_loss(expected_log_probs, targets).item<double>();

    EXPECT_EQ(report.samples, 30u);
    EXPECT_LE(report.correct, report.samples);
    EXPECT_NEAR(report.loss, expected_loss, 1e-5);
    EXPECT_NEAR(report.accuracy, Tessel::Evaluation::accuracy(expected_log_probs, targets), 1e-12);
    EXPECT_DOUBLE_EQ(report.accuracy, static_cast<double>(report.correct) / 30.0);
}

TEST(EvaluationTest, ReportedLossMatchesWeightedMeanWithIgnoredTargets) {
    torch::manual_seed(19);
    Tessel::Model model(small_config());
    model.set_loss(Tessel::Loss::NegativeLogLikelihood({.weight = {2.0, 1.0, 0.5}, .ignore_index = 1}));
    auto [inputs, targets] = gaussian_clusters(9, 12);

    const auto report = model.evaluate(inputs, targets, {.batch_size = 4});

    torch::Tensor log_probs;
    {
        torch::NoGradGuard no_grad;
        model.eval();
        log_probs = model.forward(inputs);
        model.train();
    }
    const auto weight = torch::tensor({2.0, 1.0, 0.5}, torch::kFloat32);
    const auto expected = torch::nll_loss(log_probs, targets, weight, at::Reduction::Mean, 1).item<double>();
    EXPECT_NEAR(report.loss, expected, 1e-5);
}

TEST(EvaluationTest, DoesNotMutateParametersOrTrainingMode) {
    torch::manual_seed(23);
    Tessel::Model model(small_config());
    model.set_optimizer(Tessel::Optimizer::Adam());
    auto [inputs, targets] = gaussian_clusters(6, 12);

    std::vector<torch::Tensor> before;
    for (const auto& parameter : model.parameters()) {
        before.push_back(parameter.detach().clone());
    }

    model.train();
    static_cast<void>(model.evaluate(inputs, targets));
    EXPECT_TRUE(model.is_training());

    model.eval();
    static_cast<void>(model.evaluate(inputs, targets));
    EXPECT_FALSE(model.is_training());

    const auto after = model.parameters();
    for (std::size_t index = 0; index < after.size(); ++index) {
        EXPECT_TRUE(torch::equal(after[index].detach(), before[index]));
        EXPECT_FALSE(after[index].grad().defined());
    }
}

TEST(EvaluationTest, EmptyInputsYieldEmptyReport) {
    Tessel::Model model(small_config());
    const auto report = model.evaluate(torch::zeros({0, 12}), torch::zeros({0}, torch::kLong));
    EXPECT_EQ(report.samples, 0u);
    EXPECT_TRUE(std::isnan(report.accuracy));
}

TEST(EvaluationTest, PrintsSummaryTable) {
    Tessel::Model model(small_config());
    auto [inputs, targets] = gaussian_clusters(2, 12);
    std::ostringstream stream;
    static_cast<void>(model.evaluate(inputs, targets, {.print_summary = true, .stream = &stream}));
    EXPECT_NE(stream.str().find("Accuracy"), std::string::npos);
    EXPECT_NE(stream.str().find("Samples"), std::string::npos);
}

TEST(LossTest, WeightedAndIgnoredTargets) {
    const auto log_probs = torch::log_softmax(torch::tensor({{2.0, 0.0}, {0.0, 2.0}, {1.0, 1.0}}), 1);
    const auto targets = torch::tensor({0, 1, 1}, torch::kLong);

    auto ignore = Tessel::Loss::NegativeLogLikelihood({.ignore_index = 1});
    const auto kept = Tessel::Loss::Details::compute(ignore, log_probs, targets);
    EXPECT_NEAR(kept.item<double>(), -log_probs[0][0].item<double>(), 1e-6);

    auto per_sample = Tessel::Loss::NegativeLogLikelihood({.reduction = Tessel::Loss::Reduction::None});
    EXPECT_EQ(Tessel::Loss::Details::compute(per_sample, log_probs, targets).sizes().vec(), (std::vector<std::int64_t>{3}));

    auto bad_weights = Tessel::Loss::NegativeLogLikelihood({.weight = {1.0, 2.0, 3.0}});
    EXPECT_THROW(static_cast<void>(Tessel::Loss::Details::compute(bad_weights, log_probs, targets)), std::invalid_argument);
}
