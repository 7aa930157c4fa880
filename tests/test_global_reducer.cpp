/**
 * test_global_reducer.cpp
 *
 * Tests for merging partial statistics and deriving metrics from them.
 */
#include "global_reducer.hpp"
#include "test_utils.hpp"

namespace {

TEST(GlobalReducerTest, SumPartials)
{
  std::vector<arma::umat> partials(3);
  partials[0] = { { 1, 0 }, { 2, 1 } };
  partials[1] = { { 0, 0 }, { 0, 0 } };
  partials[2] = { { 4, 2 }, { 1, 3 } };

  const arma::umat sum = SumPartials(partials, 2, 2);
  EXPECT_EQ(sum(0, 0), 5u);
  EXPECT_EQ(sum(0, 1), 2u);
  EXPECT_EQ(sum(1, 0), 3u);
  EXPECT_EQ(sum(1, 1), 4u);
}

TEST(GlobalReducerTest, SumOfNoPartialsIsZero)
{
  const arma::mat sum = SumPartials(std::vector<arma::mat>(), 3, 3);
  EXPECT_EQ(sum.n_rows, 3u);
  EXPECT_DOUBLE_EQ(arma::accu(sum), 0.0);
}

TEST(GlobalReducerTest, SumPartialsRejectsWrongShape)
{
  std::vector<arma::mat> partials(2);
  partials[0].zeros(2, 2);
  partials[1].zeros(3, 2);

  EXPECT_THROW(SumPartials(partials, 2, 2), std::invalid_argument);
}

TEST(GlobalReducerTest, Accuracy)
{
  arma::umat counts(2, 1);
  counts(0, 0) = 3;
  counts(1, 0) = 4;
  EXPECT_DOUBLE_EQ(AccuracyFromCounts(counts), 0.75);

  const arma::umat empty(2, 1, arma::fill::zeros);
  EXPECT_METRIC_ERROR(AccuracyFromCounts(empty), MetricErrorKind::EMPTY_INPUT);
}

TEST(GlobalReducerTest, PrecisionAveragingModes)
{
  // Class 0: 1 TP, 0 FP; class 1: 2 TP, 1 FP.
  const arma::umat tpfp = { { 1, 0 }, { 2, 1 } };

  EXPECT_DOUBLE_EQ(PrecisionFromCounts(tpfp, PrecisionAverage::BINARY),
      2.0 / 3.0);
  EXPECT_DOUBLE_EQ(PrecisionFromCounts(tpfp, PrecisionAverage::MACRO),
      (1.0 + 2.0 / 3.0) / 2.0);
  EXPECT_DOUBLE_EQ(PrecisionFromCounts(tpfp, PrecisionAverage::MICRO),
      3.0 / 4.0);
}

TEST(GlobalReducerTest, PrecisionOfUnpredictedClassIsZero)
{
  const arma::umat tpfp = { { 0, 0 }, { 2, 2 }, { 3, 1 } };

  EXPECT_DOUBLE_EQ(PrecisionFromCounts(tpfp, PrecisionAverage::MACRO),
      (0.0 + 0.5 + 0.75) / 3.0);
  EXPECT_DOUBLE_EQ(PrecisionFromCounts(tpfp, PrecisionAverage::MICRO),
      5.0 / 8.0);

  const arma::umat none(2, 2, arma::fill::zeros);
  EXPECT_DOUBLE_EQ(PrecisionFromCounts(none, PrecisionAverage::MICRO), 0.0);
  EXPECT_DOUBLE_EQ(PrecisionFromCounts(none, PrecisionAverage::BINARY), 0.0);
}

TEST(GlobalReducerTest, PrecisionClassChecks)
{
  const arma::umat three(3, 2, arma::fill::ones);
  EXPECT_METRIC_ERROR(PrecisionFromCounts(three, PrecisionAverage::BINARY),
      MetricErrorKind::INVALID_AVERAGING_MODE);

  const arma::umat one(1, 2, arma::fill::ones);
  EXPECT_METRIC_ERROR(PrecisionFromCounts(one, PrecisionAverage::MACRO),
      MetricErrorKind::DEGENERATE_LABEL_SPACE);
  EXPECT_METRIC_ERROR(PrecisionFromCounts(one, PrecisionAverage::BINARY),
      MetricErrorKind::DEGENERATE_LABEL_SPACE);
  EXPECT_METRIC_ERROR(CheckPrecisionClasses(1, PrecisionAverage::MICRO),
      MetricErrorKind::DEGENERATE_LABEL_SPACE);
  EXPECT_NO_THROW(CheckPrecisionClasses(3, PrecisionAverage::MICRO));
}

TEST(GlobalReducerTest, NormalizeByTrueLabels)
{
  const arma::mat cm = { { 1, 3 }, { 0, 0 } };
  const arma::mat n = NormalizeConfusionMatrix(cm,
      ConfusionNormalization::TRUE_LABELS);

  EXPECT_DOUBLE_EQ(n(0, 0), 0.25);
  EXPECT_DOUBLE_EQ(n(0, 1), 0.75);
  EXPECT_DOUBLE_EQ(n(1, 0), 0.0);
  EXPECT_DOUBLE_EQ(n(1, 1), 0.0);
  EXPECT_FALSE(n.has_nan());
}

TEST(GlobalReducerTest, NormalizeByPredictedLabels)
{
  const arma::mat cm = { { 1, 0 }, { 1, 0 } };
  const arma::mat n = NormalizeConfusionMatrix(cm,
      ConfusionNormalization::PREDICTED_LABELS);

  EXPECT_DOUBLE_EQ(n(0, 0), 0.5);
  EXPECT_DOUBLE_EQ(n(1, 0), 0.5);
  EXPECT_DOUBLE_EQ(n(0, 1), 0.0);
  EXPECT_DOUBLE_EQ(n(1, 1), 0.0);
  EXPECT_FALSE(n.has_nan());
}

TEST(GlobalReducerTest, NormalizeByTotal)
{
  const arma::mat cm = { { 1, 1 }, { 0, 2 } };
  const arma::mat n = NormalizeConfusionMatrix(cm, ConfusionNormalization::ALL);
  EXPECT_DOUBLE_EQ(arma::accu(n), 1.0);
  EXPECT_DOUBLE_EQ(n(1, 1), 0.5);

  const arma::mat zero(2, 2, arma::fill::zeros);
  const arma::mat z = NormalizeConfusionMatrix(zero,
      ConfusionNormalization::ALL);
  EXPECT_FALSE(z.has_nan());
  EXPECT_DOUBLE_EQ(arma::accu(z), 0.0);
}

TEST(GlobalReducerTest, NoNormalization)
{
  const arma::mat cm = { { 1, 1 }, { 0, 2 } };
  const arma::mat n = NormalizeConfusionMatrix(cm,
      ConfusionNormalization::NONE);
  EXPECT_TRUE(arma::approx_equal(n, cm, "absdiff", 0.0));
}

TEST(GlobalReducerTest, ParseModes)
{
  EXPECT_EQ(ParsePrecisionAverage("binary"), PrecisionAverage::BINARY);
  EXPECT_EQ(ParsePrecisionAverage("macro"), PrecisionAverage::MACRO);
  EXPECT_EQ(ParsePrecisionAverage("micro"), PrecisionAverage::MICRO);
  EXPECT_THROW(ParsePrecisionAverage("weighted"), std::invalid_argument);

  EXPECT_EQ(ParseConfusionNormalization("none"), ConfusionNormalization::NONE);
  EXPECT_EQ(ParseConfusionNormalization("true"),
      ConfusionNormalization::TRUE_LABELS);
  EXPECT_EQ(ParseConfusionNormalization("pred"),
      ConfusionNormalization::PREDICTED_LABELS);
  EXPECT_EQ(ParseConfusionNormalization("all"), ConfusionNormalization::ALL);
  EXPECT_THROW(ParseConfusionNormalization("rows"), std::invalid_argument);

  EXPECT_EQ(ToString(PrecisionAverage::MACRO), "macro");
  EXPECT_EQ(ToString(ConfusionNormalization::PREDICTED_LABELS), "pred");
}

} // namespace
