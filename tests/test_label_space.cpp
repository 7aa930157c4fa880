/**
 * test_label_space.cpp
 *
 * Tests for LabelSpace, label space resolution, and label file loading.
 */
#include "label_space.hpp"
#include "local_dispatcher.hpp"
#include "label_io.hpp"
#include "data_utils.hpp"
#include "test_utils.hpp"
#include <cstdio>
#include <fstream>

namespace {

TEST(LabelSpaceTest, SortsAndRemovesDuplicates)
{
  const LabelSpace space(arma::Col<arma::sword>({ 2, 0, 2, 1, 0 }));

  ASSERT_EQ(space.NumClasses(), 3u);
  EXPECT_EQ(space.Labels()[0], 0);
  EXPECT_EQ(space.Labels()[1], 1);
  EXPECT_EQ(space.Labels()[2], 2);
  EXPECT_TRUE(space.IsContiguous());
}

TEST(LabelSpaceTest, ContiguousIndex)
{
  const LabelSpace space(arma::Col<arma::sword>({ 0, 1, 2 }));

  EXPECT_EQ(space.Index(0), 0u);
  EXPECT_EQ(space.Index(2), 2u);
  EXPECT_EQ(space.Index(3), 3u);
  EXPECT_EQ(space.Index(-1), 3u);
}

TEST(LabelSpaceTest, NonContiguousIndex)
{
  const LabelSpace space(arma::Col<arma::sword>({ 10, -4, 3 }));

  EXPECT_FALSE(space.IsContiguous());
  EXPECT_EQ(space.Index(-4), 0u);
  EXPECT_EQ(space.Index(3), 1u);
  EXPECT_EQ(space.Index(10), 2u);
  EXPECT_EQ(space.Index(0), 3u);
  EXPECT_EQ(space.Index(11), 3u);

  const arma::uvec indices = space.Indices(MakeLabels({ 10, 0, -4 }));
  EXPECT_EQ(indices[0], 2u);
  EXPECT_EQ(indices[1], 3u);
  EXPECT_EQ(indices[2], 0u);
}

TEST(LabelSpaceTest, LabelsStartingAboveZeroAreNotContiguous)
{
  const LabelSpace space(arma::Col<arma::sword>({ 1, 2 }));

  EXPECT_FALSE(space.IsContiguous());
  EXPECT_EQ(space.Index(1), 0u);
  EXPECT_EQ(space.Index(2), 1u);
}

TEST(LabelSpaceTest, ResolveAcrossPartitions)
{
  const arma::Row<arma::sword> data = MakeLabels({ 4, 4, 1, 0, 4, 1, 9, 0 });
  LocalDispatcher dispatcher(3);

  for (size_t partitions = 1; partitions <= 10; ++partitions)
  {
    const LabelSequence y = LabelSequence::Split(data, partitions, 3);
    const LabelSpace space = ResolveLabelSpace(dispatcher, y);

    ASSERT_EQ(space.NumClasses(), 4u) << partitions << " partitions";
    EXPECT_EQ(space.Labels()[0], 0);
    EXPECT_EQ(space.Labels()[1], 1);
    EXPECT_EQ(space.Labels()[2], 4);
    EXPECT_EQ(space.Labels()[3], 9);
  }
}

// Assigning the partitions to workers in the opposite order changes the order
// in which partitions complete, but not the result.
TEST(LabelSpaceTest, ResolveIsIndependentOfPlacement)
{
  const arma::Row<arma::sword> data = MakeLabels({ 5, 3, 3, 8, 1, 5, 2 });
  const std::vector<size_t> sizes = { 2, 2, 3 };

  const LabelSequence forward = LabelSequence::Split(data, sizes, 3);

  std::vector<PartitionHandle> handles = forward.Partitions();
  std::vector<arma::Row<arma::sword>> chunks;
  for (size_t p = 0; p < handles.size(); ++p)
  {
    handles[p].worker = handles.size() - 1 - p;
    chunks.push_back(forward.Local(p));
  }
  const LabelSequence reversed(handles, std::move(chunks),
      std::vector<bool>(handles.size(), true));

  LocalDispatcher dispatcher(3);
  const LabelSpace a = ResolveLabelSpace(dispatcher, forward);
  const LabelSpace b = ResolveLabelSpace(dispatcher, reversed);

  ASSERT_EQ(a.NumClasses(), b.NumClasses());
  EXPECT_TRUE(arma::all(a.Labels() == b.Labels()));
}

TEST(LabelSpaceTest, ResolveEmptySequence)
{
  LocalDispatcher dispatcher(2);
  const LabelSequence y = LabelSequence::Split(arma::Row<arma::sword>(), 2, 2);

  EXPECT_METRIC_ERROR(ResolveLabelSpace(dispatcher, y),
      MetricErrorKind::EMPTY_INPUT);
}

TEST(PartitionedSequenceTest, SplitCoversAllPoints)
{
  const arma::Row<arma::sword> data = MakeLabels({ 0, 1, 2, 3, 4 });
  const LabelSequence y = LabelSequence::Split(data, 4, 2);

  ASSERT_EQ(y.NumPartitions(), 4u);
  EXPECT_EQ(y.TotalSize(), 5u);

  size_t offset = 0;
  for (size_t p = 0; p < y.NumPartitions(); ++p)
  {
    EXPECT_EQ(y.Partitions()[p].index, p);
    EXPECT_EQ(y.Partitions()[p].worker, p % 2);
    EXPECT_EQ(y.Partitions()[p].offset, offset);
    EXPECT_EQ(y.Local(p).n_elem, y.Partitions()[p].size);
    for (size_t i = 0; i < y.Local(p).n_elem; ++i)
      EXPECT_EQ(y.Local(p)[i], data[offset + i]);
    offset += y.Partitions()[p].size;
  }
}

TEST(PartitionedSequenceTest, NonResidentPartitionIsNotAccessible)
{
  std::vector<PartitionHandle> handles;
  handles.push_back(PartitionHandle(0, 0, 0, 2));
  handles.push_back(PartitionHandle(1, 1, 2, 3));
  std::vector<arma::Row<arma::sword>> chunks(2);
  chunks[0] = MakeLabels({ 1, 2 });
  std::vector<bool> resident = { true, false };
  const LabelSequence y(handles, std::move(chunks), resident);

  EXPECT_EQ(y.TotalSize(), 5u);
  EXPECT_TRUE(y.IsResident(0));
  EXPECT_FALSE(y.IsResident(1));
  EXPECT_FALSE(y.IsResident(2));
  EXPECT_THROW(y.Local(1), std::invalid_argument);
  EXPECT_THROW(y.Local(2), std::invalid_argument);
}

TEST(PartitionedSequenceTest, SplitRejectsWrongSizes)
{
  const std::vector<size_t> sizes = { 1, 1 };
  EXPECT_THROW(LabelSequence::Split(MakeLabels({ 0, 1, 2 }), sizes),
      std::invalid_argument);
  EXPECT_THROW(LabelSequence::Split(MakeLabels({ 0, 1, 2 }), 0),
      std::invalid_argument);
}

class LabelFileTest : public ::testing::Test
{
 protected:
  void Write(const std::string& contents)
  {
    std::ofstream f(filename);
    f << contents;
  }

  void SetUp() override
  {
    filename = std::string("label_file_test_") +
        ::testing::UnitTest::GetInstance()->current_test_info()->name() +
        ".txt";
  }

  void TearDown() override { std::remove(filename.c_str()); }

  std::string filename;
};

TEST_F(LabelFileTest, PlainLabels)
{
  Write("1\n0\n\n2\n  1  \n");
  const arma::Row<arma::sword> labels = load_labels<arma::sword>(filename);

  ASSERT_EQ(labels.n_elem, 4u);
  EXPECT_EQ(labels[0], 1);
  EXPECT_EQ(labels[1], 0);
  EXPECT_EQ(labels[2], 2);
  EXPECT_EQ(labels[3], 1);
}

TEST_F(LabelFileTest, LibsvmLabels)
{
  Write("+1 1:0.5 3:1\n-1 2:0.25\n1.0\n");
  const arma::Row<arma::sword> labels = load_labels<arma::sword>(filename);

  ASSERT_EQ(labels.n_elem, 3u);
  EXPECT_EQ(labels[0], 1);
  EXPECT_EQ(labels[1], -1);
  EXPECT_EQ(labels[2], 1);
}

TEST_F(LabelFileTest, Weights)
{
  Write("0.5\n2\n1e-1\n");
  const arma::rowvec weights = load_labels<double>(filename);

  ASSERT_EQ(weights.n_elem, 3u);
  EXPECT_DOUBLE_EQ(weights[0], 0.5);
  EXPECT_DOUBLE_EQ(weights[1], 2.0);
  EXPECT_DOUBLE_EQ(weights[2], 0.1);
}

TEST_F(LabelFileTest, NonIntegerLabel)
{
  Write("1\n0.5\n");
  EXPECT_THROW(load_labels<arma::sword>(filename), std::runtime_error);
}

TEST_F(LabelFileTest, UnparseableLabel)
{
  Write("1\nPOS\n");
  EXPECT_THROW(load_labels<arma::sword>(filename), std::runtime_error);
}

TEST(LabelFileMissingTest, MissingFile)
{
  EXPECT_THROW(load_labels<arma::sword>("does_not_exist.txt"),
      std::runtime_error);
}

TEST(DataUtilsTest, SplitDatasetArgument)
{
  const std::tuple<std::string, std::string> both =
      SplitDatasetArgument("y_true.txt,y_pred.txt");
  EXPECT_EQ(std::get<0>(both), "y_true.txt");
  EXPECT_EQ(std::get<1>(both), "y_pred.txt");

  const std::tuple<std::string, std::string> one =
      SplitDatasetArgument("y_true.txt");
  EXPECT_EQ(std::get<0>(one), "y_true.txt");
  EXPECT_EQ(std::get<1>(one), "");
}

TEST(DataUtilsTest, PartitionFilename)
{
  EXPECT_EQ(PartitionFilename("labels", 3, "txt"), "labels.3.txt");
}

} // namespace
