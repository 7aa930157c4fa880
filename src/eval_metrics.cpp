/**
 * eval_metrics.cpp
 *
 * Compute accuracy, precision and the confusion matrix of a set of predictions
 * by splitting the labels into partitions that are processed by separate
 * threads, storing the results in a CSV file.
 */
#include "distributed_metrics.hpp"
#include "local_dispatcher.hpp"
#include "label_io.hpp"
#include "data_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <omp.h>

using namespace std;

void help(char** argv)
{
  cout << "Usage: " << argv[0] << " y_true_file,y_pred_file output_file.csv "
       << "partitions average normalize [weights_file [verbose]]" << endl
       << endl
       << " - note: the first token of every line of the label files is used,"
       << endl
       << "     so libsvm files can be given directly"
       << endl
       << " - average is one of 'binary', 'macro', 'micro'"
       << endl
       << " - normalize is one of 'none', 'true', 'pred', 'all'"
       << endl
       << " - give '-' as the weights file to use unit weights"
       << endl
       << " - the confusion matrix is written to output_file.csv.confusion.csv"
       << endl
       << " - verbose output is given if *any* argument is given"
       << endl;
}

int main(int argc, char** argv)
{
  // Make sure we got the right number of arguments.
  if (argc != 6 && argc != 7 && argc != 8)
  {
    help(argv);
    exit(1);
  }

  const std::tuple<std::string, std::string> inputFiles =
      SplitDatasetArgument(argv[1]);
  const std::string trueFile(std::get<0>(inputFiles));
  const std::string predFile(std::get<1>(inputFiles));
  const std::string outputFile(argv[2]);
  const size_t partitions = atoi(argv[3]);
  const std::string weightsFile((argc >= 7) ? argv[6] : "-");
  const bool verbose = (argc == 8);

  if (predFile.empty() || partitions == 0)
  {
    help(argv);
    exit(1);
  }

  try
  {
    const PrecisionAverage average = ParsePrecisionAverage(argv[4]);
    const ConfusionNormalization normalize =
        ParseConfusionNormalization(argv[5]);

    const arma::Row<arma::sword> yTrueData =
        load_labels<arma::sword>(trueFile, verbose);
    const arma::Row<arma::sword> yPredData =
        load_labels<arma::sword>(predFile, verbose);

    const size_t totalThreads = omp_get_max_threads();
    const size_t workers = std::min(totalThreads, partitions);
    std::cout << "Total threads: " << totalThreads << "; using " << workers
        << " workers for " << partitions << " partitions." << std::endl;

    const LabelSequence yTrue = LabelSequence::Split(yTrueData, partitions,
        workers);
    const LabelSequence yPred = LabelSequence::Split(yPredData, partitions,
        workers);
    WeightSequence weights;
    if (weightsFile != "-")
    {
      weights = WeightSequence::Split(load_labels<double>(weightsFile,
          verbose), partitions, workers);
    }

    LocalDispatcher dispatcher(workers, verbose);
    DistributedMetrics<LocalDispatcher> metrics(dispatcher, verbose);

    arma::wall_clock c;
    c.tic();
    const MetricsReport report = metrics.Evaluate(yTrue, yPred, average,
        normalize, (weightsFile != "-") ? &weights : NULL);
    const double evalTime = c.toc();

    fstream f(outputFile, fstream::out);
    if (!f.is_open())
    {
      std::cerr << "Failed to open output file '" << outputFile << "'!"
          << std::endl;
      exit(1);
    }

    f << "method,partitions,points,classes,accuracy,average,precision,time"
        << endl;
    f << "local-" << workers << "," << partitions << "," << yTrue.TotalSize()
        << "," << report.labelSpace.NumClasses() << "," << report.accuracy
        << "," << ToString(average) << "," << report.precision << ","
        << evalTime << endl;

    const std::string confusionFile = outputFile + ".confusion.csv";
    if (!report.confusion.save(confusionFile, arma::csv_ascii))
    {
      std::cerr << "Failed to save confusion matrix to '" << confusionFile
          << "'!" << std::endl;
      exit(1);
    }

    cout << partitions << " partitions, " << report.labelSpace.NumClasses()
        << " classes: " << evalTime << "s evaluation time; "
        << report.accuracy << " accuracy; "
        << report.precision << " " << ToString(average) << " precision."
        << endl;
    const arma::Row<arma::sword> labels = report.labelSpace.Labels().t();
    labels.print("Labels:");
    report.confusion.print("Confusion matrix (" + ToString(normalize) + "):");
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit(1);
  }
}
