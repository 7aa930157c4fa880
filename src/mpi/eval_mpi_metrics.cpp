/**
 * eval_mpi_metrics.cpp
 *
 * Compute accuracy, precision and the confusion matrix of a set of predictions
 * where every MPI worker holds one partition of the labels, storing the
 * results in a CSV file.
 */
#include <mpi.h>
#include "mpi_dispatcher.hpp"
#include "../distributed_metrics.hpp"
#include "../label_io.hpp"
#include "../data_utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace std;

void help(char** argv)
{
  cout << "Usage: " << argv[0] << " <y_true_basename> <y_pred_basename> "
       << "<extension> output_file.csv average normalize "
       << "[weights_basename [verbose]]" << endl
       << endl
       << " - note: partitions should be stored as basename.partition.ext"
       << endl
       << "     for some extension ext (txt/svm/etc.)"
       << endl
       << " - average is one of 'binary', 'macro', 'micro'"
       << endl
       << " - normalize is one of 'none', 'true', 'pred', 'all'"
       << endl
       << " - give '-' as the weights basename to use unit weights"
       << endl
       << " - verbose output is given if *any* argument is given"
       << endl
       << " - number of partitions is set by number of MPI workers"
       << endl;
}

int main(int argc, char** argv)
{
  // Make sure we got the right number of arguments.
  if (argc != 7 && argc != 8 && argc != 9)
  {
    help(argv);
    exit(1);
  }

  const std::string truePrefix(argv[1]);
  const std::string predPrefix(argv[2]);
  const std::string extension(argv[3]);
  const std::string outputFile(argv[4]);
  const std::string weightsPrefix((argc >= 8) ? argv[7] : "-");
  const bool verbose = (argc == 9);

  MPI_Init(NULL, NULL);
  int worker, worldSize;
  MPI_Comm_rank(MPI_COMM_WORLD, &worker);
  MPI_Comm_size(MPI_COMM_WORLD, &worldSize);

  int status = 0;
  try
  {
    const PrecisionAverage average = ParsePrecisionAverage(argv[5]);
    const ConfusionNormalization normalize =
        ParseConfusionNormalization(argv[6]);

    // Each worker loads only its own partition.
    MPIDispatcher dispatcher(MPI_COMM_WORLD, verbose);
    const LabelSequence yTrue = dispatcher.Distribute(
        load_labels<arma::sword>(PartitionFilename(truePrefix, worker,
        extension), verbose));
    const LabelSequence yPred = dispatcher.Distribute(
        load_labels<arma::sword>(PartitionFilename(predPrefix, worker,
        extension), verbose));
    WeightSequence weights;
    if (weightsPrefix != "-")
    {
      weights = dispatcher.Distribute(load_labels<double>(
          PartitionFilename(weightsPrefix, worker, extension), verbose));
    }

    DistributedMetrics<MPIDispatcher> metrics(dispatcher,
        verbose && (worker == 0));

    // Make sure no workers are hung up on something, so that our timing is
    // accurate.
    MPI_Barrier(MPI_COMM_WORLD);

    arma::wall_clock c;
    c.tic();
    const MetricsReport report = metrics.Evaluate(yTrue, yPred, average,
        normalize, (weightsPrefix != "-") ? &weights : NULL);
    const double evalTime = c.toc();

    if (worker == 0)
    {
      fstream f(outputFile, fstream::out);
      if (!f.is_open())
      {
        std::ostringstream oss;
        oss << "Failed to open output file '" << outputFile << "'!";
        throw std::runtime_error(oss.str());
      }

      f << "method,partitions,points,classes,accuracy,average,precision,time"
          << endl;
      f << "mpi-" << worldSize << "," << yTrue.NumPartitions() << ","
          << yTrue.TotalSize() << "," << report.labelSpace.NumClasses() << ","
          << report.accuracy << "," << ToString(average) << ","
          << report.precision << "," << evalTime << endl;

      const std::string confusionFile = outputFile + ".confusion.csv";
      if (!report.confusion.save(confusionFile, arma::csv_ascii))
      {
        std::ostringstream oss;
        oss << "Failed to save confusion matrix to '" << confusionFile << "'!";
        throw std::runtime_error(oss.str());
      }

      cout << worldSize << " MPI workers, " << report.labelSpace.NumClasses()
          << " classes: " << evalTime << "s evaluation time; "
          << report.accuracy << " accuracy; "
          << report.precision << " " << ToString(average) << " precision."
          << endl;
      const arma::Row<arma::sword> labels = report.labelSpace.Labels().t();
      labels.print("Labels:");
      report.confusion.print("Confusion matrix (" + ToString(normalize) +
          "):");
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "Worker " << worker << ": error: " << e.what() << std::endl;
    status = 1;
  }

  // A failure that only one worker saw (e.g. a missing file) must not leave
  // the others blocked in a collective call.
  if (status != 0)
    MPI_Abort(MPI_COMM_WORLD, status);

  MPI_Finalize();
  return 0;
}
