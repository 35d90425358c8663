#include <iostream>
#include <fstream>
#include <chrono>
#include <boost/program_options.hpp>
#include <glog/logging.h>
#include "transportation.hpp"
#include "problem-io.hpp"
#include "step-log.hpp"

namespace tp = transportation;

template <typename T>
int solveAndPrint(const tp::Problem<T>& problem, const tp::SolveParams& params, bool quiet) {
    tp::ProgressCallback<T> progressCallback;
    if (!quiet) {
        progressCallback = [&](const tp::IterationRecord<T>& record) {
            printRecord(std::cout, record);
        };
    }

    auto startTime = std::chrono::system_clock::now();
    try {
        auto result = tp::Solve(problem, params, progressCallback);
        std::cout << "All opportunity costs >= 0, solution is optimal after "
            << result.iterations << " iterations\n\n";
        printShipments(std::cout, problem, result);
    } catch (tp::ShapeError& e) {
        std::cout << "Invalid problem: " << e.what() << "\n";
        return 1;
    } catch (tp::BalanceError& e) {
        std::cout << "Unbalanced problem: " << e.what() << "\n";
        return 1;
    } catch (tp::NonConvergenceError<T>& e) {
        std::cout << e.what() << "\n";
        std::cout << "Best allocation found:\n";
        printAllocation(std::cout, e.allocation(), e.partial().basicCells);
        std::cout << "Total cost: " << e.totalCost() << "\n";
        return 2;
    } catch (tp::TransportError& e) {
        std::cout << "Cannot solve problem: " << e.what() << "\n";
        return 1;
    } catch (tp::InvariantError& e) {
        std::cout << "Internal solver error: " << e.what() << "\n";
        return 3;
    }
    std::cout << "Total time: " << std::chrono::duration<double>{std::chrono::system_clock::now() - startTime}.count() << "\n";
    return 0;
}

template <typename T>
int readAndSolve(std::istream& input, const tp::SolveParams& params, bool quiet) {
    try {
        auto problem = readProblem<T>(input);
        return solveAndPrint(problem, params, quiet);
    } catch (ParseError& e) {
        std::cout << "Could not read problem: " << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char **argv) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    // Variables set by program options
    std::string infilename;
    std::string entering;
    std::string leaving;
    tp::SolveParams params {};
    bool integer = false;
    bool quiet = false;

    po::options_description options_desc("solve-transport arguments");
    options_desc.add_options()
        ("help", "Display this help message")
        ("problem", po::value<std::string>(&infilename)->required(), "Problem file, '-' for stdin")
        ("tolerance,t", po::value<double>(&params.tolerance)->default_value(params.tolerance), "Balance and optimality tolerance")
        ("iteration-factor", po::value<int>(&params.iterationFactor)->default_value(params.iterationFactor), "Iteration bound is this times m*n")
        ("max-iterations", po::value<int>(&params.maxIterations)->default_value(params.maxIterations), "Hard iteration bound, -1 to derive from the problem size")
        ("entering", po::value<std::string>(&entering)->default_value("most-negative"), "Entering cell rule, one of [most-negative|first-negative]")
        ("leaving", po::value<std::string>(&leaving)->default_value("lowest-index"), "Leaving cell tie-break, one of [lowest-index|loop-order]")
        ("integer,i", po::bool_switch(&integer), "Solve with exact integer quantities")
        ("quiet,q", po::bool_switch(&quiet), "Only print the final shipments")
    ;

    po::positional_options_description popts_desc;
    popts_desc.add("problem", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                options(options_desc).positional(popts_desc).run(), vm);
        if (vm.count("help") != 0) {
            std::cout << "Usage: solve-transport [options] problem\n";
            std::cout << options_desc;
            return 0;
        }
        po::notify(vm);
    } catch (std::exception& e) {
        std::cout << "Parsing error: " << e.what() << "\n";
        std::cout << "Usage: solve-transport [options] problem\n";
        std::cout << options_desc;
        return 1;
    }

    if (entering == "most-negative")
        params.enteringRule = tp::EnteringRule::MostNegative;
    else if (entering == "first-negative")
        params.enteringRule = tp::EnteringRule::FirstNegative;
    else {
        std::cout << "Unknown entering rule: " << entering << "\n";
        return 1;
    }
    if (leaving == "lowest-index")
        params.leavingRule = tp::LeavingRule::LowestIndex;
    else if (leaving == "loop-order")
        params.leavingRule = tp::LeavingRule::LoopOrder;
    else {
        std::cout << "Unknown leaving rule: " << leaving << "\n";
        return 1;
    }

    std::ifstream infile;
    if (infilename != "-") {
        infile.open(infilename);
        if (!infile) {
            std::cout << "Could not open problem: " << infilename << "\n";
            return 1;
        }
    }
    std::istream& input = infilename == "-" ? std::cin : infile;

    if (integer)
        return readAndSolve<int64_t>(input, params, quiet);
    else
        return readAndSolve<double>(input, params, quiet);
}
