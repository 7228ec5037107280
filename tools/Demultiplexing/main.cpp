#include <iostream>
#include <string>
#include <filesystem>

#include "BarcodeTable.hpp"
#include "Demultiplexer.hpp"
#include "DemultiplexedStatistics.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

/**
 * @brief A tool to split paired fastq files into the wells of one or several 96 well plates.
 * Reads must already carry their tag name as the last token of the read header (cutadapt -y ' {name}'),
 * a read pair belongs to the well whose json entry lists the (forward-name, reverse-name) pair.
 *
 * @param <forward>/<reverse> fastq(.gz) files with an equal number of records
 * @param <barcodes> json descriptor: {"1A01": [["F1","R1"], ...], ...}
 * @param <output> output directory
 *
 * @return writes <output>/<well>/<name>_R1.fastq and _R2.fastq for every well of the descriptor
 *         and <output>/<name>_occupancy.txt with one 8x12 grid of read counts per plate
 **/

using namespace boost::program_options;

struct input
{
    std::string forwardFile;
    std::string reverseFile;
    std::string barcodeFile;
    std::string outPath;
    std::string replicate;
    int threads;
};

bool parse_arguments(char** argv, int argc, input& input)
{
    try
    {
        options_description desc("Options");
        desc.add_options()
            ("forward,1", value<std::string>(&(input.forwardFile))->required(), "forward read file in fastq(.gz) format")
            ("reverse,2", value<std::string>(&(input.reverseFile))->required(), "reverse read file in fastq(.gz) format, \
            must contain the same number of reads as the forward file")
            ("barcodes,b", value<std::string>(&(input.barcodeFile))->required(), "json file mapping every well to its accepted pairs of \
            forward and reverse tag names, e.g. {\"1A01\": [[\"F1\",\"R1\"]]}")
            ("output,o", value<std::string>(&(input.outPath))->required(), "output directory, every well gets its own sub directory.")
            ("name,n", value<std::string>(&(input.replicate))->default_value("demultiplexed"), "name of the output fastq files (<name>_R1.fastq)")
            ("threads,t", value<int>(&(input.threads))->default_value(5), "number of threads")

            ("help,h", "help message");

        variables_map vm;
        store(parse_command_line(argc, argv, desc), vm);

        if(vm.count("help"))
        {
            std::cout << desc << "\n";

            std::cout << "###########################################\n";
            std::cout << "EXAMPLE CALL:\n ./bin/demultiplex -1 ./src/test/test_data/reads_R1.fastq -2 ./src/test/test_data/reads_R2.fastq -b ./src/test/test_data/cells.json -o ./bin/cells -t 1\n";
            std::cout << "###########################################\n";

            return false;
        }

        notify(vm);
    }
    catch(std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv)
{
    input input;
    if(!parse_arguments(argv, argc, input))
    {
        return EXIT_FAILURE;
    }

    try
    {
        BarcodeTable table = BarcodeTable::load(input.barcodeFile);
        for(const BarcodeOverlap& overlap : table.overlapping_pairs())
        {
            std::cerr << "Warning: barcode pair " << overlap.pair.first << "/" << overlap.pair.second << " of well "
                      << overlap.shadowedWell.code() << " is already used by " << overlap.assignedWell.code() << "\n";
        }

        Demultiplexer demultiplexer(input.threads);
        DemultiplexedResult result = demultiplexer.run(input.forwardFile, input.reverseFile, table);
        result.write_wells(input.outPath, input.replicate);

        OccupancyReport occupancy(result);
        occupancy.write(input.outPath, input.replicate);
        occupancy.write(std::cout);
    }
    catch(const std::exception& e)
    {
        std::cerr << "Demultiplexing failed with error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
