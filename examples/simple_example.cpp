#include <iostream>
#include "netsynth/netsynth.h"

int main() {
    try {
        std::cout << "NetSynth Simple Example\n";
        std::cout << "=======================\n\n";

        // Default CDN model, 500 rows, seed 42
        netsynth::SampleGenerator generator;
        std::cout << "Model parameters:\n" << generator.params() << "\n";

        netsynth::SampleTable table = generator.generate(netsynth::DEFAULT_SAMPLE_COUNT,
                                                         netsynth::DEFAULT_SEED);
        std::cout << "Generated " << table.size() << " samples (seed "
                  << *table.seed() << ")\n\n";

        // First rows
        std::cout << "First rows:\n";
        for (size_t i = 0; i < 5 && i < table.size(); ++i) {
            const netsynth::Sample& s = table[i];
            std::cout << "  rtt=" << s.rtt << " ms, ttfb=" << s.ttfb
                      << " ms, loss=" << s.loss << ", throughput=" << s.throughput << " Mbps\n";
        }
        std::cout << "\n";

        // Persist
        const std::string filename = netsynth::DEFAULT_OUTPUT_FILE;
        netsynth::SampleCsvWriter writer;
        if (!writer.open(filename, true)) {
            std::cerr << writer.getErrorMsg() << "\n";
            return 1;
        }
        writer.write(table);
        const size_t written = writer.rowCount();
        writer.close();
        std::cout << "Wrote " << written << " rows to " << filename << "\n\n";

        // Read back and describe
        netsynth::SampleTable loaded = netsynth::readTable(filename);
        netsynth::printSummary(netsynth::summarize(loaded), std::cout);
        std::cout << "\n";
        netsynth::printValidation(netsynth::validate(loaded), std::cout);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
