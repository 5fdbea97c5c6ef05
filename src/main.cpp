#include "exam_monitor.h"
#include "monitor_config.h"
#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        MonitorConfig config = parseArgs(argc, argv);
        if (config.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        config.validate();

        std::cout << "Model path: " << config.modelPath << std::endl;
        std::cout << "Labels path: " << config.labelsPath << std::endl;

        ExamMonitor monitor(config);
        return monitor.run() ? 0 : 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
