#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include "config.hpp"


namespace
{
    template<typename T>
    void applyOverride(const boost::program_options::variables_map& vm, const char* option, T& value)
    {
        if (vm.count(option))
            value = vm[option].as<T>();
    }

    std::string knownPresets()
    {
        std::vector<std::string> names;
        for (const auto name: Dehaze::presetNames())
            names.emplace_back(name);

        return boost::algorithm::join(names, ", ");
    }
}


namespace Config
{
    Config readParams(int argc, char** argv)
    {
        namespace po = boost::program_options;

        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "produce help message")
            ("output-dir", po::value<std::string>()->default_value("dehazed"), "directory for dehazed images. Created when missing")
            ("preset", po::value<std::string>()->default_value("default"), ("set of parameters to start with. Possible arguments: " + knownPresets()).c_str())
            ("window-radius", po::value<int>(), "radius of dark channel window. Window size is 2 * radius + 1. Overrides preset")
            ("omega", po::value<double>(), "fraction of haze to remove (0÷1). Overrides preset")
            ("transmission-floor", po::value<double>(), "lower bound of estimated transmission (0÷1]. Overrides preset")
            ("top-fraction", po::value<double>(), "fraction of brightest dark channel pixels used for atmospheric light estimation (0÷1]. Overrides preset")
            ("min-transmission", po::value<double>(), "lower bound of transmission used for radiance recovery (0÷1]. Overrides preset")
            ("threads", po::value<int>()->default_value(0), "Set number of threads to use. 0 means all, negative values mean all + value. (For example --threads=-1 means all but one)")
            ("debug-steps", "Write dark channel and transmission maps next to results")
            ("show", "Display each result in a window. Press any key to advance")
            ("input-files", po::value<std::vector<std::string>>(), "images or directories with images to process");

        po::variables_map vm;
        po::positional_options_description p;
        p.add("input-files", -1);
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::stringstream help;
            help << desc;
            throw std::runtime_error(help.str());
        }

        if (vm.count("input-files") == 0)
            throw std::invalid_argument("Provide input files");

        const auto preset = vm["preset"].as<std::string>();
        const auto presetParameters = Dehaze::presetByName(preset);

        if (presetParameters.has_value() == false)
            throw std::invalid_argument("Invalid value for --preset argument: " + preset + ". Expected one of: " + knownPresets());

        Dehaze::Parameters parameters = *presetParameters;
        applyOverride(vm, "window-radius", parameters.windowRadius);
        applyOverride(vm, "omega", parameters.omega);
        applyOverride(vm, "transmission-floor", parameters.transmissionFloor);
        applyOverride(vm, "top-fraction", parameters.topFraction);
        applyOverride(vm, "min-transmission", parameters.minTransmission);

        Dehaze::validate(parameters);

        const std::vector<std::string> inputFilesStr = vm["input-files"].as<std::vector<std::string>>();
        const std::vector<std::filesystem::path> inputFiles(inputFilesStr.begin(), inputFilesStr.end());
        const std::filesystem::path outputDir = vm["output-dir"].as<std::string>();
        const auto threads = vm["threads"].as<int>();
        const bool debugSteps = vm.count("debug-steps") > 0;
        const bool show = vm.count("show") > 0;

        return Config {
            .inputFiles = inputFiles,
            .outputDir = outputDir,
            .preset = preset,
            .parameters = parameters,
            .threads = threads,
            .debugSteps = debugSteps,
            .show = show,
        };
    }
}
