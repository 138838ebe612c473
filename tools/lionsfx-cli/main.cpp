#include <chrono>
#include <iostream>
#include <thread>

#include <cpptrace/from_current.hpp>
#include <cxxopts.hpp>

#include <choc/text/choc_JSON.h>

#include <lionsfx/lionsfx.hpp>

static constexpr int DEFAULT_INTENSITY = 50;
static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);

static void printResult(const lionsfx::TaskSnapshot& snapshot) {
    if (!snapshot.result)
        return;
    if (auto separation = std::get_if<lionsfx::SeparationResult>(&*snapshot.result)) {
        std::cout << "vocals: " << separation->vocalPath << std::endl;
        std::cout << "instrumental: " << separation->instrumentalPath << std::endl;
    } else if (auto effect = std::get_if<lionsfx::EffectResult>(&*snapshot.result)) {
        std::cout << "output: " << effect->outputPath << std::endl;
    }
}

int run(int argc, const char* argv[]) {
    cxxopts::Options options("lionsfx-cli", "Split an audio file into vocals and instrumental, or apply an effect.");
    options.positional_help("<input audio file>");
    options.show_positional_help();
    options.add_options()
        ("h,help",      "Print this help message")
        ("input",       "Input audio file (wav, flac, ogg)", cxxopts::value<std::string>())
        ("s,split",     "Separate vocals and instrumental")
        ("e,effect",    "Effect to apply (reverb, echo, chorus, distortion, compressor, equalizer, delay)",
                        cxxopts::value<std::string>())
        ("i,intensity", "Effect intensity 0-100",
                        cxxopts::value<int>()->default_value(std::to_string(DEFAULT_INTENSITY)))
        ("o,out",       "Output directory", cxxopts::value<std::string>())
        ("f,format",    "Output format (flac or wav)", cxxopts::value<std::string>())
        ("c,config",    "JSON configuration file", cxxopts::value<std::string>())
        ("j,json",      "Print the final task state as JSON")
        ("info",        "Print information about the input file and exit")
        ("status",      "Print the service status as JSON and exit")
    ;
    options.parse_positional({"input"});

    auto opts = options.parse(argc, argv);

    if (opts.contains("h")) {
        std::cerr << options.help();
        return EXIT_SUCCESS;
    }

    lionsfx::ServiceConfiguration config;
    if (opts.contains("config"))
        config = lionsfx::ServiceConfiguration::load(opts["config"].as<std::string>());
    if (opts.contains("out"))
        config.outputDirectory = opts["out"].as<std::string>();
    if (opts.contains("format"))
        config.outputFormat = opts["format"].as<std::string>();

    lionsfx::AudioJobService service(config);

    if (opts.contains("status")) {
        std::cout << choc::json::toString(lionsfx::toJson(service.serviceStatus()), true) << std::endl;
        return EXIT_SUCCESS;
    }

    if (!opts.contains("input")) {
        std::cerr << options.help();
        return EXIT_FAILURE;
    }
    auto inputPath = std::filesystem::path{opts["input"].as<std::string>()};

    if (opts.contains("info")) {
        auto info = service.inspectAudioFile(inputPath);
        std::cout << choc::json::toString(lionsfx::toJson(info), true) << std::endl;
        return EXIT_SUCCESS;
    }

    const bool split = opts.contains("split");
    const bool effect = opts.contains("effect");
    if (split == effect) {
        std::cerr << "Specify exactly one of --split or --effect." << std::endl;
        return EXIT_FAILURE;
    }

    auto submitted = split
        ? service.submitSeparationFromFile(inputPath)
        : service.submitEffectFromFile(inputPath, opts["effect"].as<std::string>(), opts["intensity"].as<int>());
    if (!submitted.success) {
        std::cerr << "Submission failed: " << submitted.error << std::endl;
        return EXIT_FAILURE;
    }
    std::cerr << "Task " << submitted.taskId << " submitted." << std::endl;

    int lastProgress = -1;
    std::optional<lionsfx::TaskSnapshot> snapshot;
    while (true) {
        snapshot = service.pollStatus(submitted.taskId);
        if (!snapshot) {
            std::cerr << "Task " << submitted.taskId << " disappeared." << std::endl;
            return EXIT_FAILURE;
        }
        if (snapshot->progress != lastProgress) {
            lastProgress = snapshot->progress;
            std::cerr << "[" << lionsfx::taskStatusName(snapshot->status) << "] " << lastProgress << "%" << std::endl;
        }
        if (lionsfx::isTerminal(snapshot->status))
            break;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    if (opts.contains("json"))
        std::cout << choc::json::toString(lionsfx::toJson(*snapshot), true) << std::endl;
    else if (snapshot->status == lionsfx::TaskStatus::Completed)
        printResult(*snapshot);

    if (snapshot->status == lionsfx::TaskStatus::Failed) {
        std::cerr << "Failed: " << snapshot->error->displayMessage() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, const char* argv[]) {
    int result = EXIT_SUCCESS;
    CPPTRACE_TRY {
        result = run(argc, argv);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        cpptrace::from_current_exception().print();
        result = EXIT_FAILURE;
    }
    lionsfx::Logger::stopDefaultLogger();
    return result;
}
