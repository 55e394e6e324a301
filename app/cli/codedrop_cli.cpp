#include "Config.h"
#include "Logger.h"
#include "NetworkProfiler.h"
#include "OrchestrationContext.h"
#include "SecurityEngine.h"
#include "SpoolTransport.h"
#include "TransferCode.h"
#include "TransferErrorAdvisor.h"
#include "TransferSession.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

using namespace CodeDrop;

namespace {

    std::atomic<bool> interrupted{false};

    void onSignal(int) {
        interrupted = true;
    }

    class ConsoleObserver : public SessionObserver {
    public:
        void onStatus(const std::string&, const std::string& phase) override {
            std::cout << "  " << phase << std::endl;
        }

        void onProgress(const std::string&, uint64_t bytes, uint64_t total,
                        const std::string& fileName) override {
            if (total == 0) {
                return;
            }
            std::cout << "  " << (fileName.empty() ? std::string("payload") : fileName) << ": "
                      << bytes << "/" << total << " bytes (" << (bytes * 100 / total) << "%)" << std::endl;
        }
    };

    void printUsage(const char* program) {
        std::cout << "CodeDrop - transfer a file with a short code" << std::endl;
        std::cout << "\nUsage: " << program << " <command> [OPTIONS]" << std::endl;
        std::cout << "\nCommands:" << std::endl;
        std::cout << "  send <FILE>                Send a file and print its transfer code" << std::endl;
        std::cout << "  receive <CODE>             Receive the file announced under CODE" << std::endl;
        std::cout << "  profile                    Classify the local network and exit" << std::endl;
        std::cout << "  generate-code              Print a fresh transfer code and exit" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <PATH>            Extra configuration file (key=value)" << std::endl;
        std::cout << "  --code <CODE>              Use this code instead of generating one (send)" << std::endl;
        std::cout << "  --out <PATH>               Output path (receive, default: sender's file name)" << std::endl;
        std::cout << "  --spool <DIR>              Shared spool directory" << std::endl;
        std::cout << "  --mode <MODE>              Force an encryption mode (cbc, gcm, chacha20, hybrid)" << std::endl;
        std::cout << "  --words <N>                Words in a generated code (default: 3)" << std::endl;
        std::cout << "  --verbose                  Log at DEBUG level" << std::endl;
        std::cout << "  --help                     Show this help message" << std::endl;
    }

    std::string homeConfigPath() {
        const char* home = std::getenv("HOME");
        return home ? std::string(home) + "/.config/codedrop/codedrop.conf" : std::string();
    }

    bool readFile(const std::string& path, std::vector<uint8_t>& out) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

    bool writeFile(const std::string& path, const std::vector<uint8_t>& data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(out);
    }

    int reportFailure(const SessionOutcome& outcome) {
        if (!outcome.error) {
            std::cerr << "Transfer ended in state " << toString(outcome.state) << std::endl;
            return 1;
        }
        const NetworkType type = outcome.profile ? outcome.profile->networkType : NetworkType::Open;
        const ErrorAdvice advice = TransferErrorAdvisor::advise(*outcome.error, type);
        std::cerr << "Error: " << advice.headline << std::endl;
        std::cerr << "  " << advice.userAction << std::endl;
        for (const auto& attempt : outcome.attempts) {
            std::cerr << "  - " << attempt.toString() << std::endl;
        }
        Logger::instance().log(LogLevel::ERROR, advice.toString(), "CLI");
        return outcome.state == SessionState::Cancelled ? 130 : 1;
    }

    SessionOutcome drive(TransferSession& session) {
        auto started = session.start();
        if (started.isError()) {
            SessionOutcome outcome;
            outcome.state = SessionState::Failed;
            outcome.error = started.error();
            return outcome;
        }
        for (;;) {
            auto outcome = session.waitFor(std::chrono::milliseconds(200));
            if (outcome) {
                return *outcome;
            }
            if (interrupted) {
                std::cout << "\nCancelling..." << std::endl;
                session.cancel();
                return session.wait();
            }
        }
    }

    bool registerBackends(OrchestrationContext& context) {
        const auto& spool = context.settings().spool;
        if (spool.dir.empty()) {
            std::cerr << "No backend configured: pass --spool <DIR> or set spool.dir" << std::endl;
            return false;
        }

        auto backend = context.registry().emplaceTransport<SpoolTransport>({}, spool.name, spool.priority);
        if (backend.isError()) {
            std::cerr << backend.error().toString() << std::endl;
            return false;
        }
        auto setup = backend.value()->setup(context.transportConfig());
        if (setup.isError()) {
            std::cerr << setup.error().toString() << std::endl;
            return false;
        }
        context.seal();
        return true;
    }

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    logger.setComponent("CLI");

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string positional;
    std::string extraConfig;
    std::string code;
    std::string outPath;
    std::string spoolDir;
    std::string forcedMode;
    int words = TransferCode::DEFAULT_WORD_COUNT;
    bool verbose = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            extraConfig = argv[++i];
        }
        else if (arg == "--code" && i + 1 < argc) {
            code = argv[++i];
        }
        else if (arg == "--out" && i + 1 < argc) {
            outPath = argv[++i];
        }
        else if (arg == "--spool" && i + 1 < argc) {
            spoolDir = argv[++i];
        }
        else if (arg == "--mode" && i + 1 < argc) {
            forcedMode = argv[++i];
        }
        else if (arg == "--words" && i + 1 < argc) {
            try {
                words = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --words value" << std::endl;
                return 1;
            }
        }
        else if (arg == "--verbose") {
            verbose = true;
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else if (positional.empty() && arg.rfind("--", 0) != 0) {
            positional = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    if (command == "generate-code") {
        if (words < 2 || words > 8) {
            std::cerr << "--words must be between 2 and 8" << std::endl;
            return 1;
        }
        std::cout << TransferCode::generate(words) << std::endl;
        return 0;
    }

    // Layered: system, user, then the explicit file; CLI flags win last
    Config config;
    config.loadLayered({"/etc/codedrop/codedrop.conf", homeConfigPath()});
    if (!extraConfig.empty() && !config.loadFromFile(extraConfig)) {
        std::cerr << "Cannot read config file " << extraConfig << std::endl;
        return 1;
    }
    if (!spoolDir.empty()) {
        config.set("spool.dir", spoolDir);
    }
    if (!forcedMode.empty()) {
        config.set("security.force_mode", forcedMode);
    }
    if (verbose) {
        config.set("log.level", "DEBUG");
    }

    auto created = OrchestrationContext::create(config);
    if (created.isError()) {
        std::cerr << created.error().toString() << std::endl;
        return 1;
    }
    std::unique_ptr<OrchestrationContext> context = created.takeValue();

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (command == "profile") {
        NetworkProfile profile = context->profiler().classify();
        std::cout << profile.summary() << std::endl;
        return 0;
    }

    if (command == "send") {
        if (positional.empty()) {
            std::cerr << "send needs a file" << std::endl;
            return 1;
        }
        std::error_code sizeError;
        const auto fileSize = std::filesystem::file_size(positional, sizeError);
        if (!sizeError) {
            auto fits = SecurityEngine::checkPayloadSize(fileSize);
            if (fits.isError()) {
                std::cerr << fits.error().message << std::endl;
                return 1;
            }
        }

        std::vector<uint8_t> data;
        if (!readFile(positional, data)) {
            std::cerr << "Cannot read " << positional << std::endl;
            return 1;
        }
        if (!registerBackends(*context)) {
            return 1;
        }

        const std::string fileName = std::filesystem::path(positional).filename().string();
        auto session = context->createSession(SessionRequest::send(fileName, std::move(data), code),
                                              std::make_shared<ConsoleObserver>());
        std::cout << "\nTransfer code: " << session->code() << std::endl;
        std::cout << "Give this code to the receiver.\n" << std::endl;

        SessionOutcome outcome = drive(*session);
        if (!outcome.succeeded()) {
            return reportFailure(outcome);
        }
        context->dispatcher().flush();
        std::cout << "Sent " << fileName << " via " << outcome.transportName
                  << " (" << toString(*outcome.mode) << ")" << std::endl;
        return 0;
    }

    if (command == "receive") {
        if (positional.empty()) {
            std::cerr << "receive needs a transfer code" << std::endl;
            return 1;
        }
        if (!registerBackends(*context)) {
            return 1;
        }

        auto session = context->createSession(SessionRequest::receive(positional),
                                              std::make_shared<ConsoleObserver>());
        SessionOutcome outcome = drive(*session);
        if (!outcome.succeeded()) {
            return reportFailure(outcome);
        }
        context->dispatcher().flush();

        std::string target = outPath;
        if (target.empty()) {
            target = std::filesystem::path(outcome.metadata.fileName).filename().string();
            if (target.empty()) {
                target = "codedrop-" + session->transferId();
            }
        }
        if (!writeFile(target, outcome.payload)) {
            std::cerr << "Cannot write " << target << std::endl;
            return 1;
        }
        std::cout << "Received " << outcome.payload.size() << " bytes into " << target << std::endl;
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
