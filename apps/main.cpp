#include "minerscan/config/ScannerConfig.hpp"
#include "minerscan/core/ScanSession.hpp"
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/log/Log.hpp"
#include "minerscan/net/TimeoutConfig.hpp"
#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/record/CsvRecorder.hpp"
#include "minerscan/scan/AddressRange.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace minerscan;
namespace po = boost::program_options;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCancelled = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCommandFailed = 3;

std::atomic<bool> interrupted{false};

void onSignal(int) {
    interrupted = true;
}

std::string formatValue(const std::optional<double>& value, int precision) {
    if (!value) return "-";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << *value;
    return oss.str();
}

void printHeader() {
    std::cout << std::left
              << std::setw(16) << "IP"
              << std::setw(19) << "MAC"
              << std::setw(22) << "MODEL"
              << std::setw(12) << "TH/S"
              << std::setw(9) << "POWER"
              << std::setw(8) << "TEMP"
              << "FIRMWARE\n";
}

void printRow(const device::DeviceRecord& record) {
    std::cout << std::left
              << std::setw(16) << record.address.to_string()
              << std::setw(19) << record.mac.value_or("-")
              << std::setw(22) << (record.model.empty() ? "-" : record.model)
              << std::setw(12) << formatValue(record.hashrateThs, 2)
              << std::setw(9) << formatValue(record.powerWatts, 0)
              << std::setw(8) << formatValue(record.averageTemperatureC, 1)
              << (record.firmwareVersion.empty() ? "-" : record.firmwareVersion) << "\n";
}

void printProgress(const scan::ScanProgress& progress, std::size_t permits) {
    std::cerr << "\r" << progress.completed << "/" << progress.total
              << " scanned, " << progress.found << " found, "
              << progress.inFlight.size() << " in flight (window " << permits << ")   " << std::flush;
}

void printUsage(const char* program, const po::options_description& options) {
    std::cout << "Usage: " << program << " [options] <start> [<end>]\n"
              << "       " << program << " [options] --range <name> | --all-ranges\n"
              << "       " << program << " --command start|stop|fault-light|open-web <address>\n\n"
              << "  <start> may be a single address, a.b.c.d-e or a.b.c.d-w.x.y.z\n\n"
              << options << "\n";
}

/// Waits for @p duration unless interrupted. Returns false on interrupt.
bool sleepInterruptibly(std::chrono::steady_clock::duration duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (!interrupted) {
        if (std::chrono::steady_clock::now() >= until) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return false;
}

/// Runs one sweep to the end, printing found devices as they arrive.
scan::ScanProgress runSweep(core::ScanSession& session,
                            const scan::AddressRange& range,
                            const scan::ScanOptions& scanOptions,
                            bool& headerPrinted) {
    auto sweep = session.startSweep(range, scanOptions);

    std::cout << "Scanning " << range.toString() << " (" << range.size() << " addresses)\n";
    auto lastProgress = std::chrono::steady_clock::now();
    while (!sweep->results().isFinished()) {
        if (interrupted) {
            sweep->cancel();
            break;
        }
        if (auto found = sweep->results().popFor(std::chrono::milliseconds(200))) {
            std::cerr << "\r\x1b[K";
            if (!headerPrinted) {
                printHeader();
                headerPrinted = true;
            }
            printRow(*found);
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - lastProgress >= std::chrono::milliseconds(500)) {
            printProgress(sweep->progress(), sweep->permits());
            lastProgress = now;
        }
    }
    sweep->wait();

    const auto progress = sweep->progress();
    printProgress(progress, sweep->permits());
    std::cerr << "\n";
    std::cout << "Sweep " << scan::toString(progress.state) << ": " << progress.found << " miner(s) in "
              << progress.completed << "/" << progress.total << " addresses\n";
    return progress;
}

std::optional<device::Command> parseCommand(const std::string& name) {
    if (name == "start") return device::Command::Start;
    if (name == "stop") return device::Command::Stop;
    if (name == "fault-light") return device::Command::ToggleFaultLight;
    return std::nullopt;
}

/// Identifies the miner at @p address, then sends it @p name.
int runCommand(core::ScanSession& session,
               const std::string& name,
               const net::address_v4& address,
               const scan::ScanOptions& scanOptions) {
    const auto command = parseCommand(name);
    if (!command && name != "open-web") {
        std::cerr << "Error: unknown command '" << name << "' (start, stop, fault-light, open-web)\n";
        return kExitUsage;
    }

    auto single = scan::AddressRange::fromAddresses(address, address);
    if (!single) {
        return kExitUsage;
    }
    auto sweep = session.startSweep(*single, scanOptions);
    sweep->wait();
    const auto found = sweep->discovered();
    if (found.empty()) {
        std::cerr << "Error: no miner answered at " << address.to_string() << "\n";
        return kExitCommandFailed;
    }
    const auto identity = found.front().identityKey();

    if (!command) {
        if (!session.openWebInterface(identity)) {
            std::cerr << "Error: unknown miner " << identity << "\n";
            return kExitCommandFailed;
        }
        std::cout << "Opening http://" << address.to_string() << "/\n";
        return kExitOk;
    }
    auto sent = session.sendCommand(identity, *command);
    if (!sent) {
        std::cerr << "Error: " << name << " failed: " << sent.error().message() << "\n";
        return kExitCommandFailed;
    }
    std::cout << name << " sent to " << identity << " (" << address.to_string() << ")\n";
    return kExitOk;
}

int watch(core::ScanSession& session,
          const std::vector<device::DeviceRecord>& devices,
          std::chrono::seconds interval,
          std::optional<std::chrono::seconds> duration,
          const std::optional<std::string>& recordDir) {
    std::vector<std::shared_ptr<record::CsvRecorder>> recorders;

    for (const auto& device : devices) {
        auto poller = session.attachPoller(device.identityKey(), interval);
        if (!poller) {
            logError("[minerscan] cannot watch ", device.identityKey(), ": ", poller.error().message(), "\n");
            continue;
        }
        if (recordDir) {
            auto recorder = record::CsvRecorder::start(device, *recordDir);
            if (!recorder) {
                logError("[minerscan] cannot record ", device.identityKey(), ": ",
                         recorder.error().message(), "\n");
                continue;
            }
            (*poller)->attachRecorder(*recorder);
            recorders.push_back(*recorder);
        }
    }

    std::cout << "\nWatching " << devices.size() << " device(s) every " << interval.count()
              << " s, Ctrl-C to stop\n";
    const auto started = std::chrono::steady_clock::now();
    auto nextPrint = started + interval;
    while (!interrupted) {
        const auto now = std::chrono::steady_clock::now();
        if (duration && now - started >= *duration) {
            break;
        }
        if (now >= nextPrint) {
            std::cout << "\n";
            printHeader();
            for (const auto& record : session.registry().list()) {
                printRow(record);
            }
            nextPrint = now + interval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    session.stopAllPollers();
    for (auto& recorder : recorders) {
        recorder->stop();
        std::cout << "Recorded " << recorder->rowCount() << " rows to " << recorder->path().string() << "\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show this help")
        ("timeout,t", po::value<unsigned>(), "Identification timeout in seconds (default 5)")
        ("retries,r", po::value<unsigned>(), "Additional identification attempts after the first (default 2, max 10)")
        ("no-port-check", "Skip the TCP pre-check and identify every address")
        ("port,p", po::value<unsigned short>()->default_value(device::config::CGMINER_API_PORT),
         "Miner API port")
        ("watch,w", po::value<unsigned>()->implicit_value(0),
         "After the sweep, poll found devices every N seconds (5-60, default from the config)")
        ("duration,d", po::value<unsigned>(), "Stop watching or auto-scanning after N seconds")
        ("record", po::value<std::string>(), "Write one CSV per watched device into this directory")
        ("export", po::value<std::string>()->implicit_value(""),
         "Write every known miner to a CSV file after each sweep")
        ("auto-scan", po::value<unsigned>()->implicit_value(0),
         "Repeat the sweep every N seconds (default from the config) until interrupted")
        ("all-ranges,a", "Scan every saved range")
        ("command", po::value<std::string>(), "Send start, stop, fault-light or open-web to the miner at <start>")
        ("config,c", po::value<std::string>(), "Configuration file")
        ("range", po::value<std::string>(), "Scan a saved range by name")
        ("save-range", po::value<std::string>(), "Save the scanned range under this name")
        ("verbose,v", "Debug logging")
        ("quiet,q", "Only warnings and errors");

    po::options_description hidden;
    hidden.add_options()
        ("start", po::value<std::string>())
        ("end", po::value<std::string>());

    po::options_description all;
    all.add(options).add(hidden);

    po::positional_options_description positional;
    positional.add("start", 1).add("end", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0], options);
        return kExitUsage;
    }

    if (vm.count("help")) {
        printUsage(argv[0], options);
        return kExitOk;
    }
    if (vm.count("verbose")) {
        log::setLogLevel(log::Level::Debug);
    } else if (vm.count("quiet")) {
        log::setLogLevel(log::Level::Warning);
    }
    if (vm.count("watch") && vm.count("auto-scan")) {
        std::cerr << "Error: --watch and --auto-scan cannot be combined\n";
        return kExitUsage;
    }

    const auto configPath = vm.count("config")
        ? std::filesystem::path(vm["config"].as<std::string>())
        : config::defaultConfigPath();
    auto settings = config::loadConfig(configPath);

    auto scanOptions = settings.toScanOptions();
    if (vm.count("timeout")) {
        scanOptions.identificationTimeout = std::chrono::seconds(vm["timeout"].as<unsigned>());
        scanOptions.probeTimeout = scanOptions.identificationTimeout;
    }
    if (vm.count("retries")) {
        const auto retries = vm["retries"].as<unsigned>();
        scanOptions.connectivityRetries = device::clampRetries(retries);
        if (scanOptions.connectivityRetries != retries) {
            logWarning("[minerscan] --retries capped at ", device::kMaxConnectivityRetries, "\n");
        }
    }
    if (vm.count("no-port-check")) {
        scanOptions.portCheckEnabled = false;
    }
    net::TimeoutConfig::setDefault(scanOptions.identificationTimeout);

    auto session = core::ScanSession::createDefault(vm["port"].as<unsigned short>());

    if (vm.count("command")) {
        if (!vm.count("start")) {
            std::cerr << "Error: --command needs the miner address\n";
            return kExitUsage;
        }
        auto address = scan::parseAddress(vm["start"].as<std::string>());
        if (!address) {
            std::cerr << "Error: " << address.error().message() << "\n";
            return kExitUsage;
        }
        return runCommand(*session, vm["command"].as<std::string>(), *address, scanOptions);
    }

    std::vector<scan::AddressRange> ranges;
    if (vm.count("all-ranges")) {
        ranges = settings.savedAddressRanges();
        if (ranges.empty()) {
            std::cerr << "Error: no saved ranges in " << configPath.string() << "\n";
            return kExitUsage;
        }
    } else {
        expected<scan::AddressRange> range = unexpected(RangeError::InvalidRange);
        if (vm.count("range")) {
            const auto name = vm["range"].as<std::string>();
            const auto* saved = settings.findSavedRange(name);
            if (!saved) {
                std::cerr << "Error: no saved range named '" << name << "' in " << configPath.string() << "\n";
                return kExitUsage;
            }
            range = scan::AddressRange::parse(saved->range);
        } else if (vm.count("start") && vm.count("end")) {
            range = scan::AddressRange::parse(vm["start"].as<std::string>(), vm["end"].as<std::string>());
        } else if (vm.count("start")) {
            range = scan::AddressRange::parse(vm["start"].as<std::string>());
        } else {
            printUsage(argv[0], options);
            return kExitUsage;
        }
        if (!range) {
            std::cerr << "Error: " << range.error().message() << "\n";
            return kExitUsage;
        }
        ranges.push_back(*range);

        if (vm.count("save-range")) {
            auto added = settings.addSavedRange(vm["save-range"].as<std::string>(), range->toString());
            if (!added) {
                logWarning("[minerscan] range not saved: ", added.error().message(), "\n");
            } else if (auto saved = config::saveConfig(settings, configPath); !saved) {
                logWarning("[minerscan] cannot save ", configPath.string(), ": ", saved.error().message(), "\n");
            }
        }
    }

    std::optional<std::chrono::seconds> duration;
    if (vm.count("duration")) {
        duration = std::chrono::seconds(vm["duration"].as<unsigned>());
    }
    std::optional<std::chrono::seconds> autoScan;
    if (vm.count("auto-scan")) {
        const auto secs = vm["auto-scan"].as<unsigned>();
        autoScan = secs == 0 ? settings.autoScanInterval()
                             : std::max(std::chrono::seconds(secs), config::kMinAutoScanInterval);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const auto started = std::chrono::steady_clock::now();
    std::vector<device::DeviceRecord> found;
    while (true) {
        const auto passStarted = std::chrono::steady_clock::now();
        bool headerPrinted = false;
        for (const auto& range : ranges) {
            const auto progress = runSweep(*session, range, scanOptions, headerPrinted);
            if (progress.state == scan::SweepState::Cancelled) {
                return kExitCancelled;
            }
        }
        found = session->registry().list();
        if (ranges.size() > 1) {
            std::cout << "Scanned " << ranges.size() << " ranges, " << found.size() << " miner(s) known\n";
        }

        if (vm.count("export")) {
            std::filesystem::path target = vm["export"].as<std::string>();
            if (target.empty()) {
                target = record::fleetExportFileName(device::Clock::now());
            }
            if (auto written = record::exportFleet(found, target); written) {
                std::cout << "Exported " << *written << " miner(s) to " << target.string() << "\n";
            } else {
                logError("[minerscan] export to ", target.string(), " failed: ", written.error().message(), "\n");
            }
        }

        if (!autoScan) {
            break;
        }
        const auto next = passStarted + *autoScan;
        if (duration && next - started >= *duration) {
            break;
        }
        std::cout << "Next scan in " << std::chrono::duration_cast<std::chrono::seconds>(
                         next - std::chrono::steady_clock::now()).count() << " s, Ctrl-C to stop\n";
        if (!sleepInterruptibly(next - std::chrono::steady_clock::now())) {
            return kExitOk;
        }
    }

    if (vm.count("watch") && !interrupted) {
        const auto requested = vm["watch"].as<unsigned>();
        const auto interval = std::chrono::duration_cast<std::chrono::seconds>(
            requested == 0 ? settings.detailRefreshInterval()
                           : poll::clampPollInterval(std::chrono::seconds(requested)));
        std::optional<std::string> recordDir;
        if (vm.count("record")) {
            recordDir = vm["record"].as<std::string>();
        }
        return watch(*session, found, interval, duration, recordDir);
    }
    return kExitOk;
}
