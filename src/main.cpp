#include "fileio/logging.hpp"
#include "protocol/file_io.hpp"
#include "protocol/errors.hpp"
#include "link/sbp_link.hpp"
#include "link/serial_transport.hpp"
#include "link/tcp_transport.hpp"
#include "util/hexdump.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

#include <pthread.h>
#include <signal.h>

using namespace fileio;

// Set once SIGINT/SIGTERM has closed the link
static std::atomic<bool> g_interrupted{false};

enum class Command { NONE, WRITE, READ, LIST, DELETE };

struct Options {
    Command command = Command::NONE;
    std::string path;
    std::string port = link::SerialConfig{}.port;
    int baud = link::SerialConfig{}.baud_rate;
    bool tcp = false;
    bool hex = false;
    bool verbose = false;
};

void printUsage(const char* prog) {
    std::cerr << "fileio - file access on a remote device over SBP\n\n";
    std::cerr << "Usage: " << prog << " [options] [command]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  -w, --write <file>   Write a local file to the device (same name)\n";
    std::cerr << "  -r, --read <file>    Read a file from the device to stdout\n";
    std::cerr << "  -l, --list <dir>     List a directory\n";
    std::cerr << "  -d, --delete <file>  Delete a file\n";
    std::cerr << "  (none)               List the root directory\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -p, --port <port>    Serial port, or host:port with --tcp (default: "
              << link::SerialConfig{}.port << ")\n";
    std::cerr << "  -b, --baud <rate>    Baud rate (default: " << link::SerialConfig{}.baud_rate << ")\n";
    std::cerr << "      --tcp            Connect over TCP instead of a serial port\n";
    std::cerr << "  -x, --hex            Print read data as a hex dump\n";
    std::cerr << "  -v, --verbose        Print debugging information\n";
    std::cerr << "  -h, --help           Show this help\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " -p /dev/ttyUSB0 -l /persistent\n";
    std::cerr << "  " << prog << " --tcp -p 192.168.0.222:55555 -r config.ini -x\n";
}

static bool isOpt(const char* arg, const char* short_name, const char* long_name) {
    return strcmp(arg, short_name) == 0 || strcmp(arg, long_name) == 0;
}

// Returns false (after printing why) on bad arguments
bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = (i + 1 < argc);

        Command cmd = Command::NONE;
        if (isOpt(arg, "-w", "--write")) cmd = Command::WRITE;
        else if (isOpt(arg, "-r", "--read")) cmd = Command::READ;
        else if (isOpt(arg, "-l", "--list")) cmd = Command::LIST;
        else if (isOpt(arg, "-d", "--delete")) cmd = Command::DELETE;

        if (cmd != Command::NONE) {
            if (!has_value) {
                std::cerr << "Missing argument for " << arg << "\n";
                return false;
            }
            if (opts.command != Command::NONE) {
                std::cerr << "Only one command may be given\n";
                return false;
            }
            opts.command = cmd;
            opts.path = argv[++i];
        } else if (isOpt(arg, "-p", "--port")) {
            if (!has_value) {
                std::cerr << "Missing argument for " << arg << "\n";
                return false;
            }
            opts.port = argv[++i];
        } else if (isOpt(arg, "-b", "--baud")) {
            if (!has_value) {
                std::cerr << "Missing argument for " << arg << "\n";
                return false;
            }
            opts.baud = atoi(argv[++i]);
            if (opts.baud <= 0) {
                std::cerr << "Invalid baud rate: " << argv[i] << "\n";
                return false;
            }
        } else if (strcmp(arg, "--tcp") == 0) {
            opts.tcp = true;
        } else if (isOpt(arg, "-x", "--hex")) {
            opts.hex = true;
        } else if (isOpt(arg, "-v", "--verbose")) {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

static void printListing(const std::vector<std::string>& files) {
    for (const auto& f : files) {
        std::cout << f << "\n";
    }
}

int runCommand(const Options& opts, link::ILink& link) {
    protocol::FileIO f(link);

    switch (opts.command) {
        case Command::WRITE: {
            std::ifstream in(opts.path, std::ios::binary);
            if (!in.good()) {
                std::cerr << "error: cannot open local file '" << opts.path << "'\n";
                return 1;
            }
            Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

            f.write(opts.path, data, 0, true, [&](size_t scheduled) {
                if (opts.verbose) {
                    std::cerr << "\rSent " << scheduled << "/" << data.size() << " bytes" << std::flush;
                }
            });
            if (opts.verbose) {
                std::cerr << "\n";
            }
            break;
        }

        case Command::READ: {
            Bytes data = f.read(opts.path);
            if (opts.hex) {
                std::cout << util::hexdump(data);
            } else {
                std::cout.write(reinterpret_cast<const char*>(data.data()),
                                static_cast<std::streamsize>(data.size()));
                std::cout << "\n";
            }
            break;
        }

        case Command::DELETE:
            f.remove(opts.path);
            break;

        case Command::LIST:
            printListing(f.readdir(opts.path));
            break;

        case Command::NONE:
            std::cout << "No command given, listing root directory:\n";
            printListing(f.readdir());
            break;
    }

    std::cout << std::flush;
    return 0;
}

// Waits for SIGINT/SIGTERM on its own thread and closes the link, which
// unblocks whatever operation the main thread is in.
class InterruptWatcher {
public:
    InterruptWatcher(const sigset_t& signals, link::ILink& link)
        : signals_(signals)
        , link_(link)
        , thread_([this] { run(); })
    {
    }

    ~InterruptWatcher() {
        finished_ = true;
        thread_.join();
    }

private:
    sigset_t signals_;
    link::ILink& link_;
    std::atomic<bool> finished_{false};
    std::thread thread_;

    void run() {
        timespec poll_interval{0, 200 * 1000 * 1000};
        while (!finished_) {
            int sig = sigtimedwait(&signals_, nullptr, &poll_interval);
            if (sig > 0) {
                LOG_INFO("MAIN", "Interrupted (signal %d), closing link", sig);
                g_interrupted = true;
                link_.close();
                return;
            }
        }
    }
};

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (isOpt(argv[i], "-h", "--help")) {
            printUsage(argv[0]);
            return 0;
        }
    }

    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    if (opts.verbose) {
        setLogLevel(LogLevel::DEBUG);
    }

    // Every thread started from here on inherits the blocked set;
    // InterruptWatcher picks the signals up synchronously.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::unique_ptr<link::ITransport> transport;
    if (opts.tcp) {
        auto config = link::TcpConfig::parse(opts.port);
        if (!config) {
            std::cerr << "error: Invalid host and/or port: " << opts.port << "\n";
            return 1;
        }
        transport = std::make_unique<link::TcpTransport>(*config);
    } else {
        link::SerialConfig config;
        config.port = opts.port;
        config.baud_rate = opts.baud;
        transport = std::make_unique<link::SerialTransport>(config);
    }

    if (!transport->open()) {
        std::cerr << "error: cannot open " << transport->describe() << "\n";
        return 1;
    }

    try {
        link::SbpLink link(std::move(transport));
        InterruptWatcher watcher(signals, link);
        return runCommand(opts, link);
    } catch (const std::exception& e) {
        if (g_interrupted) {
            return 0;
        }
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
