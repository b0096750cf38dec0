#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/process_sandbox.hpp"
#include "server/competition.hpp"
#include "server/competition_server.hpp"
#include "worker.hpp"
using namespace std;

// 读取请求的线程可能一直阻塞在 getline 上直到进程退出，因此它用到的对象都必须是全局的
arbiter::request_queue request_queue;
atomic<bool> input_finished{false};
ifstream submissions_file;
mutex output_mutex;

static void write_response(const nlohmann::json& response) {
    scoped_lock lock(output_mutex);
    cout << response.dump() << endl;
}

const arbiter::response_handler respond = write_response;

/**
 * @brief 按行读取 JSON 请求放入请求队列
 * 空行被忽略，无法解析的行返回错误信息但不会停止读取。
 */
static void read_requests(istream& in) {
    string line;
    while (!request_queue.is_closed() && getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        try {
            if (!request_queue.push(nlohmann::json::parse(line))) break;
        } catch (nlohmann::json::exception& e) {
            LOG(WARNING) << "Ignoring malformed request line: " << e.what();
            respond({{"error", string("malformed request: ") + e.what()}});
        }
    }
    request_queue.close();
    input_finished = true;
}

/**
 * @brief 等待 SIGINT 或 SIGTERM，直到 finished 被设置
 * @return 是否收到了信号
 */
static bool wait_for_signal(const sigset_t& signals, const atomic<bool>& finished) {
    const timespec interval = {0, 100 * 1000 * 1000};  // 100ms
    while (!finished) {
        int sig = sigtimedwait(&signals, nullptr, &interval);
        if (sig == SIGINT || sig == SIGTERM) {
            LOG(WARNING) << "Received " << strsignal(sig) << ", stopping workers";
            return true;
        }
    }
    return false;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>()->required(), "competition configuration file (JSON)")
        ("workers", po::value<unsigned>(), "number of submissions judged concurrently, default to the number of CPU cores")
        ("scratch-dir", po::value<string>(), "set the directory to compile and run submissions in. You can either pass it from environ SCRATCHDIR")
        ("history", po::value<string>(), "append submission history to this JSON lines file, history is kept in memory if omitted. You can either pass it from environ HISTORYFILE")
        ("submissions", po::value<string>(), "read requests as JSON lines from this file instead of stdin")
        ("debug", "turn on the debug mode to keep scratch directories for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "arbiter: judge competition submissions in a sandbox" << endl
                 << "Usage: " << argv[0] << " --config <competition.json> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "arbiter 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        arbiter::DEBUG = true;
    }

    if (vm.count("scratch-dir")) {
        arbiter::SCRATCH_DIR = filesystem::path(vm.at("scratch-dir").as<string>());
    } else if (getenv("SCRATCHDIR")) {
        arbiter::SCRATCH_DIR = filesystem::path(getenv("SCRATCHDIR"));
    }
    {
        error_code ec;
        filesystem::create_directories(arbiter::SCRATCH_DIR, ec);
        CHECK(filesystem::is_directory(arbiter::SCRATCH_DIR))
            << "Scratch directory " << arbiter::SCRATCH_DIR << " does not exist and cannot be created: " << ec.message();
    }

    if (vm.count("history")) {
        arbiter::HISTORY_FILE = filesystem::path(vm.at("history").as<string>());
    } else if (getenv("HISTORYFILE")) {
        arbiter::HISTORY_FILE = filesystem::path(getenv("HISTORYFILE"));
    }

    unsigned workers = max(thread::hardware_concurrency(), 1u);
    if (vm.count("workers")) workers = vm.at("workers").as<unsigned>();
    CHECK(workers > 0) << "At least one worker is required";

    arbiter::server::competition_config config;
    try {
        config = arbiter::server::load_competition(vm.at("config").as<string>());
    } catch (arbiter::configuration_error& e) {
        LOG(ERROR) << "Unable to load competition configuration: " << e.what();
        return EXIT_FAILURE;
    }

    auto executor = make_unique<arbiter::sandbox::process_sandbox>(config.sandbox.strict, config.sandbox.cgroup);
    auto& support = executor->support();
    bool missing_network = config.sandbox.restrict_network && !support.network_supported();
    bool missing_filesystem = config.sandbox.restrict_filesystem && !support.filesystem_supported();
    if (missing_network || missing_filesystem) {
        if (config.sandbox.strict) {
            LOG(ERROR) << "Strict sandbox requested but " << (missing_network ? "network" : "filesystem")
                       << " isolation is unavailable on this host";
            return EXIT_FAILURE;
        }
        LOG(WARNING) << "Submissions will run without "
                     << (missing_network && missing_filesystem ? "network and filesystem" : missing_network ? "network" : "filesystem")
                     << " isolation";
    }

    unique_ptr<arbiter::server::submission_store> store;
    try {
        if (arbiter::HISTORY_FILE.empty())
            store = make_unique<arbiter::server::memory_submission_store>();
        else
            store = make_unique<arbiter::server::jsonl_submission_store>(arbiter::HISTORY_FILE);
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to open submission history " << arbiter::HISTORY_FILE << ": " << e.what() << endl
                   << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    if (vm.count("submissions")) {
        submissions_file.open(vm.at("submissions").as<string>());
        CHECK(submissions_file) << "Unable to open " << vm.at("submissions").as<string>();
    }
    istream& input = vm.count("submissions") ? submissions_file : cin;

    // 必须在创建任何线程之前屏蔽信号，这样信号只会被 watcher 线程的 sigtimedwait 接收
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    arbiter::server::competition_server server(move(config), move(executor), move(store), arbiter::SCRATCH_DIR,
                                               arbiter::DEBUG);
    server.start();

    vector<thread> worker_threads;
    for (unsigned i = 0; i < workers; ++i)
        worker_threads.push_back(arbiter::start_worker(i, server, request_queue, respond));
    LOG(INFO) << "Started " << workers << " workers";

    atomic<bool> workers_finished{false};
    thread watcher([&] {
        if (wait_for_signal(signals, workers_finished)) {
            server.shutdown();
            request_queue.close();
        }
    });

    thread reader(read_requests, ref(input));

    // 输入结束或者收到信号后队列被关闭，worker 处理完剩余请求后退出
    for (auto& worker : worker_threads)
        worker.join();
    workers_finished = true;
    watcher.join();

    // 收到信号时读取线程可能阻塞在终端输入上，不等待它结束
    if (input_finished)
        reader.join();
    else
        reader.detach();
    server.stop();

    LOG(INFO) << "Stopped";
    return EXIT_SUCCESS;
}
