#include "pagewright/browser/chrome_launcher.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <boost/asio.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace pagewright::browser {

namespace fs = std::filesystem;
namespace net = boost::asio;

namespace {

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

/// Plain HTTP/1.1 request against the DevTools endpoint; returns the body.
auto devtools_request(int port, std::string_view method, std::string_view target)
    -> Result<std::string> {
    try {
        net::io_context ioc;
        net::ip::tcp::socket sock(ioc);
        net::ip::tcp::resolver resolver(ioc);
        net::connect(sock, resolver.resolve("127.0.0.1", std::to_string(port)));

        std::string request = std::string(method) + " " + std::string(target) +
                              " HTTP/1.1\r\n"
                              "Host: 127.0.0.1:" + std::to_string(port) + "\r\n"
                              "Connection: close\r\n\r\n";
        net::write(sock, net::buffer(request));

        std::string response;
        boost::system::error_code ec;
        char buf[4096];
        while (auto n = sock.read_some(net::buffer(buf), ec)) {
            response.append(buf, n);
        }

        auto body_pos = response.find("\r\n\r\n");
        if (body_pos == std::string::npos) {
            return std::unexpected(make_error(ErrorCode::ProtocolError,
                                              "Malformed DevTools HTTP response"));
        }
        return response.substr(body_pos + 4);
    } catch (const boost::system::system_error& e) {
        return std::unexpected(make_error(ErrorCode::ConnectionFailed,
                                          "DevTools endpoint unreachable", e.what()));
    }
}

auto reap(pid_t pid, std::chrono::milliseconds grace) -> bool {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        auto r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            return true;
        }
        sleep_ms(50);
    }
    return false;
}

} // anonymous namespace

auto find_chrome(const std::optional<std::string>& configured) -> std::string {
    if (configured && !configured->empty()) {
        if (fs::exists(*configured)) {
            return *configured;
        }
        LOG_WARN("Configured chrome_path does not exist: {}", *configured);
    }

    static const std::vector<std::string> paths = {
#if defined(__APPLE__)
        "/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
        "/Applications/Chromium.app/Contents/MacOS/Chromium",
#else
        "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable",
        "/usr/bin/chromium",
        "/usr/bin/chromium-browser",
        "/snap/bin/chromium",
#endif
    };

    for (const auto& p : paths) {
        if (fs::exists(p)) {
            return p;
        }
    }

    if (const auto* path_env = std::getenv("PATH")) {
        const std::vector<const char*> names = {"google-chrome", "chromium", "chromium-browser"};
        for (const auto& dir : utils::split(path_env, ':')) {
            for (const auto* name : names) {
                auto full = fs::path(dir) / name;
                if (fs::exists(full)) {
                    return full.string();
                }
            }
        }
    }

    return {};
}

auto build_chrome_args(const LaunchOptions& options, const fs::path& user_data_dir)
    -> std::vector<std::string> {
    std::vector<std::string> args = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-extensions",
        "--disable-background-networking",
        "--disable-sync",
        "--disable-translate",
        "--mute-audio",
        "--remote-debugging-port=" + std::to_string(options.debug_port),
        "--user-data-dir=" + user_data_dir.string(),
        "--window-size=" + std::to_string(options.viewport_width) + "," +
            std::to_string(options.viewport_height),
    };
    if (options.headless) {
        args.emplace_back("--headless=new");
        args.emplace_back("--disable-gpu");
    }
    for (const auto& extra : options.extra_args) {
        args.push_back(extra);
    }
    args.emplace_back("about:blank");
    return args;
}

auto select_page_target(const json& targets) -> std::optional<std::string> {
    if (!targets.is_array()) {
        return std::nullopt;
    }
    for (const auto& t : targets) {
        if (t.value("type", "") == "page" && t.contains("webSocketDebuggerUrl")) {
            return t["webSocketDebuggerUrl"].get<std::string>();
        }
    }
    return std::nullopt;
}

auto launch_chrome(const LaunchOptions& options) -> Result<ChromeProcess> {
    auto chrome_path = find_chrome(options.chrome_path);
    if (chrome_path.empty()) {
        return std::unexpected(make_error(ErrorCode::BrowserError, "Chrome/Chromium not found",
                                          "Set browser.chrome_path in config"));
    }

    ChromeProcess process;
    process.debug_port = options.debug_port;
    process.user_data_dir = fs::temp_directory_path() / ("pagewright-chrome-" + utils::generate_id(12));

    std::error_code fs_ec;
    fs::create_directories(process.user_data_dir, fs_ec);
    if (fs_ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to create Chrome profile directory",
                                          fs_ec.message()));
    }

    auto args = build_chrome_args(options, process.user_data_dir);
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(chrome_path.data());
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        fs::remove_all(process.user_data_dir, fs_ec);
        return std::unexpected(make_error(ErrorCode::BrowserError, "Failed to fork Chrome process",
                                          std::strerror(errno)));
    }
    if (pid == 0) {
        ::execv(chrome_path.c_str(), argv.data());
        ::_exit(127);
    }
    process.pid = pid;
    LOG_DEBUG("Chrome launched (pid={}, port={}, headless={})", pid, options.debug_port,
              options.headless);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options.launch_timeout_ms);
    Error last_error = make_error(ErrorCode::Timeout, "Chrome did not expose a page target",
                                  "port=" + std::to_string(options.debug_port));

    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            process.pid = -1;
            terminate_chrome(process);
            return std::unexpected(make_error(
                ErrorCode::BrowserError, "Chrome exited during start-up",
                "status=" + std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1)));
        }

        auto body = devtools_request(options.debug_port, "GET", "/json/list");
        if (body) {
            try {
                if (auto ws = select_page_target(json::parse(*body))) {
                    process.page_ws_url = std::move(*ws);
                    LOG_INFO("Chrome ready on port {}", options.debug_port);
                    return process;
                }
                // No page yet; ask for one.
                (void)devtools_request(options.debug_port, "PUT", "/json/new?about:blank");
            } catch (const json::exception& e) {
                last_error = make_error(ErrorCode::ProtocolError,
                                        "Invalid /json/list response", e.what());
            }
        } else {
            last_error = body.error();
        }
        sleep_ms(200);
    }

    terminate_chrome(process);
    return std::unexpected(last_error);
}

void terminate_chrome(ChromeProcess& process) {
    if (process.pid > 0) {
        ::kill(process.pid, SIGTERM);
        if (!reap(process.pid, std::chrono::seconds(3))) {
            LOG_WARN("Chrome (pid={}) ignored SIGTERM, killing", process.pid);
            ::kill(process.pid, SIGKILL);
            int status = 0;
            ::waitpid(process.pid, &status, 0);
        }
        LOG_DEBUG("Chrome (pid={}) stopped", process.pid);
        process.pid = -1;
    }

    if (!process.user_data_dir.empty()) {
        std::error_code ec;
        fs::remove_all(process.user_data_dir, ec);
        if (ec) {
            LOG_WARN("Failed to remove Chrome profile {}: {}", process.user_data_dir.string(),
                     ec.message());
        }
        process.user_data_dir.clear();
    }
}

} // namespace pagewright::browser
